#pragma once

#include "probe.hpp"
#include "sdeventplus.hpp"

#include <sdeventplus/event.hpp>

#include <random>

namespace anybody::home::presence
{

/**
 * @class SimProbe
 * @brief A stand-in probe for running without network access.
 *
 * Used with --test.  After a short random delay the device answers
 * one time in four, so verdicts move around enough to watch the
 * debouncing at work.
 */
class SimProbe : public Probe
{
  public:
    SimProbe() = delete;
    SimProbe(const SimProbe&) = delete;
    SimProbe& operator=(const SimProbe&) = delete;
    SimProbe(SimProbe&&) = delete;
    SimProbe& operator=(SimProbe&&) = delete;
    ~SimProbe() override = default;

    /**
     * @brief Constructor
     *
     * @param[in] device - The device to pretend to probe
     * @param[in] event - The event loop to run on
     */
    SimProbe(const Device& device, const sdeventplus::Event& event);

  protected:
    void begin() override;
    void disarm() override;
    void release() override;

  private:
    void answer();

    util::Timer _timer;

    std::mt19937 _generator;
};

} // namespace anybody::home::presence
