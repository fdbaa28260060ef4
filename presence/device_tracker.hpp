#pragma once

#include "types.hpp"

#include <deque>
#include <string>

namespace anybody::home::presence
{

/**
 * @class DeviceTracker
 *
 * Turns the stream of probe results for one device into a stable
 * presence verdict.
 *
 * A device is declared present as soon as one probe succeeds, but
 * it takes absentThreshold consecutive failed probes before it is
 * declared absent, so a single dropped ping can't make it flap.  A
 * device starting out in the unknown state also needs that many
 * failures before it is declared absent.
 *
 * Only the most recent historySize outcomes are kept, and the
 * verdict only looks at the trailing run of failures in them.
 *
 * Not thread safe; it is only ever used from the scheduler.
 */
class DeviceTracker
{
  public:
    /**
     * @brief What record() returns.
     */
    struct Update
    {
        Verdict verdict;

        /* If verdict.state differs from before the result */
        bool changed = false;
    };

    DeviceTracker() = delete;
    ~DeviceTracker() = default;
    DeviceTracker(const DeviceTracker&) = default;
    DeviceTracker& operator=(const DeviceTracker&) = default;
    DeviceTracker(DeviceTracker&&) = default;
    DeviceTracker& operator=(DeviceTracker&&) = default;

    /**
     * @brief Constructor
     *
     * @param[in] device - The device name
     * @param[in] absentThreshold - Consecutive failures needed to
     *                              declare the device absent, at least 1
     * @param[in] historySize - The number of outcomes to remember,
     *                          raised to absentThreshold if smaller
     */
    DeviceTracker(const std::string& device, size_t absentThreshold,
                  size_t historySize);

    /**
     * @brief Records a probe result and re-evaluates the verdict.
     *
     * @param[in] result - The probe result
     *
     * @return The new verdict and if its state changed
     */
    Update record(const ProbeResult& result);

    const Verdict& verdict() const
    {
        return _verdict;
    }

    /**
     * @brief The number of failures since the last success.
     */
    size_t consecutiveFailures() const;

    size_t absentThreshold() const
    {
        return _absentThreshold;
    }

  private:
    size_t _absentThreshold;

    size_t _historySize;

    /* Recent outcomes, oldest first, true for reachable */
    std::deque<bool> _history;

    Verdict _verdict;
};

} // namespace anybody::home::presence
