#pragma once

#include "../probe.hpp"
#include "sdeventplus.hpp"

#include <sdeventplus/event.hpp>

#include <algorithm>
#include <chrono>
#include <functional>

namespace anybody::home::presence
{

/**
 * @brief Counts shared by all the fake probes in a test.
 */
struct ProbeCounters
{
    size_t started = 0;
    size_t inFlight = 0;
    size_t maxInFlight = 0;
};

/**
 * @class FakeProbe
 *
 * A probe whose outcome is scripted per call and that completes
 * after a fixed delay on the event loop, or from within start()
 * when the delay is negative.
 */
class FakeProbe : public Probe
{
  public:
    using Outcome = std::function<bool(size_t call)>;

    FakeProbe(const Device& device, const sdeventplus::Event& event,
              Outcome outcome, std::chrono::milliseconds delay,
              ProbeCounters& counters) :
        Probe(device), _timer(event, std::bind(&FakeProbe::finish, this)),
        _outcome(std::move(outcome)), _delay(delay), _counters(counters)
    {}

    ~FakeProbe() override
    {
        release();
    }

    size_t calls() const
    {
        return _calls;
    }

  protected:
    void begin() override
    {
        _calls++;
        _active = true;
        _counters.started++;
        _counters.inFlight++;
        _counters.maxInFlight =
            std::max(_counters.maxInFlight, _counters.inFlight);

        if (_delay < std::chrono::milliseconds{0})
        {
            finish();
            return;
        }

        _timer.restartOnce(util::toTimerDuration(_delay));
    }

    void disarm() override
    {
        if (_timer.isEnabled())
        {
            _timer.setEnabled(false);
        }
    }

    void release() override
    {
        disarm();
        if (_active)
        {
            _active = false;
            _counters.inFlight--;
        }
    }

  private:
    void finish()
    {
        _active = false;
        _counters.inFlight--;
        complete(_outcome(_calls - 1));
    }

    util::Timer _timer;

    Outcome _outcome;

    std::chrono::milliseconds _delay;

    ProbeCounters& _counters;

    size_t _calls = 0;

    bool _active = false;
};

} // namespace anybody::home::presence
