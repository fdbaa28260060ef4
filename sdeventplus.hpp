#pragma once

#include <sdeventplus/clock.hpp>
#include <sdeventplus/event.hpp>
#include <sdeventplus/utility/timer.hpp>

#include <chrono>

namespace anybody::home::util
{

/** @brief The monotonic timer used for poll ticks, deadlines and probes. */
using Timer = sdeventplus::utility::Timer<sdeventplus::ClockId::Monotonic>;

/** @class SDEventPlus
 *  @brief Event access delegate implementation for sdeventplus.
 */
class SDEventPlus
{
  public:
    /**
     * @brief Get the event instance
     */
    static auto& getEvent() __attribute__((pure))
    {
        static auto event = sdeventplus::Event::get_default();
        return event;
    }
};

/**
 * @brief Converts any non-negative duration into the microsecond
 *        resolution the sd-event timers take.
 */
template <typename Rep, typename Period>
inline std::chrono::microseconds
    toTimerDuration(std::chrono::duration<Rep, Period> duration)
{
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(duration);
    return us.count() < 0 ? std::chrono::microseconds{0} : us;
}

} // namespace anybody::home::util
