#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace anybody::home::presence
{

using Clock = std::chrono::system_clock;

/**
 * @brief Converts a wall clock time to microseconds since the epoch,
 *        the form timestamps take in the store and the debug dump.
 */
inline uint64_t toEpochUs(Clock::time_point tp)
{
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  tp.time_since_epoch())
                  .count();
    return us < 0 ? 0 : static_cast<uint64_t>(us);
}

inline Clock::time_point fromEpochUs(uint64_t us)
{
    return Clock::time_point{std::chrono::duration_cast<Clock::duration>(
        std::chrono::microseconds{us})};
}

/**
 * @brief The outcome of a single reachability check.
 *
 * An unreachable device is a normal result: reachable is false and
 * error is empty.  error is only set when the check could not be
 * made at all, e.g. the socket could not be opened.
 */
struct ProbeResult
{
    std::string device;
    bool reachable = false;
    Clock::time_point timestamp;
    std::optional<std::chrono::microseconds> latency;
    std::optional<std::string> error;
};

enum class State
{
    unknown,
    present,
    absent
};

inline std::string toString(State state)
{
    switch (state)
    {
        case State::present:
            return "present";
        case State::absent:
            return "absent";
        case State::unknown:
            break;
    }
    return "unknown";
}

/**
 * @brief The debounced presence determination for one device.
 */
struct Verdict
{
    std::string device;
    State state = State::unknown;

    /* When state last changed, epoch if it never has */
    Clock::time_point lastChange{};

    /* When the last probe result was recorded, epoch if never */
    Clock::time_point lastProbe{};

    bool present() const
    {
        return state == State::present;
    }

    bool operator==(const Verdict&) const = default;
};

/**
 * @brief A snapshot of every device's presence at one time.
 */
struct RollCall
{
    Clock::time_point timestamp;
    std::map<std::string, bool> presence;
    bool anybodyHome = false;
};

} // namespace anybody::home::presence
