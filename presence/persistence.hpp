#pragma once

#include "types.hpp"

#include <string>

namespace anybody::home::presence
{

/**
 * @class PersistenceBase
 *
 * The interface the poll scheduler writes results through.
 *
 * Implementations throw on failure.  The scheduler logs the failure
 * and carries on, so a broken store never stops the polling.  Each
 * write must be bounded in time, since it runs on the event loop.
 *
 * This is required so it can be mocked in testcases.
 */
class PersistenceBase
{
  public:
    PersistenceBase() = default;
    virtual ~PersistenceBase() = default;
    PersistenceBase(const PersistenceBase&) = delete;
    PersistenceBase& operator=(const PersistenceBase&) = delete;
    PersistenceBase(PersistenceBase&&) = delete;
    PersistenceBase& operator=(PersistenceBase&&) = delete;

    /**
     * @brief Writes a device's verdict after its state changed.
     *
     * @param[in] verdict - The device's current verdict
     * @param[in] timestamp - When it was determined
     */
    virtual void writeVerdict(const Verdict& verdict,
                              Clock::time_point timestamp) = 0;

    /**
     * @brief Writes the roll call taken at the end of a poll cycle.
     *
     * @param[in] rollCall - The roll call
     */
    virtual void writeRollCall(const RollCall& rollCall) = 0;

    /**
     * @brief A name for log messages
     */
    virtual std::string name() const = 0;
};

} // namespace anybody::home::presence
