#pragma once

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anybody::home::presence
{

/**
 * @class PresenceTable
 *
 * The latest verdict for every configured device.
 *
 * The set of devices is fixed at construction, so the table always
 * holds exactly one entry per device.  The poll scheduler is the
 * only writer.  Readers on any thread get copies made under the
 * lock, so they never see a partially written verdict, and getAll()
 * returns the whole table as it was at one instant.
 *
 * One instance is created in main() and handed by reference to the
 * scheduler and to anything that reports presence.
 */
class PresenceTable
{
  public:
    PresenceTable() = delete;
    ~PresenceTable() = default;
    PresenceTable(const PresenceTable&) = delete;
    PresenceTable& operator=(const PresenceTable&) = delete;
    PresenceTable(PresenceTable&&) = delete;
    PresenceTable& operator=(PresenceTable&&) = delete;

    /**
     * @brief Constructor
     *
     * Every device starts out in the unknown state.  Throws
     * std::invalid_argument on a duplicate or empty name.
     *
     * @param[in] devices - The configured device names
     */
    explicit PresenceTable(const std::vector<std::string>& devices);

    /**
     * @brief Returns a device's verdict, or nothing if the device
     *        isn't configured.
     */
    std::optional<Verdict> get(const std::string& device) const;

    /**
     * @brief Returns a consistent snapshot of every verdict.
     */
    std::map<std::string, Verdict> getAll() const;

    /**
     * @brief Replaces a device's verdict.
     *
     * Throws std::out_of_range if the device isn't configured, since
     * devices are never added after construction.
     *
     * @param[in] device - The device name
     * @param[in] verdict - The new verdict
     */
    void set(const std::string& device, const Verdict& verdict);

    /**
     * @brief Says if any device is present.
     */
    bool anyPresent() const;

    size_t size() const;

    /**
     * @brief Takes a roll call from a consistent snapshot.
     *
     * @param[in] timestamp - The time to stamp it with
     */
    RollCall rollCall(Clock::time_point timestamp) const;

    /**
     * @brief Returns the device to presence mapping,
     *        e.g. {"freds_mobile": true, "petes_mobile": false}
     */
    nlohmann::json toJson() const;

    /**
     * @brief Returns every verdict with its state and timestamps,
     *        for the debug dump.
     */
    nlohmann::json dump() const;

  private:
    mutable std::mutex _mutex;

    std::map<std::string, Verdict> _verdicts;
};

} // namespace anybody::home::presence
