#pragma once

#include "device.hpp"
#include "persistence.hpp"

#include <sdbusplus/bus.hpp>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace anybody::home::presence
{

/**
 * @class InventoryStore
 *
 * Publishes verdict changes to the inventory manager, as the Present
 * and PrettyName properties of an xyz.openbmc_project.Inventory.Item
 * object per device.  The object path is the configured prefix plus
 * the device name, relative to the inventory root.
 *
 * Roll calls aren't published; the inventory only holds live state.
 */
class InventoryStore : public PersistenceBase
{
  public:
    static constexpr auto inventoryPath = "/xyz/openbmc_project/inventory";
    static constexpr auto inventoryManagerIface =
        "xyz.openbmc_project.Inventory.Manager";
    static constexpr auto itemIface = "xyz.openbmc_project.Inventory.Item";

    InventoryStore() = delete;
    ~InventoryStore() override = default;
    InventoryStore(const InventoryStore&) = delete;
    InventoryStore& operator=(const InventoryStore&) = delete;
    InventoryStore(InventoryStore&&) = delete;
    InventoryStore& operator=(InventoryStore&&) = delete;

    /**
     * @brief Constructor
     *
     * @param[in] bus - The D-Bus connection
     * @param[in] devices - The configured devices
     * @param[in] pathPrefix - The object path prefix, e.g. /household
     * @param[in] timeout - The bound on each D-Bus call
     */
    InventoryStore(sdbusplus::bus_t& bus, const std::vector<Device>& devices,
                   const std::string& pathPrefix,
                   std::chrono::milliseconds timeout);

    void writeVerdict(const Verdict& verdict,
                      Clock::time_point timestamp) override;

    void writeRollCall(const RollCall&) override {}

    std::string name() const override
    {
        return "inventory";
    }

    /**
     * @brief The inventory relative object path of a device
     */
    std::string objectPath(const std::string& device) const;

  private:
    sdbusplus::bus_t& _bus;

    /* Device name to pretty name */
    std::map<std::string, std::string> _prettyNames;

    const std::string _pathPrefix;

    const std::chrono::milliseconds _timeout;
};

} // namespace anybody::home::presence
