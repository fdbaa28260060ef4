#pragma once

#include "device.hpp"
#include "persistence.hpp"
#include "poll_scheduler.hpp"
#include "probe.hpp"

#include <nlohmann/json.hpp>
#include <sdeventplus/event.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace anybody::home::presence
{

using json = nlohmann::json;

constexpr auto confFileName = "config.json";
constexpr auto confAppName = "anybody-home";

/**
 * @brief The file store parameters
 */
struct StoreParams
{
    bool enabled = true;
    std::filesystem::path path;
    size_t historySize = 1440;
};

/**
 * @brief The inventory publication parameters
 */
struct InventoryParams
{
    bool enabled = false;
    std::string pathPrefix = "/household";
    std::chrono::milliseconds timeout{2000};
};

/**
 * @brief Everything read from the configuration file.
 *
 * Loaded once at startup and never changed.  The probes refer to
 * the devices in it, so it must outlive them.
 */
struct Config
{
    PollingParams polling;
    ProbeParams probe;
    std::vector<Device> devices;
    StoreParams store;
    InventoryParams inventory;
};

/**
 * @brief Get the polling parameters from the 'polling' section
 *
 * @param[in] jsonConf - The whole configuration
 *
 * @return The parameters, with defaults for anything not given
 */
PollingParams getPollingParams(const json& jsonConf);

/**
 * @brief Get probe parameters from a 'probe' object
 *
 * @param[in] probe - The probe object
 * @param[in] defaults - What applies where the object is silent
 * @param[in] context - Where the object is, for error messages
 *
 * @return The probe parameters
 */
ProbeParams getProbeParams(const json& probe, const ProbeParams& defaults,
                           const std::string& context);

/**
 * @brief Get the devices from the 'devices' array
 *
 * Every address is resolved here, so a device that can't be probed
 * stops the service from starting.
 *
 * @param[in] jsonConf - The whole configuration
 * @param[in] defaults - The default probe parameters
 *
 * @return The devices, in configuration order
 */
std::vector<Device> getDevices(const json& jsonConf,
                               const ProbeParams& defaults);

StoreParams getStoreParams(const json& jsonConf);

InventoryParams getInventoryParams(const json& jsonConf);

/**
 * @brief Parse and validate the whole configuration
 *
 * Throws std::runtime_error on anything invalid, after logging
 * what it was.
 *
 * @param[in] jsonConf - The parsed configuration file
 *
 * @return The configuration
 */
Config getConfig(const json& jsonConf);

/**
 * @brief Create the probe for every device
 *
 * @param[in] config - The configuration
 * @param[in] event - The event loop the probes run on
 * @param[in] simulate - Use simulated probes instead of the network
 *
 * @return One probe per device, in configuration order
 */
std::vector<std::unique_ptr<Probe>> getProbes(const Config& config,
                                              const sdeventplus::Event& event,
                                              bool simulate);

/**
 * @brief Create the enabled persistence adapters
 *
 * @param[in] config - The configuration
 *
 * @return The adapters
 */
std::vector<std::shared_ptr<PersistenceBase>> getStores(const Config& config);

} // namespace anybody::home::presence
