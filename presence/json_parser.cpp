/**
 * Copyright © 2026 The anybody-home Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "config.h"

#include "json_parser.hpp"

#include "file_store.hpp"
#include "icmp_probe.hpp"
#include "inventory_store.hpp"
#include "sdbusplus.hpp"
#include "sim_probe.hpp"
#include "tcp_probe.hpp"

#include <phosphor-logging/lg2.hpp>

#include <chrono>
#include <format>
#include <limits>
#include <set>
#include <stdexcept>

namespace anybody::home::presence
{

namespace
{

const json emptyObject = json::object();

// Durations end up as microsecond timer values
constexpr uint64_t maxSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::microseconds::max())
        .count();
constexpr uint64_t maxMilliseconds =
    std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::microseconds::max())
        .count();

/**
 * @brief Returns a section of the configuration, or an empty object
 *        if it isn't there.
 */
const json& getSection(const json& parent, const std::string& key,
                       const std::string& context)
{
    if (!parent.contains(key))
    {
        return emptyObject;
    }

    const auto& section = parent.at(key);
    if (!section.is_object())
    {
        lg2::error("The {CONTEXT} '{KEY}' entry must be an object", "CONTEXT",
                   context, "KEY", key);
        throw std::runtime_error(
            std::format("Invalid {} '{}' entry", context, key));
    }
    return section;
}

/**
 * @brief Gets an integer of at least a minimum value.
 */
uint64_t getNumber(const json& section, const std::string& key,
                   uint64_t defaultValue, uint64_t minimum,
                   const std::string& context,
                   uint64_t maximum = std::numeric_limits<int64_t>::max())
{
    if (!section.contains(key))
    {
        return defaultValue;
    }

    const auto& value = section.at(key);
    if (!value.is_number_integer() ||
        (value.get<int64_t>() < static_cast<int64_t>(minimum)) ||
        (value.get<uint64_t>() > maximum))
    {
        lg2::error("Invalid {CONTEXT} '{KEY}' value {VALUE}, it must be an "
                   "integer from {MIN} to {MAX}",
                   "CONTEXT", context, "KEY", key, "VALUE", value.dump(),
                   "MIN", minimum, "MAX", maximum);
        throw std::runtime_error(
            std::format("Invalid {} '{}' value", context, key));
    }

    return value.get<uint64_t>();
}

bool getBool(const json& section, const std::string& key, bool defaultValue,
             const std::string& context)
{
    if (!section.contains(key))
    {
        return defaultValue;
    }

    const auto& value = section.at(key);
    if (!value.is_boolean())
    {
        lg2::error("Invalid {CONTEXT} '{KEY}' value {VALUE}, it must be a "
                   "boolean",
                   "CONTEXT", context, "KEY", key, "VALUE", value.dump());
        throw std::runtime_error(
            std::format("Invalid {} '{}' value", context, key));
    }

    return value.get<bool>();
}

std::string getString(const json& section, const std::string& key,
                      const std::string& context)
{
    if (!section.contains(key) || !section.at(key).is_string() ||
        section.at(key).get<std::string>().empty())
    {
        lg2::error("Missing or empty {CONTEXT} '{KEY}' string", "CONTEXT",
                   context, "KEY", key);
        throw std::runtime_error(
            std::format("Missing or empty {} '{}'", context, key));
    }

    return section.at(key).get<std::string>();
}

} // namespace

PollingParams getPollingParams(const json& jsonConf)
{
    using namespace std::chrono;

    const auto& polling = getSection(jsonConf, "polling", "configuration");

    PollingParams params;
    params.interval =
        seconds{getNumber(polling, "interval", 30, 1, "polling", maxSeconds)};
    params.presentInterval = seconds{
        getNumber(polling, "present_interval",
                  duration_cast<seconds>(params.interval).count(), 1,
                  "polling", maxSeconds)};
    params.cycleTimeout = seconds{
        getNumber(polling, "cycle_timeout", 10, 1, "polling", maxSeconds)};
    params.maxInFlight = getNumber(polling, "max_in_flight", 8, 1, "polling");
    params.absentThreshold =
        getNumber(polling, "absent_threshold", 3, 1, "polling");
    params.historySize = getNumber(polling, "history_size", 8, 1, "polling");

    if (params.cycleTimeout > params.interval)
    {
        lg2::info("The poll cycle timeout {TIMEOUT}ms is longer than the "
                  "{INTERVAL}ms interval, slow cycles will overrun",
                  "TIMEOUT", params.cycleTimeout.count(), "INTERVAL",
                  params.interval.count());
    }

    return params;
}

ProbeParams getProbeParams(const json& probe, const ProbeParams& defaults,
                           const std::string& context)
{
    ProbeParams params = defaults;

    if (probe.contains("type"))
    {
        const auto& type = probe.at("type");
        if (type == "icmp")
        {
            params.type = ProbeType::icmp;
        }
        else if (type == "tcp")
        {
            params.type = ProbeType::tcp;
        }
        else
        {
            lg2::error("Invalid {CONTEXT} probe type {TYPE}", "CONTEXT",
                       context, "TYPE", type.dump());
            throw std::runtime_error(
                std::format("Invalid {} probe type", context));
        }
    }

    params.timeout = std::chrono::milliseconds{
        getNumber(probe, "timeout_ms", params.timeout.count(), 1,
                  context + " probe", maxMilliseconds)};

    if (probe.contains("port"))
    {
        params.port = static_cast<uint16_t>(getNumber(
            probe, "port", 0, 1, context + " probe",
            std::numeric_limits<uint16_t>::max()));
    }

    return params;
}

std::vector<Device> getDevices(const json& jsonConf,
                               const ProbeParams& defaults)
{
    if (!jsonConf.contains("devices") || !jsonConf.at("devices").is_array() ||
        jsonConf.at("devices").empty())
    {
        lg2::error("The configuration needs a non-empty 'devices' array");
        throw std::runtime_error("Missing configured devices");
    }

    std::vector<Device> devices;
    std::set<std::string> names;

    for (const auto& entry : jsonConf.at("devices"))
    {
        if (!entry.is_object())
        {
            lg2::error("Device entry {ENTRY} is not an object", "ENTRY",
                       entry.dump());
            throw std::runtime_error("Invalid device entry");
        }

        Device device;
        device.name = getString(entry, "name", "device");

        if (!names.insert(device.name).second)
        {
            lg2::error("Device {DEVICE} is configured more than once",
                       "DEVICE", device.name);
            throw std::runtime_error(
                std::format("Duplicate device {}", device.name));
        }

        auto context = std::format("device {}", device.name);

        device.prettyName = device.name;
        if (entry.contains("pretty_name"))
        {
            device.prettyName = getString(entry, "pretty_name", context);
        }

        auto address = getString(entry, "address", context);
        try
        {
            device.address = Address::resolve(address);
        }
        catch (const std::exception& e)
        {
            lg2::error("Invalid address for device {DEVICE}: {ERROR}",
                       "DEVICE", device.name, "ERROR", e);
            throw std::runtime_error(std::format(
                "Invalid address for device {}: {}", device.name, e.what()));
        }

        device.probe =
            getProbeParams(getSection(entry, "probe", context), defaults,
                           context);

        if ((device.probe.type == ProbeType::tcp) && !device.probe.port)
        {
            lg2::error("Device {DEVICE} has a tcp probe without a port",
                       "DEVICE", device.name);
            throw std::runtime_error(
                std::format("Missing tcp probe port for {}", device.name));
        }

        devices.push_back(std::move(device));
    }

    return devices;
}

StoreParams getStoreParams(const json& jsonConf)
{
    const auto& persistence =
        getSection(jsonConf, "persistence", "configuration");
    const auto& store = getSection(persistence, "store", "persistence");

    StoreParams params;
    params.enabled = getBool(store, "enabled", true, "store");
    params.path = ANYBODY_HOME_PERSIST_ROOT_PATH;
    if (store.contains("path"))
    {
        params.path = getString(store, "path", "store");
    }
    params.historySize =
        getNumber(store, "history_size", params.historySize, 1, "store");

    return params;
}

InventoryParams getInventoryParams(const json& jsonConf)
{
    const auto& persistence =
        getSection(jsonConf, "persistence", "configuration");
    const auto& inventory = getSection(persistence, "inventory", "persistence");

    InventoryParams params;
    params.enabled = getBool(inventory, "enabled", false, "inventory");
    if (inventory.contains("path_prefix"))
    {
        params.pathPrefix = getString(inventory, "path_prefix", "inventory");
    }
    if (params.pathPrefix.front() != '/')
    {
        lg2::error("The inventory path prefix {PREFIX} must start with '/'",
                   "PREFIX", params.pathPrefix);
        throw std::runtime_error("Invalid inventory path prefix");
    }
    params.timeout = std::chrono::milliseconds{
        getNumber(inventory, "timeout_ms", params.timeout.count(), 1,
                  "inventory", maxMilliseconds)};

    return params;
}

Config getConfig(const json& jsonConf)
{
    if (!jsonConf.is_object())
    {
        lg2::error("The configuration must be a JSON object");
        throw std::runtime_error("Invalid configuration");
    }

    Config config;
    config.polling = getPollingParams(jsonConf);
    config.probe = getProbeParams(
        getSection(jsonConf, "probe", "configuration"), ProbeParams{},
        "default");
    config.devices = getDevices(jsonConf, config.probe);
    config.store = getStoreParams(jsonConf);
    config.inventory = getInventoryParams(jsonConf);

    return config;
}

std::vector<std::unique_ptr<Probe>> getProbes(const Config& config,
                                              const sdeventplus::Event& event,
                                              bool simulate)
{
    std::vector<std::unique_ptr<Probe>> probes;

    for (const auto& device : config.devices)
    {
        if (simulate)
        {
            probes.push_back(std::make_unique<SimProbe>(device, event));
        }
        else if (device.probe.type == ProbeType::tcp)
        {
            probes.push_back(std::make_unique<TcpProbe>(device, event));
        }
        else
        {
            probes.push_back(std::make_unique<IcmpProbe>(device, event));
        }
    }

    return probes;
}

std::vector<std::shared_ptr<PersistenceBase>> getStores(const Config& config)
{
    std::vector<std::shared_ptr<PersistenceBase>> stores;

    if (config.store.enabled)
    {
        // Polling goes on without the store rather than not at all.
        try
        {
            std::vector<std::string> names;
            for (const auto& device : config.devices)
            {
                names.push_back(device.name);
            }

            stores.push_back(std::make_shared<FileStore>(
                config.store.path, names, config.store.historySize));
        }
        catch (const std::exception& e)
        {
            lg2::error("Unable to use the store at {PATH}: {ERROR}", "PATH",
                       config.store.path.string(), "ERROR", e);
        }
    }

    if (config.inventory.enabled)
    {
        stores.push_back(std::make_shared<InventoryStore>(
            util::SDBusPlus::getBus(), config.devices,
            config.inventory.pathPrefix, config.inventory.timeout));
    }

    return stores;
}

} // namespace anybody::home::presence
