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
#include "inventory_store.hpp"

#include "sdbusplus.hpp"

#include <sdbusplus/message.hpp>

#include <variant>

namespace anybody::home::presence
{

using namespace std::literals::string_literals;

InventoryStore::InventoryStore(sdbusplus::bus_t& bus,
                               const std::vector<Device>& devices,
                               const std::string& pathPrefix,
                               std::chrono::milliseconds timeout) :
    _bus(bus), _pathPrefix(pathPrefix), _timeout(timeout)
{
    for (const auto& device : devices)
    {
        _prettyNames.emplace(device.name, device.prettyName);
    }
}

std::string InventoryStore::objectPath(const std::string& device) const
{
    return (sdbusplus::message::object_path{_pathPrefix} / device).str;
}

void InventoryStore::writeVerdict(const Verdict& verdict,
                                  Clock::time_point /*timestamp*/)
{
    using namespace sdbusplus::message;

    using Properties =
        std::map<std::string, std::variant<std::string, bool>>;
    using Interfaces = std::map<std::string, Properties>;

    auto prettyName = verdict.device;
    if (auto it = _prettyNames.find(verdict.device);
        (it != _prettyNames.end()) && !it->second.empty())
    {
        prettyName = it->second;
    }

    std::map<object_path, Interfaces> obj = {
        {object_path{objectPath(verdict.device)},
         {{itemIface,
           {{"Present"s, verdict.present()}, {"PrettyName"s, prettyName}}}}}};

    util::SDBusPlus::lookupAndCallMethod(_bus, inventoryPath,
                                         inventoryManagerIface, "Notify"s,
                                         _timeout, obj);
}

} // namespace anybody::home::presence
