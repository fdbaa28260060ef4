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
#include "presence_table.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace anybody::home::presence
{

using json = nlohmann::json;

PresenceTable::PresenceTable(const std::vector<std::string>& devices)
{
    for (const auto& device : devices)
    {
        if (device.empty())
        {
            throw std::invalid_argument("Empty device name");
        }

        Verdict verdict;
        verdict.device = device;
        if (!_verdicts.emplace(device, verdict).second)
        {
            throw std::invalid_argument(
                std::format("Duplicate device name {}", device));
        }
    }
}

std::optional<Verdict> PresenceTable::get(const std::string& device) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _verdicts.find(device);
    if (it == _verdicts.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, Verdict> PresenceTable::getAll() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _verdicts;
}

void PresenceTable::set(const std::string& device, const Verdict& verdict)
{
    // Copy outside of the lock to keep readers waiting as little as possible.
    auto value = verdict;
    value.device = device;

    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _verdicts.find(device);
    if (it == _verdicts.end())
    {
        throw std::out_of_range(std::format("Unknown device {}", device));
    }
    it->second = std::move(value);
}

bool PresenceTable::anyPresent() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return std::any_of(_verdicts.begin(), _verdicts.end(),
                       [](const auto& v) { return v.second.present(); });
}

size_t PresenceTable::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _verdicts.size();
}

RollCall PresenceTable::rollCall(Clock::time_point timestamp) const
{
    RollCall rollCall;
    rollCall.timestamp = timestamp;

    for (const auto& [device, verdict] : getAll())
    {
        rollCall.presence.emplace(device, verdict.present());
        rollCall.anybodyHome = rollCall.anybodyHome || verdict.present();
    }

    return rollCall;
}

json PresenceTable::toJson() const
{
    json data = json::object();
    for (const auto& [device, verdict] : getAll())
    {
        data[device] = verdict.present();
    }
    return data;
}

json PresenceTable::dump() const
{
    json data = json::object();
    for (const auto& [device, verdict] : getAll())
    {
        data[device] = {{"state", toString(verdict.state)},
                        {"last_change", toEpochUs(verdict.lastChange)},
                        {"last_probe", toEpochUs(verdict.lastProbe)}};
    }
    return data;
}

} // namespace anybody::home::presence
