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
#include "file_store.hpp"

#include <cereal/archives/json.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/tuple.hpp>
#include <cereal/types/vector.hpp>
#include <phosphor-logging/lg2.hpp>

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <tuple>
#include <vector>

namespace anybody::home::presence
{

namespace fs = std::filesystem;

namespace
{

// Cereal doesn't know the State enum or time points, so they are
// stored as ints and microseconds since the epoch.

// device, state, last change, last probe
using VerdictRecord = std::tuple<std::string, int, uint64_t, uint64_t>;

// timestamp, anybody home, presence
using RollCallRecord =
    std::tuple<uint64_t, bool, std::map<std::string, bool>>;

VerdictRecord toRecord(const Verdict& verdict)
{
    return {verdict.device, static_cast<int>(verdict.state),
            toEpochUs(verdict.lastChange), toEpochUs(verdict.lastProbe)};
}

Verdict fromRecord(const VerdictRecord& record)
{
    const auto& [device, state, lastChange, lastProbe] = record;
    if ((state < static_cast<int>(State::unknown)) ||
        (state > static_cast<int>(State::absent)))
    {
        throw std::runtime_error(
            std::format("Invalid state {} for {}", state, device));
    }

    Verdict verdict;
    verdict.device = device;
    verdict.state = static_cast<State>(state);
    verdict.lastChange = fromEpochUs(lastChange);
    verdict.lastProbe = fromEpochUs(lastProbe);
    return verdict;
}

RollCallRecord toRecord(const RollCall& rollCall)
{
    return {toEpochUs(rollCall.timestamp), rollCall.anybodyHome,
            rollCall.presence};
}

RollCall fromRecord(const RollCallRecord& record)
{
    RollCall rollCall;
    rollCall.timestamp = fromEpochUs(std::get<0>(record));
    rollCall.anybodyHome = std::get<1>(record);
    rollCall.presence = std::get<2>(record);
    return rollCall;
}

} // namespace

FileStore::FileStore(const fs::path& root,
                     const std::vector<std::string>& devices,
                     size_t historySize) :
    _root(root), _devices(devices.begin(), devices.end()),
    _historySize(historySize)
{
    if (historySize == 0)
    {
        throw std::invalid_argument(
            "The roll call history size must be at least 1");
    }

    if (!fs::exists(_root))
    {
        fs::create_directories(_root);
    }

    load();
}

void FileStore::writeVerdict(const Verdict& verdict,
                             Clock::time_point /*timestamp*/)
{
    if (!_devices.contains(verdict.device))
    {
        throw std::out_of_range(
            std::format("Unknown device {}", verdict.device));
    }

    auto verdicts = _verdicts;
    verdicts[verdict.device] = verdict;

    std::vector<VerdictRecord> records;
    for (const auto& [device, v] : verdicts)
    {
        records.push_back(toRecord(v));
    }

    save(verdictsKey, records);

    // Only keep what made it to disk.
    _verdicts = std::move(verdicts);
}

void FileStore::writeRollCall(const RollCall& rollCall)
{
    save(rollCallKey, rollCall.presence);
    save(anybodyHomeKey, rollCall.anybodyHome);

    auto history = _history;
    history.push_back(rollCall);
    while (history.size() > _historySize)
    {
        history.pop_front();
    }

    std::vector<RollCallRecord> records;
    for (const auto& r : history)
    {
        records.push_back(toRecord(r));
    }

    save(historyKey, records);

    _history = std::move(history);
}

template <typename T>
void FileStore::save(const std::string& key, const T& value) const
{
    std::ostringstream data;
    {
        // The archive only finishes the JSON when it is destroyed.
        cereal::JSONOutputArchive oarchive{data};
        oarchive(value);
    }

    auto finalPath = path(key);
    auto tmpPath = finalPath;
    tmpPath += ".tmp";

    {
        std::ofstream stream{tmpPath, std::ios::binary | std::ios::trunc};
        if (!stream)
        {
            throw std::runtime_error(
                std::format("Unable to open {}", tmpPath.string()));
        }

        stream << data.str();
        stream.flush();
        if (!stream)
        {
            std::error_code ec;
            fs::remove(tmpPath, ec);
            throw std::runtime_error(
                std::format("Unable to write {}", tmpPath.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmpPath, finalPath, ec);
    if (ec)
    {
        std::error_code removeEc;
        fs::remove(tmpPath, removeEc);
        throw std::runtime_error(std::format("Unable to replace {}: {}",
                                             finalPath.string(), ec.message()));
    }
}

template <typename T>
bool FileStore::restore(const std::string& key, T& value) const
{
    auto keyPath = path(key);
    if (!fs::exists(keyPath))
    {
        return false;
    }

    try
    {
        std::ifstream stream{keyPath};
        cereal::JSONInputArchive iarchive{stream};
        iarchive(value);
    }
    catch (const std::exception& e)
    {
        // Include possible exception when removing file, otherwise ec = 0
        std::error_code ec;
        fs::remove(keyPath, ec);
        lg2::error("Unable to restore {PATH} ({ERROR}, ec: {EC})", "PATH",
                   keyPath.string(), "ERROR", e, "EC", ec.value());
        return false;
    }

    return true;
}

void FileStore::load()
{
    std::vector<VerdictRecord> verdicts;
    if (restore(verdictsKey, verdicts))
    {
        try
        {
            for (const auto& record : verdicts)
            {
                auto verdict = fromRecord(record);
                if (!_devices.contains(verdict.device))
                {
                    lg2::info("Dropping the persisted verdict of removed "
                              "device {DEVICE}",
                              "DEVICE", verdict.device);
                    continue;
                }
                _verdicts[verdict.device] = verdict;
            }
        }
        catch (const std::exception& e)
        {
            std::error_code ec;
            fs::remove(path(verdictsKey), ec);
            lg2::error("Discarding persisted verdicts: {ERROR}", "ERROR", e);
            _verdicts.clear();
        }
    }

    std::vector<RollCallRecord> history;
    if (restore(historyKey, history))
    {
        for (const auto& record : history)
        {
            _history.push_back(fromRecord(record));
        }

        // The history size may have been lowered since it was saved.
        while (_history.size() > _historySize)
        {
            _history.pop_front();
        }
    }
}

} // namespace anybody::home::presence
