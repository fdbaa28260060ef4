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
#include "poll_scheduler.hpp"

#include "logging.hpp"

#include <phosphor-logging/lg2.hpp>

#include <format>
#include <functional>
#include <set>
#include <stdexcept>

namespace anybody::home::presence
{

using json = nlohmann::json;

PollScheduler::PollScheduler(
    const sdeventplus::Event& event, const PollingParams& params,
    std::vector<std::unique_ptr<Probe>>&& probes, PresenceTable& table,
    std::vector<std::shared_ptr<PersistenceBase>> stores) :
    _params(params), _table(table), _stores(std::move(stores)),
    _tickTimer(event, std::bind(&PollScheduler::tick, this)),
    _deadlineTimer(event, std::bind(&PollScheduler::deadlineExpired, this))
{
    using namespace std::chrono_literals;

    if ((_params.interval <= 0ms) || (_params.presentInterval <= 0ms) ||
        (_params.cycleTimeout <= 0ms))
    {
        throw std::invalid_argument(
            "Poll intervals and the cycle timeout must be positive");
    }

    if (_params.maxInFlight == 0)
    {
        throw std::invalid_argument("At least one probe must be allowed");
    }

    if (probes.size() != _table.size())
    {
        throw std::invalid_argument(
            std::format("{} probes for {} devices", probes.size(),
                        _table.size()));
    }

    std::set<std::string> names;
    for (auto& probe : probes)
    {
        if (!probe)
        {
            throw std::invalid_argument("Missing probe");
        }

        const auto& name = probe->device().name;
        if (!_table.get(name))
        {
            throw std::invalid_argument(
                std::format("Probe for unknown device {}", name));
        }

        if (!names.insert(name).second)
        {
            throw std::invalid_argument(
                std::format("More than one probe for {}", name));
        }

        DeviceTracker tracker{name, _params.absentThreshold,
                              _params.historySize};
        _entries.push_back(Entry{std::move(probe), std::move(tracker)});
    }
}

PollScheduler::~PollScheduler()
{
    for (auto& entry : _entries)
    {
        entry.probe->cancel();
    }
}

void PollScheduler::start()
{
    if (_running)
    {
        return;
    }

    lg2::info("Polling {COUNT} devices every {INTERVAL}ms", "COUNT",
              _entries.size(), "INTERVAL", _params.interval.count());

    _running = true;
    _tickTimer.restartOnce(std::chrono::microseconds{0});
}

void PollScheduler::stop()
{
    _running = false;
    _cycleActive = false;

    if (_tickTimer.isEnabled())
    {
        _tickTimer.setEnabled(false);
    }
    if (_deadlineTimer.isEnabled())
    {
        _deadlineTimer.setEnabled(false);
    }

    for (auto& entry : _entries)
    {
        entry.probe->cancel();
        entry.pending = false;
    }
    _inFlight = 0;
}

void PollScheduler::tick()
{
    if (!_running || _cycleActive)
    {
        return;
    }

    _cycleActive = true;
    _cycleStart = std::chrono::steady_clock::now();
    _next = 0;
    _inFlight = 0;
    for (auto& entry : _entries)
    {
        entry.pending = false;
        entry.dispatched = false;
    }

    _deadlineTimer.restartOnce(util::toTimerDuration(_params.cycleTimeout));

    dispatch();
}

void PollScheduler::dispatch()
{
    // A probe that completes from within start() calls back in here,
    // the loop below carries on with the next probe.
    if (_dispatching)
    {
        return;
    }

    _dispatching = true;
    while (_cycleActive && (_inFlight < _params.maxInFlight) &&
           (_next < _entries.size()))
    {
        auto index = _next++;
        auto& entry = _entries[index];

        entry.dispatched = true;
        entry.pending = true;
        _inFlight++;

        entry.probe->start([this, index](const ProbeResult& result) {
            probeDone(index, result);
        });
    }
    _dispatching = false;

    if (_cycleActive && (_inFlight == 0) && (_next == _entries.size()))
    {
        endCycle();
    }
}

void PollScheduler::probeDone(size_t index, const ProbeResult& result)
{
    auto& entry = _entries[index];
    if (!_cycleActive || !entry.pending)
    {
        return;
    }

    entry.pending = false;
    _inFlight--;

    process(entry, result);

    dispatch();
}

void PollScheduler::process(Entry& entry, const ProbeResult& result)
{
    const auto& name = entry.probe->device().name;

    if (result.error)
    {
        lg2::debug("Probe of {DEVICE} failed: {ERROR}", "DEVICE", name,
                   "ERROR", *result.error);
    }

    auto update = entry.tracker.record(result);
    _table.set(name, update.verdict);

    if (!update.changed)
    {
        return;
    }

    getLogger().log(std::format("{} is now {}", name,
                                toString(update.verdict.state)));

    for (auto& store : _stores)
    {
        try
        {
            store->writeVerdict(update.verdict, result.timestamp);
        }
        catch (const std::exception& e)
        {
            _statistics.persistenceFailures++;
            getLogger().log(std::format("Failed writing {} to the {}: {}",
                                        name, store->name(), e.what()),
                            Logger::error);
        }
    }
}

void PollScheduler::deadlineExpired()
{
    if (!_cycleActive)
    {
        return;
    }

    size_t failed = 0;
    for (auto& entry : _entries)
    {
        if (entry.dispatched && !entry.pending)
        {
            continue;
        }

        if (entry.pending)
        {
            entry.probe->cancel();
            entry.pending = false;
        }
        entry.dispatched = true;

        ProbeResult result;
        result.device = entry.probe->device().name;
        result.reachable = false;
        result.timestamp = Clock::now();
        result.error = "Cycle deadline expired";

        process(entry, result);
        failed++;
    }

    _statistics.deadlineCancels += failed;
    _next = _entries.size();
    _inFlight = 0;

    lg2::info("Poll cycle deadline expired with {COUNT} probes outstanding",
              "COUNT", failed);

    endCycle();
}

void PollScheduler::endCycle()
{
    _cycleActive = false;

    if (_deadlineTimer.isEnabled())
    {
        _deadlineTimer.setEnabled(false);
    }

    auto rollCall = _table.rollCall(Clock::now());
    for (auto& store : _stores)
    {
        try
        {
            store->writeRollCall(rollCall);
        }
        catch (const std::exception& e)
        {
            _statistics.persistenceFailures++;
            getLogger().log(std::format("Failed writing the roll call to "
                                        "the {}: {}",
                                        store->name(), e.what()),
                            Logger::error);
        }
    }

    _statistics.cycles++;

    if (!_running)
    {
        return;
    }

    auto interval = currentInterval();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - _cycleStart);

    if (elapsed >= interval)
    {
        _statistics.overruns++;
        getLogger().log(
            std::format("Poll cycle took {}ms, longer than the {}ms interval",
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                            elapsed)
                            .count(),
                        interval.count()));
        _tickTimer.restartOnce(std::chrono::microseconds{0});
    }
    else
    {
        _tickTimer.restartOnce(util::toTimerDuration(interval - elapsed));
    }
}

std::chrono::milliseconds PollScheduler::currentInterval() const
{
    return _table.anyPresent() ? _params.presentInterval : _params.interval;
}

json PollScheduler::dump() const
{
    json devices = json::object();
    for (const auto& entry : _entries)
    {
        const auto& verdict = entry.tracker.verdict();
        devices[verdict.device] = {
            {"state", toString(verdict.state)},
            {"consecutive_failures", entry.tracker.consecutiveFailures()},
            {"pending", entry.pending}};
    }

    return {{"running", _running},
            {"cycle_active", _cycleActive},
            {"interval_ms", _params.interval.count()},
            {"present_interval_ms", _params.presentInterval.count()},
            {"cycle_timeout_ms", _params.cycleTimeout.count()},
            {"max_in_flight", _params.maxInFlight},
            {"absent_threshold", _params.absentThreshold},
            {"statistics",
             {{"cycles", _statistics.cycles},
              {"overruns", _statistics.overruns},
              {"deadline_cancels", _statistics.deadlineCancels},
              {"persistence_failures", _statistics.persistenceFailures}}},
            {"devices", devices}};
}

} // namespace anybody::home::presence
