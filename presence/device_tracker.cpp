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
#include "device_tracker.hpp"

#include <algorithm>
#include <stdexcept>

namespace anybody::home::presence
{

DeviceTracker::DeviceTracker(const std::string& device,
                             size_t absentThreshold, size_t historySize) :
    _absentThreshold(absentThreshold),
    _historySize(std::max(historySize, absentThreshold))
{
    if (absentThreshold == 0)
    {
        throw std::invalid_argument("The absent threshold must be at least 1");
    }

    _verdict.device = device;
}

DeviceTracker::Update DeviceTracker::record(const ProbeResult& result)
{
    _history.push_back(result.reachable);
    if (_history.size() > _historySize)
    {
        _history.pop_front();
    }

    // Results can complete out of order, keep the newest probe time.
    _verdict.lastProbe = std::max(_verdict.lastProbe, result.timestamp);

    auto newState = _verdict.state;
    if (result.reachable)
    {
        newState = State::present;
    }
    else if (_verdict.state != State::absent &&
             consecutiveFailures() >= _absentThreshold)
    {
        newState = State::absent;
    }

    Update update;
    update.changed = newState != _verdict.state;
    if (update.changed)
    {
        _verdict.state = newState;
        _verdict.lastChange = result.timestamp;
    }
    update.verdict = _verdict;

    return update;
}

size_t DeviceTracker::consecutiveFailures() const
{
    auto lastSuccess = std::find(_history.rbegin(), _history.rend(), true);
    return static_cast<size_t>(std::distance(_history.rbegin(), lastSuccess));
}

} // namespace anybody::home::presence
