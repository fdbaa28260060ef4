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
#include "probe.hpp"

#include <utility>

namespace anybody::home::presence
{

void Probe::start(Callback callback)
{
    cancel();

    _callback = std::move(callback);
    _started = std::chrono::steady_clock::now();
    begin();
}

void Probe::cancel()
{
    _callback = nullptr;
    release();
}

void Probe::complete(bool reachable, std::optional<std::string> error)
{
    if (!_callback)
    {
        return;
    }

    disarm();

    ProbeResult result;
    result.device = _device.name;
    result.reachable = reachable;
    result.timestamp = Clock::now();
    result.error = std::move(error);
    if (reachable)
    {
        result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - _started);
    }

    // Cleared first so pending() is already false inside the callback.
    auto callback = std::exchange(_callback, nullptr);
    callback(result);
}

} // namespace anybody::home::presence
