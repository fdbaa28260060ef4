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
#include "sim_probe.hpp"

#include <algorithm>
#include <chrono>
#include <functional>

namespace anybody::home::presence
{

using namespace std::chrono_literals;

SimProbe::SimProbe(const Device& device, const sdeventplus::Event& event) :
    Probe(device), _timer(event, std::bind(&SimProbe::answer, this)),
    _generator(std::random_device{}())
{}

void SimProbe::begin()
{
    std::uniform_int_distribution<int> latency{1, 50};
    auto delay = std::min<std::chrono::milliseconds>(
        std::chrono::milliseconds{latency(_generator)}, device().probe.timeout);
    _timer.restartOnce(util::toTimerDuration(delay));
}

void SimProbe::disarm()
{
    if (_timer.isEnabled())
    {
        _timer.setEnabled(false);
    }
}

void SimProbe::release()
{
    disarm();
}

void SimProbe::answer()
{
    std::uniform_int_distribution<int> roll{0, 3};
    complete(roll(_generator) == 3);
}

} // namespace anybody::home::presence
