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
#include "tcp_probe.hpp"

#include <sys/epoll.h>
#include <sys/socket.h>

#include <phosphor-logging/lg2.hpp>

#include <cerrno>
#include <cstring>
#include <format>
#include <functional>
#include <stdexcept>

namespace anybody::home::presence
{

TcpProbe::TcpProbe(const Device& device, const sdeventplus::Event& event) :
    Probe(device), _event(event),
    _timer(event, std::bind(&TcpProbe::timedOut, this))
{
    if (!device.probe.port)
    {
        throw std::invalid_argument(
            std::format("TCP probe for {} has no port", device.name));
    }
}

TcpProbe::~TcpProbe()
{
    release();
}

bool TcpProbe::answered(int error)
{
    return error == 0 || error == ECONNREFUSED;
}

void TcpProbe::begin()
{
    const auto& address = device().address;

    _fd.reset(socket(address.family(),
                     SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!_fd.is_open())
    {
        auto e = errno;
        complete(false,
                 std::format("Unable to open a TCP socket: {}", strerror(e)));
        return;
    }

    auto peer = address.withPort(*device().probe.port);
    if (connect(_fd(), reinterpret_cast<const sockaddr*>(&peer),
                address.length()) == 0)
    {
        complete(true);
        return;
    }

    auto e = errno;
    if (e != EINPROGRESS)
    {
        lg2::debug("Connect to {DEVICE} at {ADDRESS} failed: {ERROR}",
                   "DEVICE", device().name, "ADDRESS", address.text(),
                   "ERROR", strerror(e));
        complete(answered(e));
        return;
    }

    _source.emplace(_event, _fd(), EPOLLOUT,
                    std::bind(&TcpProbe::writable, this));
    _timer.restartOnce(util::toTimerDuration(device().probe.timeout));
}

void TcpProbe::disarm()
{
    if (_source)
    {
        _source->set_enabled(sdeventplus::source::Enabled::Off);
    }

    if (_timer.isEnabled())
    {
        _timer.setEnabled(false);
    }
}

void TcpProbe::release()
{
    disarm();
    _source.reset();
    _fd.reset();
}

void TcpProbe::writable()
{
    int error = 0;
    socklen_t len = sizeof(error);
    if (getsockopt(_fd(), SOL_SOCKET, SO_ERROR, &error, &len) < 0)
    {
        error = errno;
    }

    complete(answered(error));
}

void TcpProbe::timedOut()
{
    complete(false);
}

} // namespace anybody::home::presence
