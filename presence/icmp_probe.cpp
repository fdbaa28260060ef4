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
#include "icmp_probe.hpp"

#include <arpa/inet.h>
#include <netinet/icmp6.h>
#include <netinet/ip_icmp.h>
#include <sys/epoll.h>
#include <unistd.h>

#include <phosphor-logging/lg2.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <functional>

namespace anybody::home::presence
{

namespace
{

uint16_t nextIdentifier()
{
    static uint16_t identifier = static_cast<uint16_t>(getpid());
    return identifier++;
}

// RFC 1071 internet checksum
uint16_t checksum(const uint8_t* data, size_t len)
{
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < len; i += 2)
    {
        sum += static_cast<uint32_t>(data[i] << 8 | data[i + 1]);
    }
    if (len & 1)
    {
        sum += static_cast<uint32_t>(data[len - 1] << 8);
    }
    while (sum >> 16)
    {
        sum = (sum & 0xffff) + (sum >> 16);
    }
    return htons(static_cast<uint16_t>(~sum));
}

constexpr size_t payloadSize = 16;

} // namespace

IcmpProbe::IcmpProbe(const Device& device, const sdeventplus::Event& event) :
    Probe(device), _event(event),
    _timer(event, std::bind(&IcmpProbe::timedOut, this)),
    _identifier(nextIdentifier())
{}

IcmpProbe::~IcmpProbe()
{
    release();
}

void IcmpProbe::begin()
{
    const auto& address = device().address;
    auto protocol = address.family() == AF_INET6 ? IPPROTO_ICMPV6
                                                 : IPPROTO_ICMP;

    // Prefer the unprivileged ping socket, the raw one needs CAP_NET_RAW.
    _raw = false;
    _fd.reset(socket(address.family(),
                     SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, protocol));
    if (!_fd.is_open())
    {
        _raw = true;
        _fd.reset(socket(address.family(),
                         SOCK_RAW | SOCK_NONBLOCK | SOCK_CLOEXEC, protocol));
    }

    if (!_fd.is_open())
    {
        auto e = errno;
        complete(false, std::format("Unable to open an ICMP socket: {}",
                                    strerror(e)));
        return;
    }

    ++_sequence;
    auto packet = echoRequest();
    if (sendto(_fd(), packet.data(), packet.size(), 0, address.get(),
               address.length()) < 0)
    {
        // No route, no neighbor and the like just mean unreachable.
        auto e = errno;
        lg2::debug("Echo request to {DEVICE} at {ADDRESS} not sent: {ERROR}",
                   "DEVICE", device().name, "ADDRESS", address.text(),
                   "ERROR", strerror(e));
        complete(false);
        return;
    }

    _source.emplace(_event, _fd(), EPOLLIN,
                    std::bind(&IcmpProbe::readable, this));
    _timer.restartOnce(util::toTimerDuration(device().probe.timeout));
}

void IcmpProbe::disarm()
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

void IcmpProbe::release()
{
    disarm();
    _source.reset();
    _fd.reset();
}

std::vector<uint8_t> IcmpProbe::echoRequest() const
{
    std::vector<uint8_t> packet;

    if (device().address.family() == AF_INET6)
    {
        icmp6_hdr hdr{};
        hdr.icmp6_type = ICMP6_ECHO_REQUEST;
        hdr.icmp6_id = htons(_identifier);
        hdr.icmp6_seq = htons(_sequence);

        // The kernel fills in the ICMPv6 checksum.
        packet.resize(sizeof(hdr) + payloadSize);
        std::memcpy(packet.data(), &hdr, sizeof(hdr));
        return packet;
    }

    icmphdr hdr{};
    hdr.type = ICMP_ECHO;
    hdr.un.echo.id = htons(_identifier);
    hdr.un.echo.sequence = htons(_sequence);

    packet.resize(sizeof(hdr) + payloadSize);
    std::memcpy(packet.data(), &hdr, sizeof(hdr));

    hdr.checksum = checksum(packet.data(), packet.size());
    std::memcpy(packet.data(), &hdr, sizeof(hdr));
    return packet;
}

bool IcmpProbe::isEchoReply(const uint8_t* data, size_t len) const
{
    if (device().address.family() == AF_INET6)
    {
        icmp6_hdr hdr;
        if (len < sizeof(hdr))
        {
            return false;
        }
        std::memcpy(&hdr, data, sizeof(hdr));

        // Ping sockets rewrite the identifier, so only raw ones check it.
        return hdr.icmp6_type == ICMP6_ECHO_REPLY &&
               ntohs(hdr.icmp6_seq) == _sequence &&
               (!_raw || ntohs(hdr.icmp6_id) == _identifier);
    }

    if (_raw)
    {
        if (len == 0)
        {
            return false;
        }
        size_t headerLen = (data[0] & 0x0f) * 4;
        if (len < headerLen)
        {
            return false;
        }
        data += headerLen;
        len -= headerLen;
    }

    icmphdr hdr;
    if (len < sizeof(hdr))
    {
        return false;
    }
    std::memcpy(&hdr, data, sizeof(hdr));

    return hdr.type == ICMP_ECHOREPLY &&
           ntohs(hdr.un.echo.sequence) == _sequence &&
           (!_raw || ntohs(hdr.un.echo.id) == _identifier);
}

void IcmpProbe::readable()
{
    std::array<uint8_t, 1500> buffer;

    while (pending())
    {
        sockaddr_storage peer{};
        socklen_t peerLen = sizeof(peer);
        auto len = recvfrom(_fd(), buffer.data(), buffer.size(), 0,
                            reinterpret_cast<sockaddr*>(&peer), &peerLen);
        if (len < 0)
        {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
            {
                // A queued ICMP error, e.g. host unreachable.
                complete(false);
            }
            return;
        }

        if (device().address.matches(peer) &&
            isEchoReply(buffer.data(), static_cast<size_t>(len)))
        {
            complete(true);
        }
    }
}

void IcmpProbe::timedOut()
{
    complete(false);
}

} // namespace anybody::home::presence
