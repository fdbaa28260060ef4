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
#include "device.hpp"

#include <arpa/inet.h>
#include <netdb.h>

#include <cstring>
#include <format>
#include <memory>
#include <stdexcept>

namespace anybody::home::presence
{

Address Address::resolve(const std::string& host)
{
    if (host.empty())
    {
        throw std::runtime_error("Empty device address");
    }

    Address address;
    address._text = host;

    auto* v4 = reinterpret_cast<sockaddr_in*>(&address._storage);
    if (inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1)
    {
        v4->sin_family = AF_INET;
        address._length = sizeof(sockaddr_in);
        return address;
    }

    auto* v6 = reinterpret_cast<sockaddr_in6*>(&address._storage);
    if (inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1)
    {
        v6->sin6_family = AF_INET6;
        address._length = sizeof(sockaddr_in6);
        return address;
    }

    // Not a literal, so it has to be a resolvable host name.
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_flags = AI_ADDRCONFIG;

    addrinfo* info = nullptr;
    auto rc = getaddrinfo(host.c_str(), nullptr, &hints, &info);
    if (rc != 0 || info == nullptr)
    {
        throw std::runtime_error(std::format(
            "Unable to resolve device address {}: {}", host,
            rc != 0 ? gai_strerror(rc) : "no addresses"));
    }

    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> list{info,
                                                           freeaddrinfo};
    std::memcpy(&address._storage, info->ai_addr, info->ai_addrlen);
    address._length = info->ai_addrlen;
    return address;
}

sockaddr_storage Address::withPort(uint16_t port) const
{
    auto storage = _storage;
    if (family() == AF_INET)
    {
        reinterpret_cast<sockaddr_in*>(&storage)->sin_port = htons(port);
    }
    else if (family() == AF_INET6)
    {
        reinterpret_cast<sockaddr_in6*>(&storage)->sin6_port = htons(port);
    }
    return storage;
}

bool Address::matches(const sockaddr_storage& peer) const
{
    if (peer.ss_family != family())
    {
        return false;
    }

    if (family() == AF_INET)
    {
        return reinterpret_cast<const sockaddr_in*>(&peer)->sin_addr.s_addr ==
               reinterpret_cast<const sockaddr_in*>(&_storage)->sin_addr.s_addr;
    }

    return std::memcmp(
               &reinterpret_cast<const sockaddr_in6*>(&peer)->sin6_addr,
               &reinterpret_cast<const sockaddr_in6*>(&_storage)->sin6_addr,
               sizeof(in6_addr)) == 0;
}

} // namespace anybody::home::presence
