#pragma once

#include <netinet/in.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace anybody::home::presence
{

enum class ProbeType
{
    icmp,
    tcp
};

/**
 * @brief How a device is probed.
 */
struct ProbeParams
{
    ProbeType type = ProbeType::icmp;
    std::chrono::milliseconds timeout{1000};

    /* Only used, and required, by tcp probes */
    std::optional<uint16_t> port;
};

/**
 * @class Address
 *
 * A device's network address, resolved once when the configuration
 * is loaded so probing never has to.
 */
class Address
{
  public:
    Address() = default;

    /**
     * @brief Resolves an IPv4 or IPv6 literal, or a host name.
     *
     * Throws std::runtime_error if the text can't be resolved, which
     * is a configuration error.
     *
     * @param[in] host - The configured address text
     *
     * @return The resolved address
     */
    static Address resolve(const std::string& host);

    const std::string& text() const
    {
        return _text;
    }

    int family() const
    {
        return _storage.ss_family;
    }

    const sockaddr* get() const
    {
        return reinterpret_cast<const sockaddr*>(&_storage);
    }

    socklen_t length() const
    {
        return _length;
    }

    /**
     * @brief Returns a copy of the socket address with the port set.
     */
    sockaddr_storage withPort(uint16_t port) const;

    /**
     * @brief Checks if a peer address refers to the same host.
     */
    bool matches(const sockaddr_storage& peer) const;

  private:
    std::string _text;
    sockaddr_storage _storage{};
    socklen_t _length = 0;
};

/**
 * @brief One configured device.  Immutable after the configuration
 *        has been loaded.
 */
struct Device
{
    /* The stable key, e.g. freds_mobile */
    std::string name;

    /* A human readable name, defaults to name */
    std::string prettyName;

    Address address;
    ProbeParams probe;
};

} // namespace anybody::home::presence
