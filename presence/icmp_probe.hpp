#pragma once

#include "probe.hpp"
#include "sdeventplus.hpp"
#include "utility.hpp"

#include <sdeventplus/event.hpp>
#include <sdeventplus/source/io.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace anybody::home::presence
{

/**
 * @class IcmpProbe
 * @brief Checks reachability with an ICMP (or ICMPv6) echo request.
 *
 * An unprivileged ping socket is used when the kernel allows it
 * (net.ipv4.ping_group_range), otherwise a raw socket, which needs
 * CAP_NET_RAW.  The device is reachable if a matching echo reply
 * arrives before the probe timeout.
 */
class IcmpProbe : public Probe
{
  public:
    IcmpProbe() = delete;
    IcmpProbe(const IcmpProbe&) = delete;
    IcmpProbe& operator=(const IcmpProbe&) = delete;
    IcmpProbe(IcmpProbe&&) = delete;
    IcmpProbe& operator=(IcmpProbe&&) = delete;

    /**
     * @brief Constructor
     *
     * @param[in] device - The device to probe
     * @param[in] event - The event loop to run on
     */
    IcmpProbe(const Device& device, const sdeventplus::Event& event);

    ~IcmpProbe() override;

  protected:
    void begin() override;
    void disarm() override;
    void release() override;

  private:
    /**
     * @brief Builds the echo request for the current sequence number.
     */
    std::vector<uint8_t> echoRequest() const;

    /**
     * @brief Checks if a received datagram is the reply to the
     *        outstanding request.
     */
    bool isEchoReply(const uint8_t* data, size_t len) const;

    /**
     * @brief IO callback, drains the socket looking for the reply.
     */
    void readable();

    /**
     * @brief Timer callback, the device didn't answer in time.
     */
    void timedOut();

    sdeventplus::Event _event;

    util::Timer _timer;

    util::FileDescriptor _fd;

    std::optional<sdeventplus::source::IO> _source;

    /* If the socket is raw, in which case IPv4 replies include the IP header */
    bool _raw = false;

    const uint16_t _identifier;

    uint16_t _sequence = 0;
};

} // namespace anybody::home::presence
