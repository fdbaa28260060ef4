#pragma once

#include "probe.hpp"
#include "sdeventplus.hpp"
#include "utility.hpp"

#include <sdeventplus/event.hpp>
#include <sdeventplus/source/io.hpp>

#include <optional>

namespace anybody::home::presence
{

/**
 * @class TcpProbe
 * @brief Checks reachability with a non-blocking TCP connect.
 *
 * Useful for devices that ignore ICMP but keep a port open, and for
 * running without CAP_NET_RAW.  Both an accepted and a refused
 * connection mean the host answered, so either counts as reachable.
 */
class TcpProbe : public Probe
{
  public:
    TcpProbe() = delete;
    TcpProbe(const TcpProbe&) = delete;
    TcpProbe& operator=(const TcpProbe&) = delete;
    TcpProbe(TcpProbe&&) = delete;
    TcpProbe& operator=(TcpProbe&&) = delete;

    /**
     * @brief Constructor
     *
     * @param[in] device - The device to probe, with a port configured
     * @param[in] event - The event loop to run on
     */
    TcpProbe(const Device& device, const sdeventplus::Event& event);

    ~TcpProbe() override;

  protected:
    void begin() override;
    void disarm() override;
    void release() override;

  private:
    /**
     * @brief IO callback, the connect attempt finished.
     */
    void writable();

    /**
     * @brief Timer callback, the connect attempt took too long.
     */
    void timedOut();

    /**
     * @brief Says if a connect() errno means the host answered.
     */
    static bool answered(int error);

    sdeventplus::Event _event;

    util::Timer _timer;

    util::FileDescriptor _fd;

    std::optional<sdeventplus::source::IO> _source;
};

} // namespace anybody::home::presence
