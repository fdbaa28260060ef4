#include "../icmp_probe.hpp"
#include "../sim_probe.hpp"
#include "../tcp_probe.hpp"
#include "utility.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <sdeventplus/event.hpp>

#include <gtest/gtest.h>

using namespace anybody::home;
using namespace anybody::home::presence;
using namespace std::chrono_literals;

namespace
{

/**
 * @brief Opens a loopback listening socket on an ephemeral port.
 */
util::FileDescriptor listenOnLoopback(uint16_t& port)
{
    util::FileDescriptor fd{socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)};
    EXPECT_TRUE(fd.is_open());

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    EXPECT_EQ(bind(fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)),
              0);
    EXPECT_EQ(listen(fd(), 4), 0);

    socklen_t len = sizeof(addr);
    EXPECT_EQ(getsockname(fd(), reinterpret_cast<sockaddr*>(&addr), &len), 0);
    port = ntohs(addr.sin_port);

    return fd;
}

Device makeDevice(const std::string& address, uint16_t port)
{
    Device device;
    device.name = "nas";
    device.prettyName = "NAS";
    device.address = Address::resolve(address);
    device.probe.type = ProbeType::tcp;
    device.probe.port = port;
    device.probe.timeout = 200ms;
    return device;
}

/**
 * @brief Runs a probe to completion on the event loop.
 */
std::optional<ProbeResult> runProbe(Probe& probe, sdeventplus::Event& event)
{
    std::optional<ProbeResult> result;
    probe.start([&result](const ProbeResult& r) { result = r; });

    for (int i = 0; (i < 100) && !result; i++)
    {
        event.run(std::chrono::milliseconds(10));
    }

    return result;
}

} // namespace

TEST(TcpProbeTest, ListeningPort)
{
    auto event = sdeventplus::Event::get_default();
    uint16_t port = 0;
    auto listener = listenOnLoopback(port);

    auto device = makeDevice("127.0.0.1", port);
    TcpProbe probe{device, event};

    auto result = runProbe(probe, event);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->device, "nas");
    EXPECT_TRUE(result->reachable);
    EXPECT_TRUE(result->latency);
    EXPECT_FALSE(result->error);
    EXPECT_FALSE(probe.pending());

    // The same probe can run again
    result = runProbe(probe, event);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->reachable);
}

TEST(TcpProbeTest, RefusedIsReachable)
{
    auto event = sdeventplus::Event::get_default();
    uint16_t port = 0;

    {
        // Find a free port, then close it so connecting is refused
        auto listener = listenOnLoopback(port);
    }

    auto device = makeDevice("127.0.0.1", port);
    TcpProbe probe{device, event};

    auto result = runProbe(probe, event);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->reachable);
}

TEST(TcpProbeTest, Unreachable)
{
    auto event = sdeventplus::Event::get_default();

    // TEST-NET-1, never routed
    auto device = makeDevice("192.0.2.1", 80);
    TcpProbe probe{device, event};

    auto start = std::chrono::steady_clock::now();
    auto result = runProbe(probe, event);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result);
    EXPECT_FALSE(result->reachable);
    EXPECT_FALSE(result->latency);

    // Bounded by the probe timeout, with some slack
    EXPECT_LT(elapsed, 1s);
}

TEST(TcpProbeTest, Cancel)
{
    auto event = sdeventplus::Event::get_default();
    auto device = makeDevice("192.0.2.1", 80);
    TcpProbe probe{device, event};

    bool called = false;
    probe.start([&called](const ProbeResult&) { called = true; });

    // It may have failed right away if there is no route at all
    if (probe.pending())
    {
        probe.cancel();
        EXPECT_FALSE(probe.pending());

        for (int i = 0; i < 30; i++)
        {
            event.run(std::chrono::milliseconds(10));
        }
        EXPECT_FALSE(called);
    }
}

TEST(TcpProbeTest, NeedsPort)
{
    auto event = sdeventplus::Event::get_default();
    auto device = makeDevice("127.0.0.1", 80);
    device.probe.port.reset();

    EXPECT_THROW((TcpProbe{device, event}), std::invalid_argument);
}

TEST(IcmpProbeTest, Loopback)
{
    auto event = sdeventplus::Event::get_default();

    Device device;
    device.name = "self";
    device.address = Address::resolve("127.0.0.1");
    device.probe.timeout = 500ms;
    IcmpProbe probe{device, event};

    auto result = runProbe(probe, event);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->device, "self");

    // Without ping sockets or CAP_NET_RAW the check can't be made,
    // which is reported as an error rather than thrown.
    if (result->error)
    {
        EXPECT_FALSE(result->reachable);
    }
    else
    {
        EXPECT_TRUE(result->reachable);
        EXPECT_TRUE(result->latency);
    }
}

TEST(SimProbeTest, CompletesWithinTimeout)
{
    auto event = sdeventplus::Event::get_default();

    Device device;
    device.name = "sim";
    device.address = Address::resolve("127.0.0.1");
    device.probe.timeout = 100ms;
    SimProbe probe{device, event};

    size_t reachable = 0;
    for (int i = 0; i < 20; i++)
    {
        auto start = std::chrono::steady_clock::now();
        auto result = runProbe(probe, event);
        ASSERT_TRUE(result);
        EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
        EXPECT_FALSE(result->error);
        if (result->reachable)
        {
            reachable++;
        }
    }

    // One in four on average, so never all of them in practice
    EXPECT_LT(reachable, 20);
}
