#include "../poll_scheduler.hpp"
#include "fake_probe.hpp"
#include "mock_persistence.hpp"

#include <sdeventplus/event.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace anybody::home::presence;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using json = nlohmann::json;

namespace
{

struct Script
{
    std::string name;
    FakeProbe::Outcome outcome;
    std::chrono::milliseconds delay;
};

FakeProbe::Outcome always(bool reachable)
{
    return [reachable](size_t) { return reachable; };
}

} // namespace

class PollSchedulerTest : public ::testing::Test
{
  protected:
    /**
     * @brief Creates the devices, the table and a fake probe per device.
     */
    void setup(const std::vector<Script>& scripts)
    {
        // The probes refer to the devices, so no reallocation after this
        devices.reserve(scripts.size());
        for (const auto& script : scripts)
        {
            Device device;
            device.name = script.name;
            device.address = Address::resolve("127.0.0.1");
            devices.push_back(device);
            names.push_back(script.name);
        }

        table = std::make_unique<PresenceTable>(names);

        for (size_t i = 0; i < scripts.size(); i++)
        {
            probes.push_back(std::make_unique<FakeProbe>(
                devices[i], event, scripts[i].outcome, scripts[i].delay,
                counters));
        }
    }

    /**
     * @brief Runs the event loop until the scheduler has completed
     *        the given number of cycles in total.
     */
    bool runCycles(const PollScheduler& scheduler, size_t cycles,
                   std::chrono::milliseconds limit = 5s)
    {
        auto end = std::chrono::steady_clock::now() + limit;
        while (scheduler.statistics().cycles < cycles)
        {
            if (std::chrono::steady_clock::now() > end)
            {
                return false;
            }
            event.run(std::chrono::milliseconds(10));
        }
        return true;
    }

    std::shared_ptr<NiceMock<MockPersistence>> recordingStore()
    {
        auto store = std::make_shared<NiceMock<MockPersistence>>();
        ON_CALL(*store, writeRollCall)
            .WillByDefault(Invoke(
                [this](const RollCall& r) { rollCalls.push_back(r); }));
        ON_CALL(*store, writeVerdict)
            .WillByDefault(Invoke([this](const Verdict& v, Clock::time_point) {
                verdicts.push_back(v);
            }));
        ON_CALL(*store, name).WillByDefault(::testing::Return("mock"));
        return store;
    }

    sdeventplus::Event event = sdeventplus::Event::get_default();
    ProbeCounters counters;
    std::vector<Device> devices;
    std::vector<std::string> names;
    std::unique_ptr<PresenceTable> table;
    std::vector<std::unique_ptr<Probe>> probes;
    std::vector<RollCall> rollCalls;
    std::vector<Verdict> verdicts;
};

TEST_F(PollSchedulerTest, ReachableAndUnreachable)
{
    setup({{"A", always(true), 1ms}, {"B", always(false), 1ms}});
    auto store = recordingStore();

    PollingParams params;
    params.interval = 100ms;
    params.presentInterval = 100ms;
    params.cycleTimeout = 50ms;
    params.absentThreshold = 2;

    PollScheduler scheduler{event, params, std::move(probes), *table, {store}};
    scheduler.start();

    ASSERT_TRUE(runCycles(scheduler, 1));
    EXPECT_EQ(table->get("A")->state, State::present);
    EXPECT_EQ(table->get("B")->state, State::unknown);

    ASSERT_TRUE(runCycles(scheduler, 2));
    EXPECT_EQ(table->get("A")->state, State::present);
    EXPECT_EQ(table->get("B")->state, State::absent);

    ASSERT_TRUE(runCycles(scheduler, 3));
    EXPECT_EQ(table->toJson(), (json{{"A", true}, {"B", false}}));
    EXPECT_EQ(table->getAll().size(), 2);

    // One roll call per cycle
    ASSERT_EQ(rollCalls.size(), 3);
    for (const auto& rollCall : rollCalls)
    {
        EXPECT_TRUE(rollCall.anybodyHome);
        EXPECT_EQ(rollCall.presence.size(), 2);
        EXPECT_TRUE(rollCall.presence.at("A"));
        EXPECT_FALSE(rollCall.presence.at("B"));
    }

    // Only the state changes are written
    ASSERT_EQ(verdicts.size(), 2);
    EXPECT_EQ(verdicts[0].device, "A");
    EXPECT_EQ(verdicts[0].state, State::present);
    EXPECT_EQ(verdicts[1].device, "B");
    EXPECT_EQ(verdicts[1].state, State::absent);

    EXPECT_EQ(scheduler.statistics().deadlineCancels, 0);
    EXPECT_EQ(scheduler.statistics().persistenceFailures, 0);
    EXPECT_EQ(counters.started, 6);
}

TEST_F(PollSchedulerTest, AlternatingStaysPresent)
{
    // Reachable on the first cycle, then every other one
    setup({{"C", [](size_t call) { return call % 2 == 0; }, 1ms}});
    auto store = recordingStore();

    PollingParams params;
    params.interval = 30ms;
    params.presentInterval = 30ms;
    params.cycleTimeout = 20ms;
    params.absentThreshold = 3;

    PollScheduler scheduler{event, params, std::move(probes), *table, {store}};
    scheduler.start();

    for (size_t cycle = 1; cycle <= 8; cycle++)
    {
        ASSERT_TRUE(runCycles(scheduler, cycle));
        EXPECT_EQ(table->get("C")->state, State::present) << cycle;
    }

    ASSERT_EQ(verdicts.size(), 1);
    EXPECT_EQ(verdicts[0].state, State::present);
}

TEST_F(PollSchedulerTest, DeadlineFailsSlowProbe)
{
    setup({{"fast", always(true), 1ms}, {"slow", always(true), 2s}});
    auto store = recordingStore();

    PollingParams params;
    params.interval = 1s;
    params.presentInterval = 1s;
    params.cycleTimeout = 50ms;
    params.absentThreshold = 1;

    PollScheduler scheduler{event, params, std::move(probes), *table, {store}};

    auto start = std::chrono::steady_clock::now();
    scheduler.start();
    ASSERT_TRUE(runCycles(scheduler, 1));
    auto elapsed = std::chrono::steady_clock::now() - start;

    // The cycle ended at the deadline, not when the slow probe would
    EXPECT_LT(elapsed, 500ms);
    EXPECT_FALSE(scheduler.cycleActive());
    EXPECT_EQ(scheduler.statistics().deadlineCancels, 1);

    EXPECT_EQ(table->get("fast")->state, State::present);
    EXPECT_EQ(table->get("slow")->state, State::absent);

    ASSERT_EQ(rollCalls.size(), 1);
    EXPECT_FALSE(rollCalls[0].presence.at("slow"));

    // The cancelled probe never reports late
    EXPECT_EQ(counters.inFlight, 0);
}

TEST_F(PollSchedulerTest, MaxInFlight)
{
    std::vector<Script> scripts;
    for (int i = 0; i < 7; i++)
    {
        scripts.push_back({"dev" + std::to_string(i), always(true), 5ms});
    }
    setup(scripts);

    PollingParams params;
    params.interval = 500ms;
    params.presentInterval = 500ms;
    params.cycleTimeout = 400ms;
    params.maxInFlight = 2;

    PollScheduler scheduler{event, params, std::move(probes), *table, {}};
    scheduler.start();
    ASSERT_TRUE(runCycles(scheduler, 1));

    EXPECT_EQ(counters.maxInFlight, 2);
    EXPECT_EQ(counters.started, 7);
    EXPECT_EQ(scheduler.statistics().deadlineCancels, 0);

    for (const auto& [name, verdict] : table->getAll())
    {
        EXPECT_EQ(verdict.state, State::present) << name;
    }
}

TEST_F(PollSchedulerTest, DeadlineFailsUnstartedProbes)
{
    // With one probe at a time, the slow first one keeps the others
    // from ever starting before the deadline.
    setup({{"slow", always(true), 2s},
           {"b", always(true), 1ms},
           {"c", always(true), 1ms}});

    PollingParams params;
    params.interval = 1s;
    params.presentInterval = 1s;
    params.cycleTimeout = 50ms;
    params.maxInFlight = 1;
    params.absentThreshold = 1;

    PollScheduler scheduler{event, params, std::move(probes), *table, {}};
    scheduler.start();
    ASSERT_TRUE(runCycles(scheduler, 1));

    EXPECT_EQ(counters.started, 1);
    EXPECT_EQ(scheduler.statistics().deadlineCancels, 3);
    for (const auto& [name, verdict] : table->getAll())
    {
        EXPECT_EQ(verdict.state, State::absent) << name;
    }
}

TEST_F(PollSchedulerTest, ImmediateCompletion)
{
    // Probes that complete from within start()
    std::vector<Script> scripts;
    for (int i = 0; i < 5; i++)
    {
        scripts.push_back(
            {"dev" + std::to_string(i), always(i % 2 == 0), -1ms});
    }
    setup(scripts);

    PollingParams params;
    params.interval = 20ms;
    params.presentInterval = 20ms;
    params.cycleTimeout = 10ms;
    params.maxInFlight = 2;
    params.absentThreshold = 1;

    PollScheduler scheduler{event, params, std::move(probes), *table, {}};
    scheduler.start();
    ASSERT_TRUE(runCycles(scheduler, 3));
    scheduler.stop();

    EXPECT_EQ(counters.started, 15);
    EXPECT_EQ(table->toJson(), (json{{"dev0", true},
                                     {"dev1", false},
                                     {"dev2", true},
                                     {"dev3", false},
                                     {"dev4", true}}));
}

TEST_F(PollSchedulerTest, Overrun)
{
    setup({{"A", always(false), 60ms}});

    PollingParams params;
    params.interval = 20ms;
    params.presentInterval = 20ms;
    params.cycleTimeout = 200ms;

    PollScheduler scheduler{event, params, std::move(probes), *table, {}};
    scheduler.start();
    ASSERT_TRUE(runCycles(scheduler, 3));

    // Every cycle ran past the interval, but none overlapped
    EXPECT_EQ(scheduler.statistics().overruns, 3);
    EXPECT_EQ(counters.maxInFlight, 1);
    EXPECT_EQ(scheduler.statistics().deadlineCancels, 0);
}

TEST_F(PollSchedulerTest, AdaptiveInterval)
{
    setup({{"A", always(true), 1ms}});

    PollingParams params;
    params.interval = 20ms;
    params.presentInterval = 300ms;
    params.cycleTimeout = 10ms;

    PollScheduler scheduler{event, params, std::move(probes), *table, {}};
    scheduler.start();
    ASSERT_TRUE(runCycles(scheduler, 1));

    // Somebody is home, so the slower period applies
    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(runCycles(scheduler, 2));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 250ms);
}

TEST_F(PollSchedulerTest, PersistenceFailures)
{
    setup({{"A", always(true), 1ms}, {"B", always(false), 1ms}});

    auto failing = std::make_shared<NiceMock<MockPersistence>>();
    ON_CALL(*failing, name).WillByDefault(::testing::Return("failing"));
    EXPECT_CALL(*failing, writeRollCall(_))
        .Times(3)
        .WillRepeatedly(::testing::Throw(std::runtime_error{"store down"}));
    EXPECT_CALL(*failing, writeVerdict(_, _))
        .Times(2)
        .WillRepeatedly(::testing::Throw(std::runtime_error{"store down"}));

    // A working store after a failing one still gets everything
    auto store = recordingStore();

    PollingParams params;
    params.interval = 30ms;
    params.presentInterval = 30ms;
    params.cycleTimeout = 20ms;
    params.absentThreshold = 1;

    PollScheduler scheduler{event,  params, std::move(probes),
                            *table, {failing, store}};
    scheduler.start();
    ASSERT_TRUE(runCycles(scheduler, 3));
    scheduler.stop();

    EXPECT_EQ(scheduler.statistics().persistenceFailures, 5);
    EXPECT_EQ(rollCalls.size(), 3);
    EXPECT_EQ(verdicts.size(), 2);
    EXPECT_EQ(table->toJson(), (json{{"A", true}, {"B", false}}));
}

TEST_F(PollSchedulerTest, StopAndDump)
{
    setup({{"A", always(true), 1ms}});

    PollingParams params;
    params.interval = 20ms;
    params.presentInterval = 20ms;
    params.cycleTimeout = 10ms;

    PollScheduler scheduler{event, params, std::move(probes), *table, {}};
    EXPECT_FALSE(scheduler.running());

    scheduler.start();
    EXPECT_TRUE(scheduler.running());
    ASSERT_TRUE(runCycles(scheduler, 2));

    scheduler.stop();
    EXPECT_FALSE(scheduler.running());
    auto cycles = scheduler.statistics().cycles;

    for (int i = 0; i < 10; i++)
    {
        event.run(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(scheduler.statistics().cycles, cycles);

    auto dump = scheduler.dump();
    EXPECT_EQ(dump["running"], false);
    EXPECT_EQ(dump["statistics"]["cycles"], cycles);
    EXPECT_EQ(dump["devices"]["A"]["state"], "present");
    EXPECT_EQ(dump["devices"]["A"]["consecutive_failures"], 0);
}

TEST_F(PollSchedulerTest, Validation)
{
    setup({{"A", always(true), 1ms}, {"B", always(true), 1ms}});

    PollingParams params;
    params.maxInFlight = 0;
    EXPECT_THROW(
        (PollScheduler{event, params, std::move(probes), *table, {}}),
        std::invalid_argument);
}

TEST_F(PollSchedulerTest, ProbesMustMatchTable)
{
    setup({{"A", always(true), 1ms}, {"B", always(true), 1ms}});

    // A table without B
    PresenceTable other{{"A", "Z"}};
    EXPECT_THROW(
        (PollScheduler{event, PollingParams{}, std::move(probes), other, {}}),
        std::invalid_argument);
}

TEST_F(PollSchedulerTest, ProbeCountMustMatchTable)
{
    setup({{"A", always(true), 1ms}});

    PresenceTable other{{"A", "B"}};
    EXPECT_THROW(
        (PollScheduler{event, PollingParams{}, std::move(probes), other, {}}),
        std::invalid_argument);
}
