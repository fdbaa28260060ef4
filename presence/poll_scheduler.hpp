#pragma once

#include "device_tracker.hpp"
#include "persistence.hpp"
#include "presence_table.hpp"
#include "probe.hpp"
#include "sdeventplus.hpp"

#include <nlohmann/json.hpp>
#include <sdeventplus/event.hpp>

#include <chrono>
#include <memory>
#include <vector>

namespace anybody::home::presence
{

/**
 * @brief The polling parameters from the configuration.
 */
struct PollingParams
{
    /* The tick period while nobody is present */
    std::chrono::milliseconds interval{std::chrono::seconds{30}};

    /* The tick period while anybody is present */
    std::chrono::milliseconds presentInterval{std::chrono::seconds{30}};

    /* How long one cycle's probes may take in total */
    std::chrono::milliseconds cycleTimeout{std::chrono::seconds{10}};

    size_t maxInFlight = 8;

    size_t absentThreshold = 3;

    size_t historySize = 8;
};

/**
 * @class PollScheduler
 *
 * Drives the polling of every configured device on the event loop.
 *
 * Each cycle starts a probe for every device, with no more than
 * maxInFlight of them outstanding at once, and feeds each result to
 * the device's tracker as it completes.  The presence table is
 * updated with every new verdict, and verdicts that changed state
 * are written to the persistence adapters right away.
 *
 * A cycle ends when every probe has completed or the cycle timeout
 * expires, whichever is first.  Probes still outstanding at the
 * deadline are cancelled, and they and any probes that never got
 * started count as failed.  A roll call is then written to the
 * adapters.
 *
 * The next cycle starts one interval after the previous one started.
 * A cycle that runs past that is an overrun, and the next cycle
 * starts as soon as it ends.  Cycles never overlap.
 *
 * Persistence failures are logged and counted, and never stop the
 * polling.
 */
class PollScheduler
{
  public:
    struct Statistics
    {
        size_t cycles = 0;
        size_t overruns = 0;
        size_t deadlineCancels = 0;
        size_t persistenceFailures = 0;
    };

    PollScheduler() = delete;
    PollScheduler(const PollScheduler&) = delete;
    PollScheduler& operator=(const PollScheduler&) = delete;
    PollScheduler(PollScheduler&&) = delete;
    PollScheduler& operator=(PollScheduler&&) = delete;
    ~PollScheduler();

    /**
     * @brief Constructor
     *
     * Throws std::invalid_argument if the parameters are out of range
     * or the probes and the table don't cover the same devices.
     *
     * @param[in] event - The event loop
     * @param[in] params - The polling parameters
     * @param[in] probes - One probe per device
     * @param[in] table - The presence table to keep up to date
     * @param[in] stores - The persistence adapters to write to
     */
    PollScheduler(const sdeventplus::Event& event, const PollingParams& params,
                  std::vector<std::unique_ptr<Probe>>&& probes,
                  PresenceTable& table,
                  std::vector<std::shared_ptr<PersistenceBase>> stores);

    /**
     * @brief Starts polling, with the first cycle right away.
     */
    void start();

    /**
     * @brief Stops polling.  A cycle in progress is abandoned without
     *        a roll call.
     */
    void stop();

    bool running() const
    {
        return _running;
    }

    bool cycleActive() const
    {
        return _cycleActive;
    }

    const Statistics& statistics() const
    {
        return _statistics;
    }

    /**
     * @brief Returns the scheduler state for the debug dump.
     */
    nlohmann::json dump() const;

  private:
    struct Entry
    {
        std::unique_ptr<Probe> probe;
        DeviceTracker tracker;

        /* The probe for this cycle is outstanding */
        bool pending = false;

        /* The probe for this cycle was started */
        bool dispatched = false;
    };

    /**
     * @brief The tick timer callback.  Begins a cycle.
     */
    void tick();

    /**
     * @brief Starts probes until the in-flight limit is reached, and
     *        ends the cycle when every probe has completed.
     */
    void dispatch();

    void probeDone(size_t index, const ProbeResult& result);

    /**
     * @brief Feeds a result to the device's tracker and passes the
     *        verdict on to the table and the adapters.
     */
    void process(Entry& entry, const ProbeResult& result);

    /**
     * @brief The deadline timer callback.  Fails whatever is left.
     */
    void deadlineExpired();

    void endCycle();

    /**
     * @brief The tick period that applies given the current presence.
     */
    std::chrono::milliseconds currentInterval() const;

    const PollingParams _params;

    PresenceTable& _table;

    std::vector<std::shared_ptr<PersistenceBase>> _stores;

    std::vector<Entry> _entries;

    util::Timer _tickTimer;

    util::Timer _deadlineTimer;

    bool _running = false;

    bool _cycleActive = false;

    /* Set while dispatch() is starting probes */
    bool _dispatching = false;

    /* The next entry to start a probe for */
    size_t _next = 0;

    size_t _inFlight = 0;

    std::chrono::steady_clock::time_point _cycleStart;

    Statistics _statistics;
};

} // namespace anybody::home::presence
