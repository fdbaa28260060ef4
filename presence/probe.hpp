#pragma once

#include "device.hpp"
#include "types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace anybody::home::presence
{

/**
 * @class Probe
 * @brief Probe interface.
 *
 * Provide concrete implementations of Probe to realize new ways
 * of checking if a device is reachable.
 *
 * A probe runs on the event loop and must never block.  start()
 * begins one check, and the callback is invoked exactly once when
 * the check completes, either from the event loop or, when the
 * check fails right away, from within start() itself.  Every check
 * is bounded by the device's probe timeout.
 *
 * cancel() abandons an outstanding check; the callback will not be
 * invoked for it.
 */
class Probe
{
  public:
    using Callback = std::function<void(const ProbeResult&)>;

    Probe() = delete;
    Probe(const Probe&) = delete;
    Probe& operator=(const Probe&) = delete;
    Probe(Probe&&) = delete;
    Probe& operator=(Probe&&) = delete;
    virtual ~Probe() = default;

    /**
     * @brief Constructor
     *
     * @param[in] device - The device to probe
     */
    explicit Probe(const Device& device) : _device(device) {}

    /**
     * @brief Starts one reachability check.
     *
     * A check that is still outstanding is abandoned first.
     *
     * @param[in] callback - Invoked with the result
     */
    void start(Callback callback);

    /**
     * @brief Abandons an outstanding check.
     */
    void cancel();

    /**
     * @brief Says if a check is outstanding.
     */
    bool pending() const
    {
        return static_cast<bool>(_callback);
    }

    const Device& device() const
    {
        return _device;
    }

  protected:
    /**
     * @brief Launches the check.  Implementations call complete()
     *        when it is done.
     */
    virtual void begin() = 0;

    /**
     * @brief Stops the event sources of the current check.
     *
     * Called from within those sources' own callbacks, so it must
     * only disable them, not destroy them.
     */
    virtual void disarm() = 0;

    /**
     * @brief Destroys the event sources and sockets of the last
     *        check.  Never called from within their callbacks.
     */
    virtual void release() = 0;

    /**
     * @brief Finishes the current check and invokes the callback.
     *
     * @param[in] reachable - If the device answered
     * @param[in] error - Set when the check could not be made
     */
    void complete(bool reachable,
                  std::optional<std::string> error = std::nullopt);

  private:
    const Device& _device;

    Callback _callback;

    std::chrono::steady_clock::time_point _started;
};

} // namespace anybody::home::presence
