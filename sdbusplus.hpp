#pragma once

#include <sdbusplus/bus.hpp>
#include <sdbusplus/exception.hpp>
#include <sdbusplus/message.hpp>

#include <chrono>
#include <format>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace anybody::home::util
{

/** @brief Base class for D-Bus failures raised by SDBusPlus. */
class DBusError : public std::runtime_error
{
  public:
    explicit DBusError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @class DBusMethodError
 *
 * Thrown when a method call fails, including when it does not
 * complete within the requested timeout.
 */
class DBusMethodError : public DBusError
{
  public:
    DBusMethodError(const std::string& busName, const std::string& path,
                    const std::string& interface, const std::string& method,
                    const std::string& reason) :
        DBusError(std::format("DBus method failed: {} {} {} {}: {}", busName,
                              path, interface, method, reason)),
        busName(busName), path(path), interface(interface), method(method)
    {}

    const std::string busName;
    const std::string path;
    const std::string interface;
    const std::string method;
};

/**
 * @class DBusServiceError
 *
 * Thrown when the mapper has no service for a path and interface.
 */
class DBusServiceError : public DBusError
{
  public:
    DBusServiceError(const std::string& path, const std::string& interface) :
        DBusError(std::format("DBus service lookup failed: {} {}", path,
                              interface)),
        path(path), interface(interface)
    {}

    const std::string path;
    const std::string interface;
};

/** @class SDBusPlus
 *  @brief DBus access delegate implementation for sdbusplus.
 *
 *  Every call carries a timeout so an unresponsive peer cannot
 *  hold up the caller for longer than that.
 */
class SDBusPlus
{
  public:
    /** @brief Get the bus connection. */
    static auto& getBus() __attribute__((pure))
    {
        static auto bus = sdbusplus::bus::new_default();
        return bus;
    }

    /** @brief Invoke a method. */
    template <typename... Args>
    static auto callMethod(sdbusplus::bus_t& bus, const std::string& busName,
                           const std::string& path,
                           const std::string& interface,
                           const std::string& method,
                           std::chrono::milliseconds timeout, Args&&... args)
    {
        auto reqMsg = bus.new_method_call(busName.c_str(), path.c_str(),
                                          interface.c_str(), method.c_str());
        reqMsg.append(std::forward<Args>(args)...);
        try
        {
            return bus.call(reqMsg, sdbusplus::SdBusDuration{timeout});
        }
        catch (const sdbusplus::exception_t& e)
        {
            throw DBusMethodError{busName, path, interface, method, e.what()};
        }
    }

    /** @brief Invoke a method and read the response. */
    template <typename Ret, typename... Args>
    static auto callMethodAndRead(
        sdbusplus::bus_t& bus, const std::string& busName,
        const std::string& path, const std::string& interface,
        const std::string& method, std::chrono::milliseconds timeout,
        Args&&... args)
    {
        auto respMsg = callMethod(bus, busName, path, interface, method,
                                  timeout, std::forward<Args>(args)...);
        Ret resp;
        respMsg.read(resp);
        return resp;
    }

    /** @brief Get service from the mapper. */
    static std::string getService(sdbusplus::bus_t& bus,
                                  const std::string& path,
                                  const std::string& interface,
                                  std::chrono::milliseconds timeout)
    {
        using GetObject = std::map<std::string, std::vector<std::string>>;

        auto mapperResp = callMethodAndRead<GetObject>(
            bus, "xyz.openbmc_project.ObjectMapper",
            "/xyz/openbmc_project/object_mapper",
            "xyz.openbmc_project.ObjectMapper", "GetObject", timeout, path,
            GetObject::mapped_type{interface});

        if (mapperResp.empty())
        {
            throw DBusServiceError{path, interface};
        }
        return mapperResp.begin()->first;
    }

    /** @brief Invoke method with mapper lookup. */
    template <typename... Args>
    static auto lookupAndCallMethod(sdbusplus::bus_t& bus,
                                    const std::string& path,
                                    const std::string& interface,
                                    const std::string& method,
                                    std::chrono::milliseconds timeout,
                                    Args&&... args)
    {
        return callMethod(bus, getService(bus, path, interface, timeout), path,
                          interface, method, timeout,
                          std::forward<Args>(args)...);
    }
};

} // namespace anybody::home::util
