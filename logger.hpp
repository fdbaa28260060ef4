#pragma once

#include "utility.hpp"

#include <unistd.h>

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <ctime>
#include <deque>
#include <filesystem>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>

namespace anybody::home
{

/**
 * @class Logger
 *
 * Keeps the most recent log messages in memory along with their
 * timestamp and priority, and forwards each one to the journal.
 *
 * The entries are what the SIGUSR1 debug dump reports, so they
 * should be the events worth looking at after the fact: verdict
 * changes, persistence failures and scheduler overruns.
 *
 * The maximum number of entries to keep is specified in the
 * constructor, and after that is hit the oldest entry will be
 * removed when a new one is added.
 */
class Logger
{
  public:
    // timestamp, priority, message
    using LogEntry = std::tuple<std::string, std::string, std::string>;

    enum Priority
    {
        error,
        info,
        debug,
        quiet
    };

    Logger() = delete;
    ~Logger() = default;
    Logger(const Logger&) = default;
    Logger& operator=(const Logger&) = default;
    Logger(Logger&&) = default;
    Logger& operator=(Logger&&) = default;

    /**
     * @brief Constructor
     *
     * @param[in] maxEntries - The maximum number of log entries
     *                         to keep.
     */
    explicit Logger(size_t maxEntries) : _maxEntries(maxEntries)
    {
        if (maxEntries == 0)
        {
            throw std::invalid_argument{"Logger needs room for one entry"};
        }
    }

    /**
     * @brief Places an entry in the log and writes it to the journal.
     *
     * @param[in] message - The log message
     *
     * @param[in] priority - The priority for the journal
     */
    void log(const std::string& message, Priority priority = Logger::info)
    {
        switch (priority)
        {
            case Logger::error:
                lg2::error("{MSG}", "MSG", message);
                break;
            case Logger::info:
                lg2::info("{MSG}", "MSG", message);
                break;
            case Logger::debug:
                lg2::debug("{MSG}", "MSG", message);
                break;
            case Logger::quiet:
                break;
        }

        if (_entries.size() == _maxEntries)
        {
            _entries.pop_front();
        }

        auto t = std::time(nullptr);
        auto tm = *std::localtime(&t);

        // e.g. Sep 22 19:56:32
        std::ostringstream stream;
        stream << std::put_time(&tm, "%b %d %H:%M:%S");
        _entries.emplace_back(stream.str(), toString(priority), message);
    }

    /**
     * @brief Returns the entries in a JSON array
     *
     * @return JSON
     */
    const nlohmann::json getLogs() const
    {
        return _entries;
    }

    /**
     * @brief Writes the entries to a temporary file, one per line,
     *        and returns the path to it.
     *
     * @return path - The path to the file.
     */
    std::filesystem::path saveToTempFile() const
    {
        char tmpFile[] = "/tmp/anybody-home-log.XXXXXX";
        util::FileDescriptor fd{mkstemp(tmpFile)};
        if (fd() == -1)
        {
            throw std::runtime_error{"mkstemp failed!"};
        }

        for (const auto& [time, priority, message] : _entries)
        {
            auto line = std::format("{} {}: {}\n", time, priority, message);
            if (write(fd(), line.data(), line.size()) == -1)
            {
                auto e = errno;
                throw std::runtime_error{std::format(
                    "Could not write to temp file {} errno {}", tmpFile, e)};
            }
        }

        return std::filesystem::path{tmpFile};
    }

    /**
     * @brief Deletes all log entries
     */
    void clear()
    {
        _entries.clear();
    }

    size_t size() const
    {
        return _entries.size();
    }

  private:
    static std::string toString(Priority priority)
    {
        switch (priority)
        {
            case Logger::error:
                return "error";
            case Logger::debug:
                return "debug";
            case Logger::quiet:
                return "quiet";
            case Logger::info:
                break;
        }
        return "info";
    }

    /**
     * @brief The maximum number of entries to hold
     */
    size_t _maxEntries;

    /**
     * @brief The <timestamp, priority, message> entries, oldest first
     */
    std::deque<LogEntry> _entries;
};

} // namespace anybody::home
