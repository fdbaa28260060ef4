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
#pragma once

#include <nlohmann/json.hpp>
#include <phosphor-logging/lg2.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <string>

namespace anybody::home
{

namespace fs = std::filesystem;
using json = nlohmann::json;

constexpr auto confOverridePath = "/etc/anybody-home";
constexpr auto confBasePath = "/usr/share/anybody-home";

/**
 * @class NoConfigFound - A no JSON configuration found exception
 *
 * Thrown when none of the configuration locations contain the
 * requested file.  The service cannot track anything without a
 * device list, so this ends the process.
 */
class NoConfigFound : public std::runtime_error
{
  public:
    NoConfigFound() = delete;
    NoConfigFound(const NoConfigFound&) = default;
    NoConfigFound(NoConfigFound&&) = default;
    NoConfigFound& operator=(const NoConfigFound&) = delete;
    NoConfigFound& operator=(NoConfigFound&&) = delete;
    ~NoConfigFound() = default;

    /**
     * @brief No JSON configuration found exception object
     *
     * @param[in] appName - The application whose config was searched for
     * @param[in] fileName - The configuration file name
     */
    NoConfigFound(const std::string& appName, const std::string& fileName) :
        std::runtime_error(std::format("JSON configuration not found [Could "
                                       "not find {} conf file {}]",
                                       appName, fileName))
    {}
};

class JsonConfig
{
  public:
    /**
     * Get the json configuration file. The first location found to contain
     * the json config file for the given application is used from the
     * following locations in order.
     * 1.) The explicit path, if one was given
     * 2.) From the confOverridePath location
     * 3.) From the default confBasePath location
     *
     * @param[in] appName - The application name
     * @param[in] fileName - Application's configuration file's name
     * @param[in] explicitPath - Path given on the command line, may be empty
     *
     * @return filesystem path
     *     The filesystem path to the configuration file to use
     */
    static const fs::path getConfFile(const std::string& appName,
                                      const std::string& fileName,
                                      const fs::path& explicitPath = {})
    {
        if (!explicitPath.empty())
        {
            if (fs::exists(explicitPath))
            {
                return explicitPath;
            }
            throw NoConfigFound(appName, explicitPath.string());
        }

        // Check override location
        fs::path confFile = fs::path{confOverridePath} / fileName;
        if (fs::exists(confFile))
        {
            return confFile;
        }

        // If the default file is there, use it
        confFile = fs::path{confBasePath} / fileName;
        if (fs::exists(confFile))
        {
            return confFile;
        }

        throw NoConfigFound(appName, fileName);
    }

    /**
     * @brief Load the JSON config file
     *
     * @param[in] confFile - File system path of the configuration file to load
     *
     * @return Parsed JSON object
     *     The parsed JSON configuration file object
     */
    static const json load(const fs::path& confFile)
    {
        std::ifstream file;
        json jsonConf;

        if (!confFile.empty() && fs::exists(confFile))
        {
            lg2::info("Loading configuration from {PATH}", "PATH",
                      confFile.string());
            file.open(confFile);
            try
            {
                // Enable ignoring `//` or `/* */` comments
                jsonConf = json::parse(file, nullptr, true, true);
            }
            catch (const std::exception& e)
            {
                lg2::error("Failed to parse JSON config file: {PATH}, "
                           "error: {ERROR}",
                           "PATH", confFile.string(), "ERROR", e.what());
                throw std::runtime_error(
                    std::format("Failed to parse JSON config file: {}, "
                                "error: {}",
                                confFile.string(), e.what()));
            }
        }
        else
        {
            lg2::error("Unable to open JSON config file: {PATH}", "PATH",
                       confFile.string());
            throw std::runtime_error(std::format(
                "Unable to open JSON config file: {}", confFile.string()));
        }

        return jsonConf;
    }
};

} // namespace anybody::home
