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
#include "config.h"

#include "json_config.hpp"
#include "json_parser.hpp"
#include "logging.hpp"
#include "poll_scheduler.hpp"
#include "presence_table.hpp"
#include "sdbusplus.hpp"
#include "sdeventplus.hpp"

#include <CLI/CLI.hpp>
#include <phosphor-logging/lg2.hpp>
#include <sdeventplus/event.hpp>
#include <sdeventplus/source/signal.hpp>
#include <stdplus/signal.hpp>

#include <csignal>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>

using namespace anybody::home;
using namespace anybody::home::presence;

namespace
{

/**
 * @brief Writes the presence table, the scheduler state and the
 *        recent log entries to the dump file.
 */
void dumpDebugData(const PresenceTable& table, const PollScheduler& scheduler)
{
    nlohmann::json data;
    data["anybody_home"] = table.anyPresent();
    data["present"] = table.toJson();
    data["presence"] = table.dump();
    data["scheduler"] = scheduler.dump();
    data["logs"] = getLogger().getLogs();

    std::ofstream file{ANYBODY_HOME_DUMP_FILE};
    if (!file)
    {
        lg2::error("Could not open {FILE} for the debug dump", "FILE",
                   ANYBODY_HOME_DUMP_FILE);
        return;
    }

    file << std::setw(4) << data;
}

} // namespace

int main(int argc, char* argv[])
{
    CLI::App app{"Tracks which household devices are on the network"};

    std::string configFile;
    bool simulate = false;
    app.add_option("-c,--config", configFile,
                   "The configuration file to use instead of the default");
    app.add_flag("-t,--test", simulate,
                 "Use simulated probes instead of the network");
    app.set_version_flag("--version", ANYBODY_HOME_VERSION);

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::Error& e)
    {
        return app.exit(e);
    }

    auto event = util::SDEventPlus::getEvent();

    try
    {
        auto confFile =
            JsonConfig::getConfFile(confAppName, confFileName, configFile);
        const auto config = getConfig(JsonConfig::load(confFile));

        if (config.inventory.enabled)
        {
            util::SDBusPlus::getBus().attach_event(event.get(),
                                                   SD_EVENT_PRIORITY_NORMAL);
        }

        std::vector<std::string> names;
        for (const auto& device : config.devices)
        {
            names.push_back(device.name);
        }

        PresenceTable table{names};

        PollScheduler scheduler{event, config.polling,
                                getProbes(config, event, simulate), table,
                                getStores(config)};

        // Exit cleanly on SIGTERM and SIGINT
        auto exitHandler = [&event](sdeventplus::source::Signal&,
                                    const struct signalfd_siginfo*) {
            event.exit(0);
        };
        stdplus::signal::block(SIGTERM);
        sdeventplus::source::Signal sigTerm(event, SIGTERM, exitHandler);
        stdplus::signal::block(SIGINT);
        sdeventplus::source::Signal sigInt(event, SIGINT, exitHandler);

        // Enable SIGUSR1 handling to dump the debug data
        stdplus::signal::block(SIGUSR1);
        sdeventplus::source::Signal sigUsr1(
            event, SIGUSR1,
            [&table, &scheduler](sdeventplus::source::Signal&,
                                 const struct signalfd_siginfo*) {
                dumpDebugData(table, scheduler);
            });

        getLogger().log(std::format("Starting with {} devices{}",
                                    config.devices.size(),
                                    simulate ? " (simulated)" : ""));

        scheduler.start();

        auto rc = event.loop();

        scheduler.stop();
        getLogger().log("Stopped");

        return rc;
    }
    catch (const NoConfigFound& e)
    {
        lg2::error("{ERROR}", "ERROR", e);
    }
    catch (const std::exception& e)
    {
        lg2::error("Unable to start: {ERROR}", "ERROR", e);
        std::cerr << e.what() << std::endl;
    }

    return 1;
}
