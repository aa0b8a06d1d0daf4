/**
 * Copyright © 2025 IBM Corporation
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

#include "config.hpp"
#include "config_file_parser.hpp"
#include "failure.hpp"
#include "orchestrator.hpp"
#include "power_cycle_request.hpp"
#include "services.hpp"
#include "types.hpp"

#include <CLI/CLI.hpp>
#include <phosphor-logging/lg2.hpp>

#include <chrono>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace pdu_cycle;

namespace
{

/**
 * Command line option values.
 */
struct Options
{
    std::string system{};
    std::vector<std::string> pduHosts{};
    std::vector<std::string> pduVendors{};
    std::vector<std::string> outletLists{};
    std::string authScheme{};
    unsigned int powerOffTimeout{0};
    unsigned int powerOnTimeout{0};
    unsigned int pingTimeout{0};
    std::string logLevel{};
    std::filesystem::path configFile{};
};

/**
 * Builds the application configuration.
 *
 * Values from the command line override values from the configuration file,
 * which override the built-in defaults.
 */
Config buildConfig(const CLI::App& app, const Options& options)
{
    Config config{};
    if (app.count("--config") > 0)
    {
        config = config_file_parser::parse(options.configFile);
    }
    else if (std::filesystem::exists(config_file_parser::standardConfigFile))
    {
        config = config_file_parser::parse(
            config_file_parser::standardConfigFile);
    }

    if (app.count("--auth-scheme") > 0)
    {
        config.authScheme = parseAuthScheme(options.authScheme);
    }
    if (app.count("--power-off-timeout") > 0)
    {
        config.powerOffTimeout = std::chrono::seconds{options.powerOffTimeout};
    }
    if (app.count("--power-on-timeout") > 0)
    {
        config.powerOnTimeout = std::chrono::seconds{options.powerOnTimeout};
    }
    if (app.count("--ping-timeout") > 0)
    {
        config.pingTimeout = std::chrono::seconds{options.pingTimeout};
    }
    if (app.count("--log-level") > 0)
    {
        config.logLevel = parseLogLevel(options.logLevel);
    }
    return config;
}

CycleArguments buildArguments(const Options& options)
{
    CycleArguments args{options.pduHosts, options.pduVendors, options.system,
                        {}};
    for (const std::string& outletList : options.outletLists)
    {
        args.outletNumbers.emplace_back(parseOutletList(outletList));
    }
    return args;
}

void logFailure(const Failure& failure)
{
    if (failure.outlet)
    {
        lg2::error("Power cycle failed: {KIND}: {ERROR}", "KIND",
                   toString(failure.kind), "ERROR", failure.message, "PDU",
                   failure.pduHost, "OUTLET", *failure.outlet);
    }
    else
    {
        lg2::error("Power cycle failed: {KIND}: {ERROR}", "KIND",
                   toString(failure.kind), "ERROR", failure.message, "PDU",
                   failure.pduHost);
    }
    std::cerr << toString(failure.kind) << ": " << failure.message
              << std::endl;
}

} // namespace

int main(int argc, char* argv[])
{
    Options options{};
    CLI::App app{"Power cycles a system by switching its PDU outlets off and on"};

    app.add_option("-s,--system", options.system,
                   "Host name or address of the system to power cycle")
        ->required();
    app.add_option("-p,--pdu", options.pduHosts,
                   "PDU host name or address; repeat for each PDU")
        ->required();
    app.add_option("-v,--vendor", options.pduVendors,
                   "PDU vendor (ibm or eaton); one for each PDU")
        ->required();
    app.add_option("-o,--outlets", options.outletLists,
                   "Comma separated outlet numbers; one list for each PDU")
        ->required();
    app.add_option("-a,--auth-scheme", options.authScheme,
                   "SNMP authentication scheme (v1 or v2c)");
    app.add_option("--power-off-timeout", options.powerOffTimeout,
                   "Seconds to wait for each outlet to turn off");
    app.add_option("--power-on-timeout", options.powerOnTimeout,
                   "Seconds to wait for each outlet to turn on");
    app.add_option("--ping-timeout", options.pingTimeout,
                   "Seconds to wait for the system to become reachable");
    app.add_option("-l,--log-level", options.logLevel,
                   "Log level (debug, info, warning or error)");
    app.add_option("-c,--config", options.configFile,
                   "JSON configuration file")
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    std::optional<Config> config{};
    CycleArguments args{};
    try
    {
        config = buildConfig(app, options);
        args = buildArguments(options);
    }
    catch (const std::exception& e)
    {
        lg2::error("Unable to start power cycle: {ERROR}", "ERROR", e);
        std::cerr << e.what() << std::endl;
        return exitFailure;
    }

    if (config->logLevel <= LogLevel::debug)
    {
        lg2::debug(
            "Configuration: auth scheme {AUTH_SCHEME}, timeouts {POWER_OFF_TIMEOUT}s/{POWER_ON_TIMEOUT}s/{PING_TIMEOUT}s",
            "AUTH_SCHEME", toString(config->authScheme), "POWER_OFF_TIMEOUT",
            config->powerOffTimeout.count(), "POWER_ON_TIMEOUT",
            config->powerOnTimeout.count(), "PING_TIMEOUT",
            config->pingTimeout.count());
    }

    SystemServices services{*config};
    PowerCycleOutcome outcome = cycle(args, *config, services);
    if (outcome.failure)
    {
        logFailure(*outcome.failure);
    }
    return toExitStatus(outcome);
}
