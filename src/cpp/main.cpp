/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "loopvault/simulation/VaultSimulation.hpp"
#include "common.hpp"

#include <CLI/CLI.hpp>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"loopvault simulator"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Scenario config file")
        ->required()
        ->check(CLI::ExistingFile);

    fs::path logDir{"logs"};
    app.add_option("--log-dir", logDir, "Directory receiving the run's logs")
        ->capture_default_str();

    bool debug{};
    app.add_flag("--debug", debug, "Print every action and rebalance");

    CLI11_PARSE(app, argc, argv);

    fmt::print("{}\n", app.get_description());

    auto simulation = loopvault::simulation::VaultSimulation::fromConfig(config, logDir);
    if (debug) {
        simulation->setDebug(true);
    }
    simulation->run();

    fmt::print(" - simulation finished, exiting\n");

    return 0;
}

//-------------------------------------------------------------------------
