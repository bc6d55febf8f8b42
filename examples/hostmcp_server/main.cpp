//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: hostmcp server executable (configuration from HOSTMCP_* variables and --key=value switches)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "hostmcp/Server.h"
#include "hostmcp/config/Settings.h"
#include "hostmcp/version.h"
#include "logging/Logger.h"

using namespace hostmcp;

namespace {

std::atomic<bool> gStopRequested{false};

extern "C" void onSignal(int) {
    gStopRequested.store(true);
}

void printUsage() {
    std::cerr << "hostmcp_server " << getVersionString() << "\n"
              << "Usage: hostmcp_server [--transport=stdio|http|websocket] [--host=ADDR] [--port=N]\n"
              << "                      [--tls-cert=PEM --tls-key=PEM] [--require-auth] [--api-keys=key:client,...]\n"
              << "                      [--log-level=DEBUG|INFO|WARN|ERROR] [--log-file=PATH]\n"
              << "Every switch also has a HOSTMCP_* environment variable.\n";
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage();
            return EXIT_SUCCESS;
        }
        if (a == "--version") {
            std::cout << getVersionString() << std::endl;
            return EXIT_SUCCESS;
        }
    }

    config::Settings settings = config::Settings::FromEnvironment();
    const auto unknown = settings.ApplyArguments(argc, argv);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
#ifndef _WIN32
    // A client closing the stdout pipe or a socket must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
#endif

    try {
        Server server(settings);
        for (const auto& arg : unknown) {
            LOG_WARN("Ignoring unrecognised argument: {}", arg);
        }
        server.Start().get();
        while (!server.WaitFor(std::chrono::milliseconds(200))) {
            if (gStopRequested.load()) {
                LOG_INFO("Shutdown requested");
                server.Stop();
            }
        }
        server.Stop();
    } catch (const std::exception& e) {
        LOG_ERROR("Server failed: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
