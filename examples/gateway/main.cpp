//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcp-bridge daemon: connects configured backends and serves them at /mcp/{backendId}
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <future>
#include <iostream>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpbridge/BackendCatalog.h"
#include "mcpbridge/ConnectionManager.h"
#include "mcpbridge/ConnectionRegistry.h"
#include "mcpbridge/Gateway.h"
#include "mcpbridge/GatewayServer.hpp"
#include "mcpbridge/errors/Errors.h"
#include "mcpbridge/version.h"

using namespace mcpbridge;

//==========================================================================================================
// Parses command-line options given as "--key=value" or "--key value".
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--config")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos) {
            if (a.substr(0, eq) == key) {
                return a.substr(eq + 1);
            }
        } else if (a == key && i + 1 < static_cast<std::size_t>(argc) && argv[i + 1] != nullptr) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " --config <file> [--address <ip>] [--port <n>] [--log-level <lvl>]\n"
              << "  --config     JSON file with \"gateway\" settings and \"backends\" list\n"
              << "  --address    Bind address (overrides gateway.address)\n"
              << "  --port       Listen port, 0 for ephemeral (overrides gateway.port)\n"
              << "  --log-level  DEBUG, INFO, WARN, ERROR (overrides MCPBRIDGE_LOG_LEVEL)\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }
    if (hasFlag(argc, argv, "--version")) {
        std::cout << BRIDGE_IMPLEMENTATION_NAME << " " << getVersionString() << std::endl;
        return 0;
    }

    Logger::setLogLevelFromString(
        getArgValue(argc, argv, "--log-level").value_or(GetEnvOrDefault("MCPBRIDGE_LOG_LEVEL", "INFO")));
    {
        std::string logFile = GetEnvOrDefault("MCPBRIDGE_LOG_FILE", "");
        if (!logFile.empty()) {
            Logger::setLogFile(logFile);
        }
    }

    auto configPath = getArgValue(argc, argv, "--config");
    if (!configPath.has_value()) {
        printUsage(argv[0]);
        return 2;
    }

    BridgeConfig config;
    try {
        config = LoadBridgeConfig(configPath.value());
    } catch (const errors::BridgeError& e) {
        std::cerr << "mcp-bridge: " << e.what() << std::endl;
        return 1;
    }
    if (auto address = getArgValue(argc, argv, "--address"); address.has_value()) {
        config.gateway.address = address.value();
    }
    if (auto port = getArgValue(argc, argv, "--port"); port.has_value()) {
        try {
            unsigned long p = std::stoul(port.value());
            if (p > 65535) {
                throw std::out_of_range("port");
            }
            config.gateway.port = static_cast<uint16_t>(p);
        } catch (const std::logic_error&) {
            std::cerr << "mcp-bridge: invalid --port value '" << port.value() << "'" << std::endl;
            return 2;
        }
    }

    LOG_INFO("{} {} starting ({} backend(s) configured)", BRIDGE_IMPLEMENTATION_NAME, getVersionString(),
             config.backends.size());

    BackendCatalog catalog(config.backends);
    catalog.SetStatusListener([](const std::string& id, BackendStatus status) {
        LOG_INFO("Backend '{}' is now {}", id, backendStatusName(status));
    });
    ConnectionRegistry registry;
    ConnectionManager manager(catalog, registry, std::make_shared<ClientFactory>(),
                              GetEnvOrDefault("MCPBRIDGE_TRANSPORT_CONFIG", ""));

    Gateway gateway(manager);
    ProxyRuntimeState runtime;
    GatewayServer::Options opts;
    opts.address = config.gateway.address;
    opts.port = config.gateway.port;
    opts.scheme = config.gateway.scheme;
    opts.certFile = config.gateway.certFile;
    opts.keyFile = config.gateway.keyFile;
    opts.workerThreads = config.gateway.workerThreads;

    // Installed before any backend is spawned so an early Ctrl-C still shuts down cleanly
    boost::asio::io_context signals;
    boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);

    int exitCode = 0;
    try {
        GatewayServer server(opts, gateway, runtime);
        server.SetPortChangedCallback([&opts](uint16_t port) {
            // Printed on stdout so wrapper scripts can pick up an ephemeral port
            std::cout << "MCPBRIDGE_PORT=" << port << std::endl;
            LOG_INFO("Gateway endpoint: {}://{}:{}/mcp/<backendId>", opts.scheme, opts.address, port);
        });
        server.SetErrorHandler([](const std::string& err) { LOG_WARN("Gateway server: {}", err); });

        server.Start().get();
        manager.ConnectEnabled();

        stopSignals.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                LOG_INFO("Received signal {}, shutting down", signo);
            }
        });
        signals.run();

        server.Stop().get();
    } catch (const errors::BridgeError& e) {
        LOG_ERROR("Gateway failed ({}): {}", errors::errorKindName(e.kind()), e.what());
        exitCode = 1;
    }
    manager.ShutdownAll();
    for (const auto& state : catalog.List()) {
        auto stats = manager.GetToolCallStats(state.config.id);
        if (stats.totalCalls > 0) {
            LOG_INFO("Backend '{}': {} tool call(s), {} error(s), {} ms average", state.config.id, stats.totalCalls,
                     stats.errors, stats.totalDurationMs / stats.totalCalls);
        }
    }
    LOG_INFO("{} stopped", BRIDGE_IMPLEMENTATION_NAME);
    return exitCode;
}
