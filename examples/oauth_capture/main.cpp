//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Prints a loopback redirect URI and waits for one OAuth authorization-code callback
//==========================================================================================================

#include <chrono>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpbridge/OAuthCallbackListener.hpp"
#include "mcpbridge/errors/Errors.h"

using namespace mcpbridge;

static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        std::string a = argv[i];
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    Logger::setLogLevelFromString(GetEnvOrDefault("MCPBRIDGE_LOG_LEVEL", "WARN"));

    OAuthCallbackListener::Options opts;
    if (auto t = getArgValue(argc, argv, "--timeout"); t.has_value()) {
        try {
            opts.timeout = std::chrono::seconds(std::stoul(t.value()));
        } catch (const std::logic_error&) {
            std::cerr << "invalid --timeout value '" << t.value() << "'" << std::endl;
            return 2;
        }
    }

    OAuthCallbackListener listener(opts);
    try {
        auto started = listener.Start();
        std::cout << "redirect_uri=" << listener.RedirectUri() << std::endl;
        auto result = started.result.get();
        std::cout << "code=" << result.code << "\nstate=" << result.state << std::endl;
    } catch (const errors::BridgeError& e) {
        std::cerr << errors::errorKindName(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
