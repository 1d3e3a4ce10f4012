//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS listener for the gateway using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include "mcpbridge/Gateway.h"

namespace mcpbridge {

//==========================================================================================================
// ProxyRuntimeState
// Purpose: Whether the gateway listener is running and on which port. Owned by the daemon and passed to
//          the server; read by anything that needs to advertise the endpoint.
//==========================================================================================================
class ProxyRuntimeState {
public:
    void SetRunning(uint16_t boundPort) {
        std::lock_guard<std::mutex> lk(mutex);
        running = true;
        port = boundPort;
    }

    void SetStopped() {
        std::lock_guard<std::mutex> lk(mutex);
        running = false;
    }

    bool IsRunning() const {
        std::lock_guard<std::mutex> lk(mutex);
        return running;
    }

    uint16_t Port() const {
        std::lock_guard<std::mutex> lk(mutex);
        return port;
    }

private:
    mutable std::mutex mutex;
    bool running{false};
    uint16_t port{0};
};

class GatewayServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port, TLS files and dispatch parallelism.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; 0 picks an ephemeral port
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   workerThreads: Threads that run Gateway::Handle (backend calls block there, not on the I/O thread)
    //   maxBodyBytes: Largest accepted request body
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{0};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        unsigned int workerThreads{4};
        std::size_t maxBodyBytes{8 * 1024 * 1024};
    };

    using PortChangedCallback = std::function<void(uint16_t port)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    GatewayServer(const Options& opts, Gateway& gateway, ProxyRuntimeState& state);
    ~GatewayServer();

    //==========================================================================================================
    // Binds the listener, records {running, port} in the runtime state, invokes the port-changed callback
    // once, and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that is ready once listening, or holds errors::BridgeError(Io) when binding fails.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops accepting, waits for in-flight dispatches, stops the I/O context and joins threads.
    //==========================================================================================================
    std::future<void> Stop();

    // Bound port (0 before Start)
    uint16_t GetPort() const;

    void SetPortChangedCallback(PortChangedCallback cb);
    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpbridge
