//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthCallbackListener.hpp
// Purpose: Ephemeral loopback listener that captures one OAuth authorization-code redirect
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace mcpbridge {

//==========================================================================================================
// OAuthCallbackResult
// Purpose: Successful redirect parameters.
//==========================================================================================================
struct OAuthCallbackResult {
    std::string code;
    std::string state;
};

//==========================================================================================================
// OAuthCallbackListener
// Purpose: Serves GET /oauth/callback on 127.0.0.1:<ephemeral> and resolves a single future with the
//          outcome of the first callback request, or with a timeout failure.
// Notes:
//   - The future is resolved at most once; failures are errors::BridgeError(OAuth).
//   - Requests to other paths get 404 and do not resolve anything.
//   - The listener stops accepting once the outcome is decided. Retrying means starting a new listener.
//==========================================================================================================
class OAuthCallbackListener {
public:
    struct Options {
        std::string address{"127.0.0.1"};
        std::string path{"/oauth/callback"};
        std::chrono::seconds timeout{120};
    };

    struct Started {
        uint16_t port;
        std::future<OAuthCallbackResult> result;
    };

    OAuthCallbackListener();
    explicit OAuthCallbackListener(const Options& opts);
    ~OAuthCallbackListener();

    OAuthCallbackListener(const OAuthCallbackListener&) = delete;
    OAuthCallbackListener& operator=(const OAuthCallbackListener&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Binds an ephemeral port and starts serving in the background.
    // Returns:
    //   The bound port and the single-resolution completion handle.
    // Throws:
    //   errors::BridgeError(Io) when binding fails or the listener was already started.
    //==========================================================================================================
    Started Start();

    // Redirect URI to register with the authorization server (valid after Start)
    std::string RedirectUri() const;

    // Stops serving and joins the I/O thread; an unresolved handle fails with "OAuth callback listener stopped"
    void Stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpbridge
