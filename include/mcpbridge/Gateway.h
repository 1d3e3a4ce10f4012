//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.h
// Purpose: MCP Streamable-HTTP request dispatch for per-backend endpoints (socket-free)
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mcpbridge/JSONRPCTypes.h"
#include "mcpbridge/Protocol.h"

namespace mcpbridge {

//==========================================================================================================
// GatewayRequest
// Purpose: One inbound HTTP request as seen by the dispatcher.
// Fields:
//   verb: HTTP method ("POST", "GET", ...).
//   target: Request target including any query string.
//   headers: Name/value pairs; names compare case-insensitively.
//   body: Raw request body.
//==========================================================================================================
struct GatewayRequest {
    std::string verb;
    std::string target;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    std::optional<std::string> Header(const std::string& name) const;
};

struct GatewayResponse {
    int status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    std::optional<std::string> Header(const std::string& name) const;
};

//==========================================================================================================
// IBackendResolver
// Purpose: Maps a request target to a backend id; the addressing scheme lives here only.
//==========================================================================================================
class IBackendResolver {
public:
    virtual ~IBackendResolver() = default;

    //==========================================================================================================
    // Resolve
    // Args:
    //   target: Request target (path plus optional query).
    // Returns:
    //   Backend id, or std::nullopt when the target is not a gateway endpoint (HTTP 404).
    //==========================================================================================================
    virtual std::optional<std::string> Resolve(const std::string& target) const = 0;
};

//==========================================================================================================
// PathBackendResolver
// Purpose: Per-backend addressing: "/mcp/{backendId}" (a trailing slash is tolerated).
//==========================================================================================================
class PathBackendResolver : public IBackendResolver {
public:
    explicit PathBackendResolver(std::string prefix = "/mcp/") : prefix(std::move(prefix)) {}
    std::optional<std::string> Resolve(const std::string& target) const override;

private:
    std::string prefix;
};

//==========================================================================================================
// IGatewayBackends
// Purpose: What the dispatcher needs from the connection layer.
// Notes:
//   - ListTools/CallTool block until the backend answers and report failures as errors::BridgeError.
//   - client names the calling application ("unknown" when it did not identify itself).
//==========================================================================================================
class IGatewayBackends {
public:
    virtual ~IGatewayBackends() = default;
    virtual bool HasBackend(const std::string& id) const = 0;
    virtual bool IsConnected(const std::string& id) const = 0;
    virtual std::vector<Tool> ListTools(const std::string& id) = 0;
    virtual CallToolResult CallTool(const std::string& id, const std::string& name, const JSONValue& arguments,
                                    const std::string& client) = 0;
};

/////////////////////////////////////////// Protocol helpers ///////////////////////////////////////////
//==========================================================================================================
// ValidateOrigin
// Purpose: Browser origin gate.
// Returns:
//   true for an absent or empty Origin, http://localhost, http://127.0.0.1 or http://[::1] (each
//   optionally followed by ":port"), and app webview origins ("tauri://..." or "https://tauri...").
//==========================================================================================================
bool ValidateOrigin(const std::optional<std::string>& origin);

//==========================================================================================================
// NegotiateVersion
// Purpose: Echo a supported protocol version, otherwise answer with the newest supported one.
//==========================================================================================================
std::string NegotiateVersion(const std::string& requested);

// True when the Accept header lists text/event-stream
bool ClientAcceptsSse(const std::optional<std::string>& accept);

// Caller identity from the "client" query parameter of the endpoint URL, "unknown" when absent or empty
std::string CallerFromTarget(const std::string& target);

// Fresh random (v4) UUID string for Mcp-Session-Id
std::string NewSessionId();

// Tools as listed to gateway callers: name, description ("" when absent), inputSchema, title if present
JSONValue ToolsToJson(const std::vector<Tool>& tools);

// Result object of tools/call: {content: [...], isError?}
JSONValue CallToolResultToJson(const CallToolResult& result);

//==========================================================================================================
// Gateway
// Purpose: Stateless translation of HTTP requests into backend lookups and client calls.
// Notes:
//   - Handle() never throws; every syntactically valid JSON-RPC request gets a JSON-RPC response.
//   - Raw HTTP errors: 404 unknown path, 405 non-POST, 403 origin, 400 unparseable/invalid envelope.
//==========================================================================================================
class Gateway {
public:
    explicit Gateway(IGatewayBackends& backends,
                     std::shared_ptr<IBackendResolver> resolver = std::make_shared<PathBackendResolver>());

    GatewayResponse Handle(const GatewayRequest& request);

private:
    std::unique_ptr<JSONRPCResponse> dispatch(const std::string& backendId, const JSONRPCRequest& rpc,
                                              const std::string& client);
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& rpc);
    std::unique_ptr<JSONRPCResponse> handleToolsList(const std::string& backendId, const JSONRPCRequest& rpc);
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const std::string& backendId, const JSONRPCRequest& rpc,
                                                     const std::string& client);

    IGatewayBackends& backends;
    std::shared_ptr<IBackendResolver> resolver;
};

} // namespace mcpbridge
