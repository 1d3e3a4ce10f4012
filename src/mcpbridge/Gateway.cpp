//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.cpp
// Purpose: MCP Streamable-HTTP dispatch: origin gate, envelope checks, method routing, response shaping
//==========================================================================================================

#include "mcpbridge/Gateway.h"

#include <cctype>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpbridge/errors/Errors.h"
#include "mcpbridge/version.h"

namespace mcpbridge {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> findHeader(const std::vector<std::pair<std::string, std::string>>& headers,
                                      const std::string& name) {
    for (const auto& [k, v] : headers) {
        if (iequals(k, name)) {
            return v;
        }
    }
    return std::nullopt;
}

bool isLocalhostOrigin(const std::string& origin) {
    static const char* const kPrefixes[] = {"http://localhost", "http://127.0.0.1", "http://[::1]"};
    for (const char* prefix : kPrefixes) {
        const std::string p(prefix);
        if (origin == p) {
            return true;
        }
        if (origin.size() > p.size() && origin.compare(0, p.size(), p) == 0 && origin[p.size()] == ':') {
            return true;
        }
    }
    return false;
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

GatewayResponse plainStatus(int status, const std::string& text) {
    GatewayResponse r;
    r.status = status;
    r.headers.emplace_back("Content-Type", "text/plain");
    r.body = text;
    return r;
}

// Envelope-level failures have no usable id; JSON-RPC says id null
GatewayResponse envelopeError(int code, const std::string& message) {
    GatewayResponse r;
    r.status = 400;
    r.headers.emplace_back("Content-Type", "application/json");
    r.body = CreateErrorResponse(nullptr, code, message)->Serialize();
    return r;
}

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

// data.kind carries the failure class so a caller can tell a timeout from a dead backend
std::unique_ptr<JSONRPCResponse> toolCallFailure(const JSONRPCId& id, const errors::BridgeError& e) {
    errors::McpError err;
    if (e.kind() == errors::ErrorKind::ServerNotFound) {
        err.code = JSONRPCErrorCodes::InvalidParams;
        err.message = e.what();
    } else {
        err.code = JSONRPCErrorCodes::InternalError;
        err.message = fmt::format("Tool call failed: {}", e.what());
    }
    JSONValue::Object data;
    data["kind"] = str(errors::errorKindName(e.kind()));
    err.data = JSONValue{std::move(data)};
    return errors::makeErrorResponse(id, err);
}

} // namespace

std::optional<std::string> GatewayRequest::Header(const std::string& name) const {
    return findHeader(headers, name);
}

std::optional<std::string> GatewayResponse::Header(const std::string& name) const {
    return findHeader(headers, name);
}

std::optional<std::string> PathBackendResolver::Resolve(const std::string& target) const {
    std::string path = target.substr(0, target.find('?'));
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    std::string id = path.substr(prefix.size());
    if (!id.empty() && id.back() == '/') {
        id.pop_back();
    }
    if (id.empty() || id.find('/') != std::string::npos) {
        return std::nullopt;
    }
    return id;
}

/////////////////////////////////////////// Protocol helpers ///////////////////////////////////////////
bool ValidateOrigin(const std::optional<std::string>& origin) {
    if (!origin.has_value() || origin->empty()) {
        return true;
    }
    if (isLocalhostOrigin(*origin)) {
        return true;
    }
    return startsWith(*origin, "tauri://") || startsWith(*origin, "https://tauri.");
}

std::string NegotiateVersion(const std::string& requested) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (requested == v) {
            return requested;
        }
    }
    return SUPPORTED_PROTOCOL_VERSIONS[0];
}

bool ClientAcceptsSse(const std::optional<std::string>& accept) {
    return accept.has_value() && accept->find("text/event-stream") != std::string::npos;
}

std::string CallerFromTarget(const std::string& target) {
    auto q = target.find('?');
    if (q == std::string::npos) {
        return "unknown";
    }
    const std::string query = target.substr(q + 1);
    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (startsWith(pair, "client=") && pair.size() > 7) {
            return pair.substr(7);
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
    return "unknown";
}

std::string NewSessionId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

JSONValue ToolsToJson(const std::vector<Tool>& tools) {
    JSONValue::Array arr;
    for (const auto& tool : tools) {
        JSONValue::Object entry;
        entry["name"] = str(tool.name);
        entry["description"] = str(tool.description.value_or(""));
        entry["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
        if (tool.title.has_value()) {
            entry["title"] = str(tool.title.value());
        }
        arr.push_back(std::make_shared<JSONValue>(std::move(entry)));
    }
    return JSONValue{std::move(arr)};
}

JSONValue CallToolResultToJson(const CallToolResult& result) {
    JSONValue::Array content;
    for (const auto& item : result.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    if (result.isError.has_value()) {
        obj["isError"] = std::make_shared<JSONValue>(result.isError.value());
    }
    return JSONValue{std::move(obj)};
}

/////////////////////////////////////////// Gateway ///////////////////////////////////////////
Gateway::Gateway(IGatewayBackends& backends, std::shared_ptr<IBackendResolver> resolver)
    : backends(backends), resolver(std::move(resolver)) {}

GatewayResponse Gateway::Handle(const GatewayRequest& request) {
    FUNC_SCOPE();
    auto backendId = resolver->Resolve(request.target);
    if (!backendId.has_value()) {
        return plainStatus(404, "Not Found");
    }
    if (request.verb != "POST") {
        // Server-initiated streaming (GET) is not offered
        GatewayResponse r = plainStatus(405, "Method Not Allowed");
        r.headers.emplace_back("Allow", "POST");
        return r;
    }
    auto origin = request.Header("Origin");
    if (!ValidateOrigin(origin)) {
        LOG_WARN("Gateway: rejected origin '{}'", origin.value_or(""));
        return plainStatus(403, "Origin not allowed: " + origin.value_or(""));
    }

    JSONValue doc;
    try {
        doc = ParseJSON(request.body);
    } catch (const std::runtime_error& e) {
        LOG_DEBUG("Gateway: unparseable body: {}", e.what());
        return envelopeError(JSONRPCErrorCodes::ParseError, "Parse error");
    }
    if (!doc.IsObject()) {
        return envelopeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: batching is not supported");
    }

    if (doc.Find("id") == nullptr) {
        // Notifications (and stray responses) are accepted without further processing
        LOG_DEBUG("Gateway: accepted notification {}", doc.FindString("method").value_or("<none>"));
        GatewayResponse accepted;
        accepted.status = 202;
        return accepted;
    }

    JSONRPCRequest rpc;
    std::unique_ptr<JSONRPCResponse> response;
    if (!rpc.FromValue(doc)) {
        return envelopeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
    }
    LOG_INFO("Gateway: {} -> {}", rpc.method, backendId.value());
    if (!backends.HasBackend(backendId.value())) {
        response = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InvalidParams,
                                       fmt::format("No server found with id '{}'", backendId.value()));
    } else {
        response = dispatch(backendId.value(), rpc, CallerFromTarget(request.target));
    }
    response->id = rpc.id;

    std::optional<std::string> sessionId;
    if (rpc.method == Methods::Initialize && !response->IsError()) {
        sessionId = NewSessionId();
    } else {
        sessionId = request.Header("Mcp-Session-Id");
    }

    GatewayResponse out;
    const std::string json = response->Serialize();
    if (ClientAcceptsSse(request.Header("Accept"))) {
        out.headers.emplace_back("Content-Type", "text/event-stream");
        out.headers.emplace_back("Cache-Control", "no-cache");
        out.body = "event: message\ndata: " + json + "\n\n";
    } else {
        out.headers.emplace_back("Content-Type", "application/json");
        out.body = json;
    }
    if (sessionId.has_value() && !sessionId->empty()) {
        out.headers.emplace_back("Mcp-Session-Id", sessionId.value());
    }
    return out;
}

std::unique_ptr<JSONRPCResponse> Gateway::dispatch(const std::string& backendId, const JSONRPCRequest& rpc,
                                                  const std::string& client) {
    if (rpc.method == Methods::Initialize) {
        return handleInitialize(rpc);
    }
    if (rpc.method == Methods::ListTools) {
        return handleToolsList(backendId, rpc);
    }
    if (rpc.method == Methods::CallTool) {
        return handleToolsCall(backendId, rpc, client);
    }
    return CreateErrorResponse(rpc.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + rpc.method);
}

std::unique_ptr<JSONRPCResponse> Gateway::handleInitialize(const JSONRPCRequest& rpc) {
    std::string requested;
    if (rpc.params.has_value()) {
        requested = rpc.params->FindString("protocolVersion").value_or("");
    }
    JSONValue::Object tools;
    tools["listChanged"] = std::make_shared<JSONValue>(false);
    JSONValue::Object caps;
    caps["tools"] = std::make_shared<JSONValue>(std::move(tools));
    JSONValue::Object info;
    info["name"] = str(BRIDGE_IMPLEMENTATION_NAME);
    info["version"] = str(getVersionString());
    JSONValue::Object result;
    result["protocolVersion"] = str(NegotiateVersion(requested));
    result["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
    result["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
    return std::make_unique<JSONRPCResponse>(rpc.id, JSONValue{std::move(result)});
}

std::unique_ptr<JSONRPCResponse> Gateway::handleToolsList(const std::string& backendId, const JSONRPCRequest& rpc) {
    std::vector<Tool> tools;
    if (backends.IsConnected(backendId)) {
        try {
            tools = backends.ListTools(backendId);
        } catch (const std::exception& e) {
            LOG_ERROR("Gateway: tools/list for '{}' failed: {}", backendId, e.what());
            return CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InternalError,
                                       fmt::format("Tool listing failed: {}", e.what()));
        }
    }
    JSONValue::Object result;
    result["tools"] = std::make_shared<JSONValue>(ToolsToJson(tools));
    return std::make_unique<JSONRPCResponse>(rpc.id, JSONValue{std::move(result)});
}

std::unique_ptr<JSONRPCResponse> Gateway::handleToolsCall(const std::string& backendId, const JSONRPCRequest& rpc,
                                                         const std::string& client) {
    if (!rpc.params.has_value() || !rpc.params->IsObject()) {
        return CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InvalidParams, "Missing params for tools/call");
    }
    auto name = rpc.params->FindString("name");
    if (!name.has_value()) {
        return CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InvalidParams, "Missing tool name in params");
    }
    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = rpc.params->Find("arguments")) {
        if (!a->IsNull()) {
            arguments = *a;
        }
    }
    if (!backends.IsConnected(backendId)) {
        return CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InvalidParams,
                                   fmt::format("Server '{}' is not connected", backendId));
    }
    try {
        auto result = backends.CallTool(backendId, name.value(), arguments, client);
        LOG_INFO("Gateway: {}/{} -> {}", backendId, name.value(), result.isError.value_or(false) ? "error" : "ok");
        return std::make_unique<JSONRPCResponse>(rpc.id, CallToolResultToJson(result));
    } catch (const errors::BridgeError& e) {
        LOG_ERROR("Gateway: {}/{} failed ({}): {}", backendId, name.value(), errors::errorKindName(e.kind()), e.what());
        return toolCallFailure(rpc.id, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Gateway: {}/{} failed: {}", backendId, name.value(), e.what());
        return CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InternalError,
                                   fmt::format("Tool call failed: {}", e.what()));
    }
}

} // namespace mcpbridge
