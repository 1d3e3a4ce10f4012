//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, version table and method names used by the bridge
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <array>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace mcpbridge {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Version the bridge announces when it acts as a client towards a backend
constexpr const char* CLIENT_PROTOCOL_VERSION = "2025-03-26";

// Versions the gateway recognizes, newest first
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05"
};

// Name used for clientInfo towards backends and serverInfo towards gateway callers
constexpr const char* BRIDGE_IMPLEMENTATION_NAME = "mcp-bridge";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
};

// Capabilities declared by a backend in its initialize result
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
    std::unordered_map<std::string, JSONValue> experimental;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// Tool
// Purpose: Tool descriptor discovered from a backend.
// Fields:
//   name/title/description/inputSchema: As reported by the backend's tools/list.
//   backendId/backendName: Owning backend; stamped by the connection layer, never sent upstream.
//==========================================================================================================
struct Tool {
    std::string name;
    std::optional<std::string> title;
    std::optional<std::string> description;
    JSONValue inputSchema;
    std::string backendId;
    std::string backendName;
};

struct CallToolResult {
    std::vector<JSONValue> content;
    std::optional<bool> isError;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

} // namespace mcpbridge
