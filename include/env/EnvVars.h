//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely with typed fallbacks.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUint64
// Purpose: Reads an unsigned integer environment variable.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when the variable is unset, empty or not a valid unsigned number.
// Returns:
//   Parsed value or defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUint64(const char* name, uint64_t defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty() || raw[0] == '-') {
        return defaultValue;
    }
    try {
        std::size_t used = 0;
        unsigned long long v = std::stoull(raw, &used);
        if (used != raw.size()) {
            return defaultValue;
        }
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}
