//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members and environment-driven defaults.
//==========================================================================================================

#include "logging/Logger.h"

// Default level follows MCPBRIDGE_LOG_LEVEL when set, INFO otherwise
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("MCPBRIDGE_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
