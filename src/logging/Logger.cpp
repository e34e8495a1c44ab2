//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members. Initial level honors DESKAUTH_LOG_LEVEL when set.
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("DESKAUTH_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
