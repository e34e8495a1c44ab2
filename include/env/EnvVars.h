//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Cross-platform helpers to read environment variables safely.
//==========================================================================================================
#pragma once
#include <cctype>
#include <cstdlib>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set and non-empty) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return defaultValue;
    }
    return std::string(v);
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Reads a boolean-ish environment variable ("1", "true", "yes", "on", case-insensitive).
// Args:
//   name: Environment variable name.
//   defaultValue: Value when the variable is unset or empty.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    std::string v = GetEnvOrDefault(name, std::string());
    if (v.empty()) {
        return defaultValue;
    }
    for (auto& c : v) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return v == "1" || v == "true" || v == "yes" || v == "on";
}
