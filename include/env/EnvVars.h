//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely (string, flag, unsigned integer).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
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

// "1", "true", "TRUE", "yes" are true; "0", "false", "FALSE", "no" are false; anything else yields defaultValue.
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v == "1" || v == "true" || v == "TRUE" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "FALSE" || v == "no") return false;
    return defaultValue;
}

//==========================================================================================================
// ParseUint64
// Purpose: Strict decimal parse; rejects empty strings, signs, and trailing garbage.
// Returns:
//   Parsed value, or std::nullopt when the input is not a plain unsigned decimal number.
//==========================================================================================================
inline std::optional<uint64_t> ParseUint64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    uint64_t out = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (out > (UINT64_MAX - digit) / 10u) return std::nullopt;
        out = out * 10u + digit;
    }
    return out;
}
