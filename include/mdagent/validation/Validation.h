//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Opt-in result shape validation mode for the dispatcher (Off by default)
//==========================================================================================================

#pragma once

#include <string>

namespace mdagent {
namespace validation {

// Validation modes for runtime shape checks
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

// Utility to convert to/from string for config friendliness
inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Off:
        default: return "Off";
    }
}

inline ValidationMode parseMode(const std::string& s) {
    if (s == "strict" || s == "Strict" || s == "STRICT") return ValidationMode::Strict;
    return ValidationMode::Off;
}

} // namespace validation
} // namespace mdagent
