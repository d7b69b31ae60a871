/**
 * @file types.hpp
 * @brief Core type definitions for Tandem
 *
 * Media positions travel as double seconds (the unit every player API
 * speaks); wall-clock instants are int64_t milliseconds since the Unix
 * epoch so they can be compared across machines.
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>

namespace tandem {

// ============================================================================
// Time Types
// ============================================================================

/// Wall-clock instant in milliseconds since the Unix epoch
using EpochMs = int64_t;

/// Media position in seconds
using Seconds = double;

/// Scheduler delays and intervals
using Milliseconds = std::chrono::milliseconds;

/// Milliseconds per second, for epoch <-> media conversions
constexpr double kMsPerSecond = 1000.0;

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    InvalidArgument,    // Caller passed a value outside the contract
    NotFound,           // Participant or queue item does not exist
    FileNotFound,       // Config file could not be opened
    InvalidData,        // Malformed wire payload, snapshot or config
};

/// Convert ErrorCode to string
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::InvalidData: return "Invalid data";
        default: return "Unknown error code";
    }
}

// ============================================================================
// Session Role
// ============================================================================

/**
 * @brief Role of the local participant in a watch session
 */
enum class Role : uint8_t {
    Uninitialized,  // No host assignment received yet
    Host,           // Authoritative: broadcasts snapshots and events
    Peer,           // Follower: reconciles to the host
};

/// Convert Role to string
inline const char* roleToString(Role role) {
    switch (role) {
        case Role::Uninitialized: return "Uninitialized";
        case Role::Host: return "Host";
        case Role::Peer: return "Peer";
        default: return "Unknown";
    }
}

} // namespace tandem
