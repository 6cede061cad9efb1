// EQUORUM - Time Utilities
// Copyright (c) 2024 EQUORUM Developers
// MIT License
//
// Wall-clock access for the governance engine, with:
// - Mock time for testing
// - Duration parsing ("48h", "7d") and formatting
// - ISO 8601 rendering of Unix timestamps

#ifndef EQUORUM_UTIL_TIME_H
#define EQUORUM_UTIL_TIME_H

#include <cstdint>
#include <optional>
#include <string>

namespace equorum {
namespace util {

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix time in seconds (mock time when enabled)
int64_t GetTime();

// ============================================================================
// Mock Time (for testing)
// ============================================================================

void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

/// Set mock time (only takes effect while mock time is enabled)
void SetMockTime(int64_t timestamp);

/// Advance mock time by a number of seconds
void AdvanceMockTime(int64_t seconds);

/// Get mock time (0 if never set)
int64_t GetMockTime();

// ============================================================================
// Formatting and Parsing
// ============================================================================

/// "2024-01-15T10:30:00Z"
std::string FormatISO8601(int64_t timestamp);

/// Compact duration, e.g. "2d 3h 0m 5s"; "0s" for zero
std::string FormatDuration(int64_t seconds);

/**
 * Parse a duration.
 *
 * Accepts a non-negative integer with an optional unit suffix:
 * s (seconds, default), m (minutes), h (hours), d (days), w (weeks).
 * @return seconds, or nullopt on malformed or negative input
 */
std::optional<int64_t> ParseDuration(const std::string& str);

} // namespace util
} // namespace equorum

#endif // EQUORUM_UTIL_TIME_H
