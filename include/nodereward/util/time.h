// NODEREWARD - Time Utilities
// Copyright (c) 2024 NODEREWARD Developers
// MIT License
//
// Wall-clock seconds for windows, buckets and delays, with a mock clock
// for tests.

#ifndef NODEREWARD_UTIL_TIME_H
#define NODEREWARD_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace nodereward {
namespace util {

using Seconds = std::chrono::seconds;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Format a Unix timestamp as 2024-01-01T00:00:00Z
std::string FormatISO8601(int64_t timestamp);

/// Human readable duration, e.g. "1d 2h 3m 4s"
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Enable mock time; GetTime() returns the mock value from now on
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

int64_t GetMockTime();

/// Enables mock time at a fixed timestamp for the lifetime of the object
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t timestamp) {
        SetMockTime(timestamp);
        EnableMockTime();
    }
    ~ScopedMockTime() { DisableMockTime(); }

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;
};

} // namespace util
} // namespace nodereward

#endif // NODEREWARD_UTIL_TIME_H
