// NODEREWARD - Time Utilities Implementation
// Copyright (c) 2024 NODEREWARD Developers
// MIT License

#include "nodereward/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace nodereward {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Unix Timestamps
// ============================================================================

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t time = static_cast<std::time_t>(timestamp);
    std::tm tmBuf;
    gmtime_r(&time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string FormatDuration(int64_t total) {
    if (total < 0) {
        return "-" + FormatDuration(-total);
    }
    if (total == 0) {
        return "0s";
    }

    int64_t days = total / SECONDS_PER_DAY;
    total %= SECONDS_PER_DAY;
    int64_t hours = total / SECONDS_PER_HOUR;
    total %= SECONDS_PER_HOUR;
    int64_t minutes = total / SECONDS_PER_MINUTE;
    int64_t seconds = total % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0) oss << seconds << "s";

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (g_mockTime.load() == 0) {
        g_mockTime.store(std::chrono::duration_cast<Seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace nodereward
