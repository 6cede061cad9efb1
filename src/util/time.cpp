// EQUORUM - Time Utilities Implementation
// Copyright (c) 2024 EQUORUM Developers
// MIT License

#include "equorum/util/time.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <limits>
#include <sstream>

namespace equorum {
namespace util {

// ============================================================================
// Mock Time State
// ============================================================================

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

void EnableMockTime() {
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

void AdvanceMockTime(int64_t seconds) {
    g_mockTime.fetch_add(seconds);
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatISO8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm tmBuf;
    gmtime_r(&t, &tmBuf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmBuf);
    return buf;
}

std::string FormatDuration(int64_t seconds) {
    if (seconds == 0) {
        return "0s";
    }

    std::ostringstream oss;
    if (seconds < 0) {
        oss << '-';
        seconds = -seconds;
    }

    int64_t days = seconds / 86400;
    int64_t hours = (seconds % 86400) / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    bool started = false;
    if (days > 0) {
        oss << days << "d ";
        started = true;
    }
    if (started || hours > 0) {
        oss << hours << "h ";
        started = true;
    }
    if (started || minutes > 0) {
        oss << minutes << "m ";
    }
    oss << secs << 's';
    return oss.str();
}

std::optional<int64_t> ParseDuration(const std::string& str) {
    size_t pos = 0;
    while (pos < str.size() && std::isspace(static_cast<unsigned char>(str[pos]))) {
        ++pos;
    }

    size_t digitsStart = pos;
    int64_t value = 0;
    while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
        int digit = str[pos] - '0';
        if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
        ++pos;
    }
    if (pos == digitsStart) {
        return std::nullopt;
    }

    int64_t multiplier = 1;
    if (pos < str.size()) {
        switch (std::tolower(static_cast<unsigned char>(str[pos]))) {
            case 's': multiplier = 1; break;
            case 'm': multiplier = 60; break;
            case 'h': multiplier = 3600; break;
            case 'd': multiplier = 86400; break;
            case 'w': multiplier = 7 * 86400; break;
            default: return std::nullopt;
        }
        ++pos;
    }

    while (pos < str.size() && std::isspace(static_cast<unsigned char>(str[pos]))) {
        ++pos;
    }
    if (pos != str.size()) {
        return std::nullopt;
    }
    if (value > std::numeric_limits<int64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

} // namespace util
} // namespace equorum
