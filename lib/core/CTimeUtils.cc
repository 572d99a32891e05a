/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CTimeUtils.h>

#include <core/CLogger.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <time.h>

namespace rca {
namespace core {

core_t::TTime CTimeUtils::now() {
    return ::time(nullptr);
}

std::int64_t CTimeUtils::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string CTimeUtils::toIso8601(core_t::TTime t) {
    struct tm parts;
    if (::gmtime_r(&t, &parts) == nullptr) {
        LOG_ERROR(<< "Cannot convert time " << t << " to broken down UTC time");
        return std::string{};
    }
    char buf[32] = {'\0'};
    std::size_t length{::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &parts)};
    return std::string(buf, length);
}

bool CTimeUtils::fromIso8601(const std::string& dateTime, core_t::TTime& result) {
    struct tm parts;
    std::memset(&parts, 0, sizeof(parts));
    const char* end{::strptime(dateTime.c_str(), "%Y-%m-%dT%H:%M:%S", &parts)};
    if (end == nullptr) {
        return false;
    }

    // Skip fractional seconds
    if (*end == '.') {
        ++end;
        while (*end >= '0' && *end <= '9') {
            ++end;
        }
    }

    core_t::TTime offset{0};
    if (*end == 'Z') {
        ++end;
    } else if (*end == '+' || *end == '-') {
        int sign{*end == '-' ? -1 : 1};
        ++end;
        int hours{0};
        int minutes{0};
        int consumed{0};
        if (::sscanf(end, "%2d:%2d%n", &hours, &minutes, &consumed) != 2 &&
            ::sscanf(end, "%2d%2d%n", &hours, &minutes, &consumed) != 2) {
            return false;
        }
        end += consumed;
        offset = sign * (hours * constants::HOUR + minutes * constants::MINUTE);
    }
    if (*end != '\0') {
        return false;
    }

    result = ::timegm(&parts) - offset;
    return true;
}

std::int64_t CTimeUtils::toEpochMs(core_t::TTime t) {
    return static_cast<std::int64_t>(t) * 1000;
}

bool CTimeUtils::strptime(const std::string& format,
                          const std::string& dateTime,
                          core_t::TTime& preTime) {
    struct tm parts;
    std::memset(&parts, 0, sizeof(parts));
    const char* end{::strptime(dateTime.c_str(), format.c_str(), &parts)};
    if (end == nullptr || *end != '\0') {
        LOG_ERROR(<< "Unable to convert " << dateTime << " to " << format);
        return false;
    }
    preTime = ::timegm(&parts);
    return true;
}

std::string CTimeUtils::durationToString(core_t::TTime duration) {
    std::ostringstream result;
    if (duration < 0) {
        result << '-';
        duration = -duration;
    }
    core_t::TTime hours{duration / constants::HOUR};
    core_t::TTime minutes{(duration % constants::HOUR) / constants::MINUTE};
    core_t::TTime seconds{duration % constants::MINUTE};
    if (hours > 0) {
        result << hours << 'h';
    }
    if (hours > 0 || minutes > 0) {
        result << minutes << 'm';
    }
    result << seconds << 's';
    return result.str();
}
}
}
