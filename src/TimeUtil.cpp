#include "TimeUtil.h"
#include <chrono>
#include <cstdio>
#include <ctime>

int64_t nowUtc() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t parseIsoUtc(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;
    double second = 0.0;
    char sep = 0;
    int n = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%lf",
                        &year, &month, &day, &sep, &hour, &minute, &second);
    if (n == 3) {
        hour = minute = 0;
        second = 0.0;
    } else if (n != 7 || (sep != 'T' && sep != ' ')) {
        return -1;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second >= 61.0)
        return -1;

    // 时区偏移 (+hh:mm / -hh:mm), Z 或无后缀按 UTC
    int offsetSec = 0;
    auto tz = text.find_last_of("+-");
    if (n == 7 && tz != std::string::npos && tz > 10) {
        int oh = 0, om = 0;
        if (std::sscanf(text.c_str() + tz + 1, "%2d:%2d", &oh, &om) >= 1) {
            offsetSec = (oh * 3600 + om * 60) * (text[tz] == '-' ? -1 : 1);
        }
    }

    std::tm tmUtc{};
    tmUtc.tm_year = year - 1900;
    tmUtc.tm_mon = month - 1;
    tmUtc.tm_mday = day;
    tmUtc.tm_hour = hour;
    tmUtc.tm_min = minute;
    tmUtc.tm_sec = static_cast<int>(second);
    return static_cast<int64_t>(timegm(&tmUtc)) - offsetSec;
}

// 无法表示的时间返回空串
static std::string formatUtc(int64_t epochSeconds, const char* fmt) {
    std::time_t t = static_cast<std::time_t>(epochSeconds);
    std::tm tmUtc{};
    if (gmtime_r(&t, &tmUtc) == nullptr) return std::string();
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tmUtc);
    return std::string(buf, n);
}

std::string formatIsoUtc(int64_t epochSeconds) {
    return formatUtc(epochSeconds, "%Y-%m-%dT%H:%M:%SZ");
}

std::string formatDateUtc(int64_t epochSeconds) {
    return formatUtc(epochSeconds, "%Y-%m-%d");
}
