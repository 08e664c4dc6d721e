#include "time_utils.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms.count()));
    return std::string(out);
}

std::string format_duration_short(std::chrono::milliseconds dur) {
    long long total_ms = dur.count();
    if (total_ms < 0)
        total_ms = 0;
    if (total_ms < 1000)
        return std::to_string(total_ms) + "ms";
    long long total = total_ms / 1000;
    long long s = total % 60;
    long long m = (total / 60) % 60;
    long long h = total / 3600;
    std::string out;
    if (h > 0)
        out += std::to_string(h) + "h";
    if (m > 0 || h > 0)
        out += std::to_string(m) + "m";
    out += std::to_string(s) + "s";
    return out;
}
