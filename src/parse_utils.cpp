#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

namespace {

std::string lower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

bool all_digits(const std::string& v) {
    return !v.empty() &&
           std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool to_ull(const std::string& v, unsigned long long& out) {
    if (!all_digits(v))
        return false;
    try {
        out = std::stoull(v);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<unsigned int>(v);
}

size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    unsigned long long v = 0;
    if (!to_ull(value, v) || v < min || v > max)
        return 0;
    ok = true;
    return static_cast<size_t>(v);
}

size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok) {
    ok = false;
    std::string val = lower(value);
    static const struct {
        const char* suffix;
        unsigned long long mult;
    } units[] = {{"kb", 1ull << 10}, {"mb", 1ull << 20}, {"gb", 1ull << 30}, {"tb", 1ull << 40},
                 {"k", 1ull << 10},  {"m", 1ull << 20},  {"g", 1ull << 30},  {"t", 1ull << 40},
                 {"b", 1ull}};
    unsigned long long mult = 1;
    for (const auto& u : units) {
        std::string suf = u.suffix;
        if (val.size() > suf.size() && val.compare(val.size() - suf.size(), suf.size(), suf) == 0) {
            mult = u.mult;
            val.erase(val.size() - suf.size());
            break;
        }
    }
    unsigned long long base = 0;
    if (!to_ull(val, base) || base > ULLONG_MAX / mult)
        return 0;
    unsigned long long total = base * mult;
    if (total < min || total > max)
        return 0;
    ok = true;
    return static_cast<size_t>(total);
}

std::chrono::milliseconds parse_time_ms(const std::string& value, bool& ok) {
    ok = false;
    std::string val = lower(value);
    long long mult = 1;
    if (val.size() > 2 && val.compare(val.size() - 2, 2, "ms") == 0) {
        val.erase(val.size() - 2);
    } else if (val.size() > 1 && val.back() == 's') {
        mult = 1000;
        val.pop_back();
    } else if (val.size() > 1 && val.back() == 'm') {
        mult = 60 * 1000;
        val.pop_back();
    }
    unsigned long long n = 0;
    if (!to_ull(val, n) || n > static_cast<unsigned long long>(LLONG_MAX / mult))
        return std::chrono::milliseconds(0);
    ok = true;
    return std::chrono::milliseconds(static_cast<long long>(n) * mult);
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = lower(value);
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
