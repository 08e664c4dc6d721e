#include "test_common.hpp"
#include <climits>

TEST_CASE("parse_uint helper valid") {
    bool ok = false;
    REQUIRE(parse_uint("2222", 1, 65535, ok) == 2222);
    REQUIRE(ok);
}

TEST_CASE("parse_uint helper invalid") {
    bool ok = true;
    parse_uint("bad", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_uint("-1", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_uint("22x", 0, 100, ok);
    REQUIRE_FALSE(ok);
    parse_uint("0", 1, 65535, ok);
    REQUIRE_FALSE(ok);
    parse_uint("65536", 1, 65535, ok);
    REQUIRE_FALSE(ok);
    parse_uint("", 0, 10, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_size_t helper range") {
    bool ok = false;
    REQUIRE(parse_size_t("5", 1, 50, ok) == 5);
    REQUIRE(ok);
    parse_size_t("100", 0, 50, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("99999999999999999999999", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units") {
    bool ok = false;
    REQUIRE(parse_bytes("1KB", 0, SIZE_MAX, ok) == 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2MB", 0, SIZE_MAX, ok) == 2 * 1024 * 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("3G", 0, SIZE_MAX, ok) == 3ull * 1024 * 1024 * 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("512", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    REQUIRE(parse_bytes("64b", 0, SIZE_MAX, ok) == 64);
    REQUIRE(ok);
    parse_bytes("5XB", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
    parse_bytes("2k", 0, 1024, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_time_ms units") {
    bool ok = false;
    REQUIRE(parse_time_ms("250ms", ok) == std::chrono::milliseconds(250));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("750", ok) == std::chrono::milliseconds(750));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("2s", ok) == std::chrono::milliseconds(2000));
    REQUIRE(ok);
    REQUIRE(parse_time_ms("1m", ok) == std::chrono::milliseconds(60000));
    REQUIRE(ok);
    parse_time_ms("soon", ok);
    REQUIRE_FALSE(ok);
    parse_time_ms("-5s", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bool accepts config spellings") {
    bool ok = false;
    REQUIRE(parse_bool("", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("Yes", ok));
    REQUIRE(ok);
    REQUIRE(parse_bool("on", ok));
    REQUIRE_FALSE(parse_bool("false", ok));
    REQUIRE(ok);
    REQUIRE_FALSE(parse_bool("0", ok));
    REQUIRE(ok);
    parse_bool("maybe", ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("format_duration_short renders compact durations") {
    using std::chrono::milliseconds;
    REQUIRE(format_duration_short(milliseconds(420)) == "420ms");
    REQUIRE(format_duration_short(milliseconds(3000)) == "3s");
    REQUIRE(format_duration_short(milliseconds(62000)) == "1m2s");
    REQUIRE(format_duration_short(milliseconds(3723000)) == "1h2m3s");
}

TEST_CASE("timestamp has millisecond precision") {
    std::string ts = timestamp();
    REQUIRE(ts.size() == 23);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == ' ');
    REQUIRE(ts[19] == '.');
}
