#include "test_common.hpp"

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser switches never take positionals") {
    const char* argv[] = {"prog", "--verify", "host", "/incoming"};
    ArgParser parser(4, const_cast<char**>(argv), {"--verify"});
    REQUIRE(parser.has_flag("--verify"));
    REQUIRE(parser.get_option("--verify").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"host", "/incoming"});
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-p2222", "-m", "rsync", "-L=debug"};
    ArgParser parser(6, const_cast<char**>(argv), {"--help", "--port", "--mode", "--log-level"},
                     {{'h', "--help"}, {'p', "--port"}, {'m', "--mode"}, {'L', "--log-level"}},
                     {"--port", "--mode", "--log-level"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--port") == "2222");
    REQUIRE(parser.get_option("--mode") == "rsync");
    REQUIRE(parser.get_option("--log-level") == "debug");
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser stacked short flags") {
    const char* argv[] = {"prog", "-nvp", "22"};
    ArgParser parser(3, const_cast<char**>(argv), {"--dry-run", "--verbose", "--port"},
                     {{'n', "--dry-run"}, {'v', "--verbose"}, {'p', "--port"}}, {"--port"});
    REQUIRE(parser.has_flag("--dry-run"));
    REQUIRE(parser.has_flag("--verbose"));
    REQUIRE(parser.get_option("--port") == "22");
}

TEST_CASE("ArgParser unknown flag detection") {
    const char* argv[] = {"prog", "--foo"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"});
    REQUIRE_FALSE(parser.has_flag("--foo"));
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--foo");
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "-x");
}

TEST_CASE("ArgParser value option at end is missing its value") {
    const char* argv[] = {"prog", "host", "--lock-file"};
    ArgParser parser(3, const_cast<char**>(argv), {"--lock-file"}, {}, {"--lock-file"});
    REQUIRE_FALSE(parser.has_flag("--lock-file"));
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--lock-file"});
}

TEST_CASE("ArgParser double dash ends options") {
    const char* argv[] = {"prog", "--dry-run", "--", "--odd-name", "-", "x"};
    ArgParser parser(6, const_cast<char**>(argv), {"--dry-run"});
    REQUIRE(parser.has_flag("--dry-run"));
    REQUIRE(parser.unknown_flags().empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"--odd-name", "-", "x"});
}

TEST_CASE("ArgParser log file option") {
    const char* argv[] = {"prog", "--log-file", "my.log", "path"};
    ArgParser parser(4, const_cast<char**>(argv), {"--log-file"}, {}, {"--log-file"});
    REQUIRE(parser.has_flag("--log-file"));
    REQUIRE(parser.get_option("--log-file") == "my.log");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "path");
}
