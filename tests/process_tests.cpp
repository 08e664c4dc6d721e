#include "test_common.hpp"

TEST_CASE("run_process reports exit status") {
    REQUIRE(procutil::run_process({"true"}).ok());
    auto res = procutil::run_process({"sh", "-c", "exit 7"});
    REQUIRE_FALSE(res.ok());
    REQUIRE(res.exit_code == 7);
    REQUIRE(res.term_signal == 0);
}

TEST_CASE("run_process reports a missing executable as 127") {
    auto res = procutil::run_process({"/nonexistent/remotesync-client"});
    REQUIRE(res.exit_code == 127);
}

TEST_CASE("run_process reports the terminating signal") {
    auto res = procutil::run_process({"sh", "-c", "kill -9 $$"});
    REQUIRE(res.exit_code == -1);
    REQUIRE(res.term_signal == SIGKILL);
}

TEST_CASE("run_process captures stdout") {
    procutil::ProcessOptions opts;
    opts.capture_stdout = true;
    auto res = procutil::run_process({"printf", "%s\\n%s\\n", "12 a.txt", "3 b/c.txt"}, opts);
    REQUIRE(res.ok());
    REQUIRE(res.output == "12 a.txt\n3 b/c.txt\n");
}

TEST_CASE("run_process captures output larger than a pipe buffer") {
    procutil::ProcessOptions opts;
    opts.capture_stdout = true;
    auto res = procutil::run_process({"sh", "-c", "i=0; while [ $i -lt 20000 ]; do "
                                                  "echo 0123456789; i=$((i+1)); done"},
                                     opts);
    REQUIRE(res.ok());
    REQUIRE(res.output.size() == 20000u * 11u);
}

TEST_CASE("run_process appends stderr to a log") {
    fs::path dir = make_temp_dir("process_stderr");
    fs::path log = dir / "tool.log";
    procutil::ProcessOptions opts;
    opts.stderr_log = log;
    procutil::run_process({"sh", "-c", "echo first >&2"}, opts);
    procutil::run_process({"sh", "-c", "echo second >&2"}, opts);
    REQUIRE(read_lines(log) == std::vector<std::string>{"first", "second"});
    FS_REMOVE_ALL(dir);
}

TEST_CASE("run_process gives the child an empty stdin") {
    procutil::ProcessOptions opts;
    opts.capture_stdout = true;
    auto res = procutil::run_process({"sh", "-c", "cat; echo done"}, opts);
    REQUIRE(res.output == "done\n");
}

TEST_CASE("run_process rejects an empty command") {
    REQUIRE_THROWS_AS(procutil::run_process({}), std::invalid_argument);
}

TEST_CASE("shell_quote leaves plain words alone") {
    REQUIRE(procutil::shell_quote("/keys/id_rsa") == "/keys/id_rsa");
    REQUIRE(procutil::shell_quote("user@host:22") == "user@host:22");
    REQUIRE(procutil::shell_quote("") == "''");
    REQUIRE(procutil::shell_quote("a b") == "'a b'");
    REQUIRE(procutil::shell_quote("it's") == "'it'\\''s'");
    REQUIRE(procutil::shell_quote("/in/*") == "'/in/*'");
}

TEST_CASE("format_command joins quoted arguments") {
    REQUIRE(procutil::format_command({"ssh", "-p", "22", "host", "rm -rf -- '/in'/*"}) ==
            "ssh -p 22 host 'rm -rf -- '\\''/in'\\''/*'");
}
