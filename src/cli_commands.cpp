#include <iostream>

#include "cli_commands.hpp"
#include "help_text.hpp"
#include "logger.hpp"
#include "sync_errors.hpp"
#include "sync_runner.hpp"
#include "version.hpp"

namespace cli {

namespace {
int report(const SyncError& e) {
    log_error(e.what(), {{"exit_code", std::to_string(e.exit_code())}});
    std::cerr << e.what() << std::endl;
    return e.exit_code();
}
} // namespace

std::optional<int> handle_info(const Options& opts, std::ostream& os) {
    if (opts.show_help) {
        print_help(opts.exec_path.empty() ? "remotesync" : opts.exec_path.c_str(), os);
        return 0;
    }
    if (opts.print_version) {
        os << REMOTESYNC_VERSION << "\n";
        return 0;
    }
    return std::nullopt;
}

std::optional<int> handle_dry_run(const Options& opts, std::ostream& os) {
    if (!opts.dry_run)
        return std::nullopt;
    try {
        print_plan(opts, os);
    } catch (const SyncError& e) {
        return report(e);
    }
    return 0;
}

void setup_logging(const Options& opts) {
    const LoggingOptions& lg = opts.logging;
    set_log_level(lg.log_level);
    set_json_logging(lg.json_log);
    set_log_compression(lg.compress_logs);
    if (!lg.log_file.empty())
        init_logger(lg.log_file, lg.log_level, lg.max_log_size, lg.rotate_count);
    if (lg.use_syslog)
        init_syslog(lg.syslog_facility);
}

int handle_sync_run(const Options& opts) {
    try {
        run_sync(opts);
    } catch (const SyncError& e) {
        int rc = report(e);
        flush_logger();
        return rc;
    }
    flush_logger();
    return RC_OK;
}

int run(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_options(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << e.what() << "\n";
        std::cerr << "Try '" << (argc > 0 ? argv[0] : "remotesync") << " --help'\n";
        return e.exit_code();
    }
    if (auto rc = handle_info(opts); rc)
        return *rc;
    setup_logging(opts);
    int rc;
    if (auto dry = handle_dry_run(opts); dry)
        rc = *dry;
    else
        rc = handle_sync_run(opts);
    shutdown_logger();
    return rc;
}

} // namespace cli
