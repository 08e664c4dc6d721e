#include <climits>
#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "sync_errors.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> kValueFlags{
    "--mode",          "--lock-file",      "--lock-dir",     "--marker-name",
    "--sentinel-path", "--sentinel-value", "--port",         "--cipher",
    "--sftp-bin",      "--ssh-bin",        "--rsync-bin",    "--tool-log",
    "--kill-grace",    "--log-file",       "--log-level",    "--max-log-size",
    "--log-rotate",    "--syslog-facility", "--config-yaml", "--config-json"};

const std::set<std::string> kSwitches{"--no-purge",   "--verify",        "--dry-run",
                                      "--verbose",    "--json-log",      "--compress-logs",
                                      "--syslog",     "--silent",        "--help",
                                      "--version"};

const std::map<char, std::string> kShortMap{
    {'m', "--mode"},    {'p', "--port"},        {'n', "--dry-run"},     {'l', "--log-file"},
    {'L', "--log-level"}, {'v', "--verbose"},   {'s', "--silent"},      {'y', "--config-yaml"},
    {'j', "--config-json"}, {'h', "--help"},    {'V', "--version"}};

std::set<std::string> known_flags() {
    std::set<std::string> known = kValueFlags;
    known.insert(kSwitches.begin(), kSwitches.end());
    return known;
}

void load_config_files(const ArgParser& parser, std::map<std::string, std::string>& cfg_opts,
                       fs::path& config_file) {
    if (parser.has_flag("--config-yaml")) {
        std::string cfg = parser.get_option("--config-yaml");
        if (cfg.empty())
            throw UsageError("--config-yaml requires a file");
        std::string err;
        if (!load_yaml_config(cfg, cfg_opts, err))
            throw UsageError("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    if (parser.has_flag("--config-json")) {
        std::string cfg = parser.get_option("--config-json");
        if (cfg.empty())
            throw UsageError("--config-json requires a file");
        std::string err;
        if (!load_json_config(cfg, cfg_opts, err))
            throw UsageError("Failed to load config " + cfg + ": " + err);
        config_file = cfg;
    }
    const std::set<std::string> known = known_flags();
    for (const auto& kv : cfg_opts) {
        const std::string& key = kv.first;
        if (!known.count(key) || key == "--config-yaml" || key == "--config-json" ||
            key == "--help" || key == "--version")
            throw UsageError("Unknown configuration key: " + key.substr(2));
    }
}

} // namespace

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, known_flags(), kShortMap, kValueFlags);
    if (!parser.unknown_flags().empty())
        throw UsageError("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw UsageError(parser.missing_values().front() + " requires a value");

    Options opts;
    if (argc > 0 && argv && argv[0])
        opts.exec_path = argv[0];
    opts.positional = parser.positional();

    std::map<std::string, std::string> cfg_opts;
    load_config_files(parser, cfg_opts, opts.config_file);

    // Switches accept an explicit value (`--verify=no`, `verify: false`).
    auto flag = [&](const std::string& key) {
        std::string val;
        if (parser.has_flag(key)) {
            auto it = parser.options().find(key);
            if (it == parser.options().end())
                return true;
            val = it->second;
        } else {
            auto it = cfg_opts.find(key);
            if (it == cfg_opts.end())
                return false;
            val = it->second;
        }
        bool ok = false;
        bool b = parse_bool(val, ok);
        if (!ok)
            throw UsageError("Invalid value for " + key + ": " + val);
        return b;
    };
    auto value = [&](const std::string& key, std::string& out) {
        if (parser.has_flag(key)) {
            out = parser.get_option(key);
            return true;
        }
        auto it = cfg_opts.find(key);
        if (it == cfg_opts.end())
            return false;
        out = it->second;
        return true;
    };
    auto non_empty = [&](const std::string& key, std::string& out) {
        if (!value(key, out))
            return false;
        if (out.empty())
            throw UsageError(key + " requires a value");
        return true;
    };

    opts.show_help = flag("--help");
    opts.print_version = flag("--version");

    std::string val;
    bool ok = false;
    if (non_empty("--mode", val) && !transfer::parse_mode(val, opts.mode))
        throw UsageError("Invalid value for --mode: " + val);
    if (non_empty("--port", val)) {
        opts.port = parse_uint(val, 1, 65535, ok);
        if (!ok)
            throw UsageError("Invalid value for --port: " + val);
    }
    if (non_empty("--cipher", val))
        opts.cipher = val;
    if (non_empty("--sftp-bin", val))
        opts.clients.sftp = val;
    if (non_empty("--ssh-bin", val))
        opts.clients.ssh = val;
    if (non_empty("--rsync-bin", val))
        opts.clients.rsync = val;

    if (non_empty("--lock-file", val))
        opts.lock_file = val;
    if (non_empty("--lock-dir", val))
        opts.lock_dir = val;
    if (non_empty("--marker-name", val)) {
        if (val == "." || val == ".." || val.find('/') != std::string::npos)
            throw UsageError("Invalid value for --marker-name: " + val);
        opts.marker_name = val;
    }
    if (non_empty("--sentinel-path", val))
        opts.sentinel_path = val;
    if (value("--sentinel-value", val))
        opts.sentinel_value = val;
    opts.purge = !flag("--no-purge");
    opts.verify = flag("--verify");

    if (non_empty("--tool-log", val))
        opts.tool_log = val;
    if (non_empty("--kill-grace", val)) {
        opts.kill_grace = parse_time_ms(val, ok);
        if (!ok)
            throw UsageError("Invalid value for --kill-grace: " + val);
    }

    opts.dry_run = flag("--dry-run");
    opts.silent = flag("--silent");

    if (flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (non_empty("--log-level", val) && !parse_log_level(val, opts.logging.log_level))
        throw UsageError("Invalid log level: " + val);
    if (non_empty("--log-file", val))
        opts.logging.log_file = val;
    if (non_empty("--max-log-size", val)) {
        opts.logging.max_log_size = parse_bytes(val, 0, SIZE_MAX, ok);
        if (!ok)
            throw UsageError("Invalid value for --max-log-size: " + val);
    }
    if (non_empty("--log-rotate", val)) {
        opts.logging.rotate_count = parse_size_t(val, 1, 1000, ok);
        if (!ok)
            throw UsageError("Invalid value for --log-rotate: " + val);
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    opts.logging.use_syslog = flag("--syslog");
    if (non_empty("--syslog-facility", val)) {
        opts.logging.syslog_facility = static_cast<int>(parse_uint(val, 0, INT_MAX, ok));
        if (!ok)
            throw UsageError("Invalid value for --syslog-facility: " + val);
    }
    return opts;
}
