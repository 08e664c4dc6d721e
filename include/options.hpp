#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "logger.hpp"
#include "transfer_commands.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t rotate_count = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

/**
 * @brief Everything a run needs, resolved from the command line and an
 *        optional configuration file.
 */
struct Options {
    transfer::Mode mode = transfer::Mode::SFTP;
    /** Positional parameters as given; checked against the mode by the runner. */
    std::vector<std::string> positional;
    unsigned int port = 22;
    transfer::ClientPaths clients;
    std::string cipher = transfer::kDefaultCipher;

    std::filesystem::path lock_file;
    std::filesystem::path lock_dir;
    std::string marker_name = ".transferring";
    std::string sentinel_path; ///< empty selects `<remote_dir>/.test`
    std::string sentinel_value = "1";
    bool purge = true;
    bool verify = false;

    std::filesystem::path tool_log;
    std::chrono::milliseconds kill_grace{2000};

    bool dry_run = false;
    bool silent = false;
    bool show_help = false;
    bool print_version = false;

    LoggingOptions logging;
    std::filesystem::path config_file;
    /** `argv[0]`, used to derive the default lock path. */
    std::string exec_path;
};

/**
 * @brief Parse command line arguments (and any referenced config file).
 *
 * Values given on the command line override values from the file.
 *
 * @throws UsageError on unknown options, missing or malformed values and
 *         unreadable configuration files.
 */
Options parse_options(int argc, char* argv[]);

#endif // OPTIONS_HPP
