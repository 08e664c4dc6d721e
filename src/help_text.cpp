#include "help_text.hpp"
#include <algorithm>
#include <iomanip>
#include <vector>
#include <map>
#include <cstring>
#include <string>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

void print_help(const char* prog, std::ostream& os) {
    static const std::vector<OptionInfo> opts = {
        {"--mode", "-m", "<sftp|rsync>", "Transfer mode (default sftp)", "Transfer"},
        {"--port", "-p", "<n>", "SSH port (default 22)", "Transfer"},
        {"--cipher", "", "<name>", "SSH cipher used by rsync (default aes128-gcm@openssh.com)",
         "Transfer"},
        {"--sftp-bin", "", "<path>", "sftp executable", "Transfer"},
        {"--ssh-bin", "", "<path>", "ssh executable", "Transfer"},
        {"--rsync-bin", "", "<path>", "rsync executable", "Transfer"},
        {"--tool-log", "", "<file>", "Append client error output to this file", "Transfer"},
        {"--kill-grace", "", "<ms|s>", "Wait before killing a client after a signal",
         "Transfer"},
        {"--dry-run", "-n", "", "Print the commands and exit", "Transfer"},
        {"--no-purge", "", "", "Keep the remote files after an sftp transfer", "Purge"},
        {"--verify", "", "", "Compare remote and local sizes before purging", "Purge"},
        {"--sentinel-path", "", "<path>", "Remote sentinel written before purging", "Purge"},
        {"--sentinel-value", "", "<text>", "Sentinel content (default 1)", "Purge"},
        {"--lock-file", "", "<path>", "Lock file path", "Lock"},
        {"--lock-dir", "", "<dir>", "Directory for the default lock file", "Lock"},
        {"--marker-name", "", "<name>", "In-progress marker name (default .transferring)",
         "Lock"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--log-file", "-l", "<path>", "File for general logs", "Logging"},
        {"--log-level", "-L", "<level>", "Set log verbosity", "Logging"},
        {"--verbose", "-v", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--log-rotate", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--syslog", "", "", "Log to syslog", "Logging"},
        {"--syslog-facility", "", "<n>", "Syslog facility", "Logging"},
        {"--silent", "-s", "", "Disable console output", "Basics"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }

    os << "remotesync - single-instance remote to local sync\n";
    os << "Pulls a remote directory over sftp or rsync into a local directory.\n";
    os << "Configuration can be read from YAML or JSON files.\n\n";
    os << "Usage: " << prog << " [options] <mount_point> <remote_dir> <local_dir> <ssh_key>\n";
    os << "       " << prog << " --mode rsync [options] <mount_point> <local_dir> <ssh_key>\n\n";
    const std::vector<std::string> order{"Basics", "Transfer", "Purge", "Lock", "Config",
                                         "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        os << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            os << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc << "\n";
        }
        os << "\n";
    }
}
