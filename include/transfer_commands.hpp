#ifndef TRANSFER_COMMANDS_HPP
#define TRANSFER_COMMANDS_HPP
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

/**
 * Command construction for the external transfer clients.
 *
 * Nothing here runs a process; the functions only produce argument vectors,
 * sftp batch scripts and remote shell snippets so they can be inspected,
 * printed for a dry run, or handed to procutil::run_process.
 */
namespace transfer {
namespace fs = std::filesystem;

enum class Mode { SFTP, RSYNC };

/** @return "sftp" or "rsync". */
const char* mode_name(Mode mode);

/**
 * @brief Parse a mode name (case-insensitive).
 *
 * @return `false` when @p name is neither "sftp" nor "rsync".
 */
bool parse_mode(const std::string& name, Mode& mode);

/** Executables used for each client. Plain names are resolved via PATH. */
struct ClientPaths {
    std::string sftp = "sftp";
    std::string ssh = "ssh";
    std::string rsync = "rsync";
};

/** Where the files come from and where they go. */
struct Endpoint {
    std::string mount_point; ///< `user@host`, a host alias, or `host:path` in rsync mode
    std::string remote_dir;  ///< unused in rsync mode
    fs::path local_dir;
    std::string ssh_key;
    unsigned int port = 22;
};

constexpr const char* kDefaultCipher = "aes128-gcm@openssh.com";

/**
 * @brief Quote a path for an sftp batch file.
 */
std::string sftp_quote(const std::string& arg);

/**
 * @brief Batch script fetching every non-hidden entry of @p remote_dir into
 *        @p local_dir, preserving times and permissions.
 */
std::string sftp_batch(const std::string& remote_dir, const fs::path& local_dir);

/** `sftp -b <batch> -i <key> -P <port> <mount_point>` */
std::vector<std::string> sftp_command(const ClientPaths& clients, const Endpoint& ep,
                                      const fs::path& batch_file);

/** `ssh -x -T -i <key> -p <port> <mount_point> <remote_cmd>` */
std::vector<std::string> ssh_command(const ClientPaths& clients, const Endpoint& ep,
                                     const std::string& remote_cmd);

/**
 * @brief Remote shell command writing @p sentinel_value to @p sentinel_path
 *        and then deleting every non-hidden entry of @p remote_dir.
 *
 * The deletion only runs when the sentinel write succeeded.
 */
std::string purge_script(const std::string& remote_dir, const std::string& sentinel_path,
                         const std::string& sentinel_value);

/**
 * @brief Remote shell command listing regular files below @p remote_dir as
 *        `<size> <relative path>` lines, skipping top-level hidden entries.
 */
std::string listing_script(const std::string& remote_dir);

/**
 * @brief Parse the output of listing_script().
 *
 * Malformed lines are ignored.
 */
std::map<std::string, std::uintmax_t> parse_listing(const std::string& output);

/** Default sentinel location: `<remote_dir>/.test`. */
std::string default_sentinel_path(const std::string& remote_dir);

/**
 * @brief rsync invocation moving @p ep.mount_point into @p ep.local_dir,
 *        deleting each source file once transferred.
 */
std::vector<std::string> rsync_command(const ClientPaths& clients, const Endpoint& ep,
                                       const std::string& cipher = kDefaultCipher);

/**
 * @brief `true` when @p remote_dir would make the purge delete from the
 *        remote root (empty or only slashes).
 */
bool is_root_dir(const std::string& remote_dir);

} // namespace transfer

#endif // TRANSFER_COMMANDS_HPP
