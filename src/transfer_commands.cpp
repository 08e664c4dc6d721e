#include "transfer_commands.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "process_utils.hpp"

namespace transfer {

const char* mode_name(Mode mode) { return mode == Mode::RSYNC ? "rsync" : "sftp"; }

bool parse_mode(const std::string& name, Mode& mode) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "sftp")
        mode = Mode::SFTP;
    else if (v == "rsync")
        mode = Mode::RSYNC;
    else
        return false;
    return true;
}

std::string sftp_quote(const std::string& arg) {
    std::string out = "\"";
    for (char c : arg) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string sftp_batch(const std::string& remote_dir, const fs::path& local_dir) {
    std::ostringstream oss;
    oss << "cd " << sftp_quote(remote_dir) << "\n";
    oss << "lcd " << sftp_quote(local_dir.string()) << "\n";
    oss << "get -pr *\n";
    oss << "bye\n";
    return oss.str();
}

std::vector<std::string> sftp_command(const ClientPaths& clients, const Endpoint& ep,
                                      const fs::path& batch_file) {
    return {clients.sftp, "-b", batch_file.string(), "-i", ep.ssh_key,
            "-P", std::to_string(ep.port), ep.mount_point};
}

std::vector<std::string> ssh_command(const ClientPaths& clients, const Endpoint& ep,
                                     const std::string& remote_cmd) {
    return {clients.ssh, "-x", "-T", "-i", ep.ssh_key, "-p", std::to_string(ep.port),
            ep.mount_point, remote_cmd};
}

std::string purge_script(const std::string& remote_dir, const std::string& sentinel_path,
                         const std::string& sentinel_value) {
    using procutil::shell_quote;
    return "printf '%s\\n' " + shell_quote(sentinel_value) + " > " + shell_quote(sentinel_path) +
           " && rm -rf -- " + shell_quote(remote_dir) + "/*";
}

std::string listing_script(const std::string& remote_dir) {
    return "cd " + procutil::shell_quote(remote_dir) +
           " && find . -mindepth 1 -path './.*' -prune -o -type f -printf '%s %P\\n'";
}

std::map<std::string, std::uintmax_t> parse_listing(const std::string& output) {
    std::map<std::string, std::uintmax_t> files;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        size_t sp = line.find(' ');
        if (sp == 0 || sp == std::string::npos || sp + 1 >= line.size())
            continue;
        const std::string size_str = line.substr(0, sp);
        if (!std::all_of(size_str.begin(), size_str.end(),
                         [](unsigned char c) { return std::isdigit(c); }))
            continue;
        try {
            files[line.substr(sp + 1)] = std::stoull(size_str);
        } catch (const std::out_of_range&) {
            continue;
        }
    }
    return files;
}

std::string default_sentinel_path(const std::string& remote_dir) {
    std::string dir = remote_dir;
    while (dir.size() > 1 && dir.back() == '/')
        dir.pop_back();
    if (dir == "/")
        return "/.test";
    return dir + "/.test";
}

std::vector<std::string> rsync_command(const ClientPaths& clients, const Endpoint& ep,
                                       const std::string& cipher) {
    using procutil::shell_quote;
    std::string rsh = shell_quote(clients.ssh) + " -x -T -c " + shell_quote(cipher) +
                      " -o Compression=no -i " + shell_quote(ep.ssh_key) + " -p" +
                      std::to_string(ep.port);
    return {clients.rsync,
            "--remove-source-files",
            "-rtvk",
            "--exclude=@eaDir/*",
            "--exclude=.*",
            "--progress",
            "--human-readable",
            "-avh",
            "-e",
            rsh,
            ep.mount_point,
            ep.local_dir.string()};
}

bool is_root_dir(const std::string& remote_dir) {
    return remote_dir.find_first_not_of('/') == std::string::npos;
}

} // namespace transfer
