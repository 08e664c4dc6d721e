#pragma once
#include <catch2/catch.hpp>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "lock_utils.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "parse_utils.hpp"
#include "process_utils.hpp"
#include "signal_guard.hpp"
#include "sync_errors.hpp"
#include "sync_runner.hpp"
#include "time_utils.hpp"
#include "transfer_commands.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <cstdlib>
#include <map>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <chrono>
#include <vector>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace remotesync::test_support {
namespace detail {
inline bool remove_once(const fs::path& target, bool recursive, std::error_code& ec) {
    ec.clear();
    if (recursive) {
        fs::remove_all(target, ec);
        if (!ec)
            return true;
        if (ec == std::errc::no_such_file_or_directory)
            return true;
        return false;
    }
    fs::remove(target, ec);
    if (!ec)
        return true;
    if (ec == std::errc::no_such_file_or_directory)
        return true;
    return false;
}

inline void remove_with_retry(const fs::path& target, bool recursive) {
    std::error_code ec;
    if (remove_once(target, recursive, ec))
        return;
    INFO("Failed to remove '" << target.string() << "': " << ec.message());
    REQUIRE(false);
}
}  // namespace detail

inline void remove_path(const fs::path& target) {
    detail::remove_with_retry(target, false);
}

inline void remove_all(const fs::path& target) {
    detail::remove_with_retry(target, true);
}

/** Fresh directory under the temp dir, unique per process. */
inline fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("remotesync_" + name + "_" + std::to_string(getpid()));
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);
    return dir;
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

inline std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

/** Write an executable shell script. */
inline void write_script(const fs::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec);
}

/**
 * Stand-in for sftp: reads the `-b` batch file, follows its cd/lcd lines and
 * copies every non-hidden entry of the remote directory on `get`. The
 * command line goes to @p log and the batch to `<log>.batch`.
 */
inline void write_fake_sftp(const fs::path& path, const fs::path& log) {
    write_script(path, "printf '%s\\n' \"$*\" >> '" + log.string() + "'\n"
                       "batch=''\n"
                       "while [ $# -gt 0 ]; do\n"
                       "  case \"$1\" in\n"
                       "    -b) batch=\"$2\"; shift 2 ;;\n"
                       "    *) shift ;;\n"
                       "  esac\n"
                       "done\n"
                       "cp \"$batch\" '" + log.string() + ".batch'\n"
                       "rdir=''; ldir=''\n"
                       "while IFS= read -r line; do\n"
                       "  case \"$line\" in\n"
                       "    'cd '*) rdir=$(printf '%s' \"${line#cd }\" | sed 's/^\"//; s/\"$//') ;;\n"
                       "    'lcd '*) ldir=$(printf '%s' \"${line#lcd }\" | sed 's/^\"//; s/\"$//') ;;\n"
                       "    'get '*)\n"
                       "      for f in \"$rdir\"/*; do\n"
                       "        [ -e \"$f\" ] || exit 1\n"
                       "        cp -Rp \"$f\" \"$ldir\"/ || exit 1\n"
                       "      done ;;\n"
                       "  esac\n"
                       "done < \"$batch\"\n"
                       "exit 0\n");
}

/** Stand-in for ssh: runs the remote command locally with sh. */
inline void write_fake_ssh(const fs::path& path, const fs::path& log) {
    write_script(path, "printf '%s\\n' \"$*\" >> '" + log.string() + "'\n"
                       "for last; do :; done\n"
                       "exec sh -c \"$last\"\n");
}

/** Stand-in for rsync: records one argument per line. */
inline void write_fake_rsync(const fs::path& path, const fs::path& log) {
    write_script(path, "for a; do printf '%s\\n' \"$a\"; done > '" + log.string() + "'\n"
                       "exit 0\n");
}

/** Owns a `char*` argv built from strings. */
class Argv {
  public:
    explicit Argv(std::vector<std::string> args) : args_(std::move(args)) {
        for (auto& a : args_)
            ptrs_.push_back(a.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return ptrs_.data(); }

  private:
    std::vector<std::string> args_;
    std::vector<char*> ptrs_;
};

/** Poll until @p path exists or @p timeout elapses. */
inline bool wait_for_path(const fs::path& path,
                          std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (fs::exists(path))
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return fs::exists(path);
}
}  // namespace remotesync::test_support

#ifndef FS_REMOVE
#define FS_REMOVE(path) ::remotesync::test_support::remove_path((path))
#endif
#ifndef FS_REMOVE_ALL
#define FS_REMOVE_ALL(path) ::remotesync::test_support::remove_all((path))
#endif

using namespace remotesync::test_support;
