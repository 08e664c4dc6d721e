#include "logger.hpp"
#include <zlib.h>
#include <syslog.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "time_utils.hpp"

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::atomic<bool> g_syslog{false};

struct LogMessage {
    LogLevel level;
    std::string ts;
    std::string msg;
    std::map<std::string, std::string> fields;
};

static std::queue<LogMessage> g_log_queue;
static size_t g_pending = 0; // queued or being written, guarded by g_queue_mtx
static std::mutex g_queue_mtx;
static std::condition_variable g_queue_cv;
static std::condition_variable g_drained_cv;
static std::atomic<bool> g_running{false};
// true from a successful init_logger until shutdown; keeps accepting messages while a
// reinit restarts the writer
static std::atomic<bool> g_accepting{false};
static std::thread g_log_thread;
static std::mutex g_init_mtx;

static void log_worker();

static void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static int syslog_priority(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return LOG_DEBUG;
    case LogLevel::INFO:
        return LOG_INFO;
    case LogLevel::WARNING:
        return LOG_WARNING;
    case LogLevel::ERR:
        return LOG_ERR;
    }
    return LOG_INFO;
}

void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
    if (!g_log_ofs.is_open()) {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_accepting.store(false);
        std::queue<LogMessage>().swap(g_log_queue);
        g_pending = 0;
        return;
    }
    g_accepting.store(true);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    openlog("remotesync", LOG_PID | LOG_CONS, facility);
    g_syslog.store(true);
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

LogLevel log_level() { return g_min_level.load(); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DEBUG")
        level = LogLevel::DEBUG;
    else if (v == "INFO")
        level = LogLevel::INFO;
    else if (v == "WARNING" || v == "WARN")
        level = LogLevel::WARNING;
    else if (v == "ERROR" || v == "ERR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_drained_cv.wait(lk, [] { return g_pending == 0 || !g_running.load(); });
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

static std::string json_escape(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

static std::string format_line(const LogMessage& m) {
    const char* label = level_label(m.level);
    std::string line;
    if (g_json_log.load()) {
        line = "{\"timestamp\":\"" + json_escape(m.ts) + "\",\"level\":\"" + label +
               "\",\"msg\":\"" + json_escape(m.msg) + "\"";
        for (const auto& [k, v] : m.fields)
            line += ",\"" + json_escape(k) + "\":\"" + json_escape(v) + "\"";
        line += "}";
    } else {
        line = "[" + m.ts + "] [" + label + "] " + m.msg;
        for (const auto& [k, v] : m.fields)
            line += " " + k + "=" + v;
    }
    return line;
}

// Shift name.N -> name.N+1, dropping the oldest, then move the active file to
// name.1 (gzipped when compression is on) and reopen a fresh file.
static void rotate_logs() {
    g_log_ofs.close();
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    const std::string suffix = gz ? ".gz" : "";
    std::error_code ec;
    if (keep > 0) {
        for (size_t i = keep; i > 0; --i) {
            fs::path src = g_log_path + "." + std::to_string(i) + suffix;
            if (i == keep)
                fs::remove(src, ec);
            else
                fs::rename(src, g_log_path + "." + std::to_string(i + 1) + suffix, ec);
        }
        fs::path first = g_log_path + ".1";
        fs::rename(g_log_path, first, ec);
        if (gz) {
            fs::path packed = first;
            packed += ".gz";
            if (gzip_file(first.string(), packed.string()))
                fs::remove(first, ec);
        }
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

static void write_log_entry(const LogMessage& m) {
    if (!g_log_ofs.is_open())
        return;
    std::string line = format_line(m);
    g_log_ofs << line << '\n';
    if (g_max_size.load() > 0) {
        g_log_ofs.flush();
        std::error_code ec;
        auto size = fs::file_size(g_log_path, ec);
        if (!ec && size > g_max_size.load())
            rotate_logs();
    }
    if (g_syslog.load())
        syslog(syslog_priority(m.level), "%s", line.c_str());
}

static void enqueue_message(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    LogMessage m{level, timestamp(), msg, fields};
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        if (g_accepting.load()) {
            g_log_queue.push(std::move(m));
            ++g_pending;
            g_queue_cv.notify_one();
            return;
        }
    }
    // no log file: syslog, when enabled, is written directly
    if (g_syslog.load())
        syslog(syslog_priority(level), "%s", format_line(m).c_str());
}

void log_event(LogLevel level, const std::string& message) { enqueue_message(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    enqueue_message(level, message, fields);
}

void log_debug(const std::string& msg) { enqueue_message(LogLevel::DEBUG, msg, {}); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { enqueue_message(LogLevel::INFO, msg, {}); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { enqueue_message(LogLevel::WARNING, msg, {}); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { enqueue_message(LogLevel::ERR, msg, {}); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    enqueue_message(LogLevel::ERR, msg, fields);
}

static void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (g_log_queue.empty() && !g_running.load())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop();
        }
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(m);
        g_log_ofs.flush();
        lk.lock();
        g_pending -= batch.size();
        lk.unlock();
        batch.clear();
        g_drained_cv.notify_all();
    }
    g_log_ofs.flush();
    g_drained_cv.notify_all();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_accepting.store(false);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    std::queue<LogMessage>().swap(g_log_queue);
    g_pending = 0;
}
