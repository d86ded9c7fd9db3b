#include "../include/util.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>

namespace {
std::mutex g_log_mtx;
std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};

void write_line(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < g_log_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::ostream& out = level >= LogLevel::Warn ? std::cerr : std::cout;
    out << "[" << tag << "] " << message << std::endl;
}
}

std::int64_t system_now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::string gen_id() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx", (unsigned long long)a, (unsigned long long)b);
    return std::string(buf);
}

std::vector<std::string> split_list(const std::string& text, char sep) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, sep)) {
        auto b = item.find_first_not_of(" \t");
        auto e = item.find_last_not_of(" \t");
        if (b == std::string::npos) continue;
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}

std::string sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '(' || c == ')') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('_');
        }
    }
    if (out.empty()) out = "media";
    return out;
}

std::string format_rate(double bytes_per_sec) {
    if (bytes_per_sec <= 0) return "N/A";
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f MB/s", bytes_per_sec / 1024.0 / 1024.0);
    return buf;
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

void log_debug(const std::string& tag, const std::string& message) { write_line(LogLevel::Debug, tag, message); }
void log_info(const std::string& tag, const std::string& message) { write_line(LogLevel::Info, tag, message); }
void log_warn(const std::string& tag, const std::string& message) { write_line(LogLevel::Warn, tag, message); }
void log_error(const std::string& tag, const std::string& message) { write_line(LogLevel::Error, tag, message); }
