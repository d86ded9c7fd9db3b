#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Milliseconds since the Unix epoch.
using Clock = std::function<std::int64_t()>;

std::int64_t system_now_ms();

std::string getenv_or(const char* key, const std::string& def);
std::string gen_id();
std::vector<std::string> split_list(const std::string& text, char sep);
std::string sanitize_filename(const std::string& name);
std::string format_rate(double bytes_per_sec);

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

LogLevel parse_log_level(const std::string& name);
void set_log_level(LogLevel level);

// Writes "[tag] message" as one line; concurrent callers never interleave.
void log_debug(const std::string& tag, const std::string& message);
void log_info(const std::string& tag, const std::string& message);
void log_warn(const std::string& tag, const std::string& message);
void log_error(const std::string& tag, const std::string& message);
