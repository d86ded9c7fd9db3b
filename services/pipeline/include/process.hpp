#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

class StageContext;

struct ProcessSpec {
    std::vector<std::string> argv;
    std::vector<std::pair<std::string, std::string>> env;  // added to the inherited environment
    std::int64_t timeout_ms{0};                            // 0: bounded only by the stage context
};

struct ProcessResult {
    int exit_code{-1};
    bool timed_out{false};
    std::string stderr_text;  // tail only
};

using OutputFn = std::function<void(const char* data, std::size_t size)>;

constexpr int kExecFailedExit = 127;

// Runs argv[0] from PATH and streams its stdout to `on_stdout`. The child is
// killed when `ctx` aborts or times out (the JobAborted / TransientFailure is
// rethrown), when `on_stdout` throws, or when spec.timeout_ms elapses
// (reported through timed_out).
ProcessResult run_process(const ProcessSpec& spec, StageContext* ctx, const OutputFn& on_stdout);

// Splits a byte stream into lines on '\n' or '\r' (rsync redraws its
// progress line with '\r').
class LineSplitter {
public:
    explicit LineSplitter(std::function<void(const std::string&)> on_line) : on_line_(std::move(on_line)) {}
    void feed(const char* data, std::size_t size);
    void finish();

private:
    std::function<void(const std::string&)> on_line_;
    std::string pending_;
};

// Single-quotes `s` for a POSIX shell.
std::string shell_quote(const std::string& s);
