#include "../include/process.hpp"
#include "../include/errors.hpp"
#include "../include/progress.hpp"
#include "../include/util.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <map>

extern char** environ;

namespace {

constexpr std::size_t kStderrTail = 8192;

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

struct Pipe {
    int fds[2]{-1, -1};
    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) != 0) throw Error(std::string("pipe2 failed: ") + std::strerror(errno));
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    void close_read() { if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; } }
    void close_write() { if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; } }
};

std::vector<std::string> build_env(const std::vector<std::pair<std::string, std::string>>& extra) {
    std::map<std::string, std::string> vars;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        vars[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto& kv : extra) vars[kv.first] = kv.second;
    std::vector<std::string> out;
    out.reserve(vars.size());
    for (const auto& kv : vars) out.push_back(kv.first + "=" + kv.second);
    return out;
}

void kill_and_reap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

}

ProcessResult run_process(const ProcessSpec& spec, StageContext* ctx, const OutputFn& on_stdout) {
    if (spec.argv.empty()) throw std::invalid_argument("run_process: empty argv");

    // Everything the child needs is built before fork().
    std::vector<std::string> env_strings = build_env(spec.env);
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(&s[0]);
    envp.push_back(nullptr);
    std::vector<std::string> args = spec.argv;
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);

    Pipe out, err;
    pid_t pid = ::fork();
    if (pid < 0) throw Error(std::string("fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        _exit(kExecFailedExit);
    }
    out.close_write();
    err.close_write();

    ProcessResult res;
    std::int64_t started = system_now_ms();
    char buf[1 << 15];
    bool out_open = true, err_open = true;
    try {
        while (out_open || err_open) {
            if (ctx) ctx->check();
            if (spec.timeout_ms > 0 && system_now_ms() - started > spec.timeout_ms) {
                res.timed_out = true;
                kill_and_reap(pid);
                return res;
            }
            pollfd fds[2];
            nfds_t n = 0;
            if (out_open) fds[n++] = pollfd{out.fds[0], POLLIN, 0};
            if (err_open) fds[n++] = pollfd{err.fds[0], POLLIN, 0};
            int rc = ::poll(fds, n, 200);
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw Error(std::string("poll failed: ") + std::strerror(errno));
            }
            for (nfds_t i = 0; i < n; ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                ssize_t got = ::read(fds[i].fd, buf, sizeof(buf));
                if (got < 0 && errno == EINTR) continue;
                bool is_out = fds[i].fd == out.fds[0];
                if (got <= 0) {
                    if (is_out) { out_open = false; out.close_read(); }
                    else { err_open = false; err.close_read(); }
                    continue;
                }
                if (is_out) {
                    if (on_stdout) on_stdout(buf, static_cast<std::size_t>(got));
                } else {
                    res.stderr_text.append(buf, static_cast<std::size_t>(got));
                    if (res.stderr_text.size() > kStderrTail) {
                        res.stderr_text.erase(0, res.stderr_text.size() - kStderrTail);
                    }
                }
            }
        }
    } catch (...) {
        kill_and_reap(pid);
        throw;
    }

    int status = 0;
    while (true) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) throw Error(std::string("waitpid failed: ") + std::strerror(errno));
        try {
            if (ctx) ctx->check();
        } catch (...) {
            kill_and_reap(pid);
            throw;
        }
        if (spec.timeout_ms > 0 && system_now_ms() - started > spec.timeout_ms) {
            res.timed_out = true;
            kill_and_reap(pid);
            return res;
        }
        ::usleep(20000);
    }
    if (WIFEXITED(status)) res.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res.exit_code = 128 + WTERMSIG(status);
    return res;
}

void LineSplitter::feed(const char* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        char c = data[i];
        if (c == '\n' || c == '\r') {
            if (!pending_.empty()) on_line_(pending_);
            pending_.clear();
        } else {
            pending_.push_back(c);
        }
    }
}

void LineSplitter::finish() {
    if (!pending_.empty()) on_line_(pending_);
    pending_.clear();
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}
