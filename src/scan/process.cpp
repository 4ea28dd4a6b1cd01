#include "scanport/scan/process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scanport::scan {

using scanport::core::CancelToken;
using scanport::core::StatusCode;
using scanport::core::StatusDomain;
using scanport::core::make_status;
using scanport::core::ok_status;

namespace {
    using Clock = std::chrono::steady_clock;

    // Longest single poll, so the stop flag is seen promptly.
    constexpr int kPollSliceMs = 100;

    struct Pipe {
        int r{-1};
        int w{-1};

        ~Pipe() { close_both(); }

        bool open() noexcept {
            int fds[2];
            if (pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
            r = fds[0];
            w = fds[1];
            return true;
        }

        void close_read() noexcept {
            if (r >= 0) { ::close(r); r = -1; }
        }
        void close_write() noexcept {
            if (w >= 0) { ::close(w); w = -1; }
        }
        void close_both() noexcept {
            close_read();
            close_write();
        }
    };

    [[noreturn]] void exec_child(const ProcessSpec& spec, const std::vector<char*>& argv,
                                 int out_fd, int err_fd, int report_fd) noexcept {
        (void)setpgid(0, 0);

        int in_fd = ::open("/dev/null", O_RDONLY);
        if (in_fd >= 0) {
            (void)dup2(in_fd, STDIN_FILENO);
            if (in_fd > 2) ::close(in_fd);
        }
        (void)dup2(out_fd, STDOUT_FILENO);
        (void)dup2(err_fd, STDERR_FILENO);

        signal(SIGPIPE, SIG_DFL);

        int e = 0;
        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            e = errno;
        } else {
            execvp(argv[0], argv.data());
            e = errno;
        }
        // report_fd is CLOEXEC: the parent reads EOF on a successful exec.
        ssize_t unused = ::write(report_fd, &e, sizeof(e));
        (void)unused;
        _exit(127);
    }

    void drain(int* fd, std::string* sink, bool* truncated, u32 cap) noexcept {
        char buf[8192];
        for (;;) {
            const ssize_t n = ::read(*fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN) return;
                ::close(*fd);
                *fd = -1;
                return;
            }
            if (n == 0) {
                ::close(*fd);
                *fd = -1;
                return;
            }
            const size_t room = sink->size() < cap ? cap - sink->size() : 0;
            const size_t take = static_cast<size_t>(n) < room ? static_cast<size_t>(n) : room;
            if (take > 0) {
                sink->append(buf, take);
            }
            if (take < static_cast<size_t>(n)) {
                *truncated = true;
            }
            if (static_cast<size_t>(n) < sizeof(buf)) {
                return;
            }
        }
    }

    void kill_group(pid_t pid) noexcept {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
    }

    void reap(pid_t pid, int* wstatus) noexcept {
        while (waitpid(pid, wstatus, 0) < 0 && errno == EINTR) {
        }
    }

    void record_exit(int wstatus, ProcessResult* out) noexcept {
        if (WIFEXITED(wstatus)) {
            out->exit_code = WEXITSTATUS(wstatus);
            out->term_signal = 0;
        } else if (WIFSIGNALED(wstatus)) {
            out->exit_code = -1;
            out->term_signal = WTERMSIG(wstatus);
        }
    }
} // namespace

Status run_process(const ProcessSpec& spec, const CancelToken& cancel, ProcessResult* out) noexcept {
    if (out == nullptr || spec.argv.empty() || spec.argv[0].empty()) {
        return make_status(StatusDomain::Scan, StatusCode::Invalid);
    }
    *out = ProcessResult{};

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const std::string& a : spec.argv) {
        argv.push_back(const_cast<char*>(a.c_str()));
    }
    argv.push_back(nullptr);

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe report;
    if (!out_pipe.open() || !err_pipe.open() || !report.open()) {
        return make_status(StatusDomain::Scan, StatusCode::ScanInvocation, errno);
    }

    const pid_t pid = fork();
    if (pid < 0) {
        return make_status(StatusDomain::Scan, StatusCode::ScanInvocation, errno);
    }
    if (pid == 0) {
        exec_child(spec, argv, out_pipe.w, err_pipe.w, report.w);
    }

    // Also from the parent, so kill(-pid) works even before the child runs.
    (void)setpgid(pid, pid);

    out_pipe.close_write();
    err_pipe.close_write();
    report.close_write();

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(report.r, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    report.close_read();

    int wstatus = 0;
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        reap(pid, &wstatus);
        out->err = std::string("cannot execute ") + spec.argv[0] + ": " + std::strerror(exec_errno);
        return make_status(StatusDomain::Scan, StatusCode::ScanInvocation, static_cast<u32>(exec_errno));
    }

    (void)fcntl(out_pipe.r, F_SETFL, fcntl(out_pipe.r, F_GETFL) | O_NONBLOCK);
    (void)fcntl(err_pipe.r, F_SETFL, fcntl(err_pipe.r, F_GETFL) | O_NONBLOCK);

    const bool bounded = spec.timeout_ms > 0;
    const auto deadline = Clock::now() + std::chrono::milliseconds(spec.timeout_ms);

    for (;;) {
        if (out_pipe.r < 0 && err_pipe.r < 0) {
            const pid_t w = waitpid(pid, &wstatus, WNOHANG);
            if (w == pid) {
                break;
            }
            if (w < 0 && errno != EINTR) {
                const int e = errno;
                kill_group(pid);
                return make_status(StatusDomain::Scan, StatusCode::Io, static_cast<u32>(e));
            }
        }

        if (cancel.cancelled()) {
            kill_group(pid);
            reap(pid, &wstatus);
            record_exit(wstatus, out);
            return make_status(StatusDomain::Scan, StatusCode::Cancelled);
        }

        int wait_ms = kPollSliceMs;
        if (bounded) {
            const auto now = Clock::now();
            if (now >= deadline) {
                kill_group(pid);
                reap(pid, &wstatus);
                record_exit(wstatus, out);
                return make_status(StatusDomain::Scan, StatusCode::ScanTimeout, spec.timeout_ms);
            }
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
            if (left < wait_ms) {
                wait_ms = left <= 0 ? 1 : static_cast<int>(left);
            }
        }

        struct pollfd pfds[3]{};
        nfds_t nfds = 0;
        int out_idx = -1;
        int err_idx = -1;
        if (out_pipe.r >= 0) {
            out_idx = static_cast<int>(nfds);
            pfds[nfds++] = {out_pipe.r, POLLIN, 0};
        }
        if (err_pipe.r >= 0) {
            err_idx = static_cast<int>(nfds);
            pfds[nfds++] = {err_pipe.r, POLLIN, 0};
        }
        if (cancel.watch_fd() >= 0) {
            pfds[nfds++] = {cancel.watch_fd(), CancelToken::hangup_events(), 0};
        }

        int rc = 0;
        if (nfds > 0) {
            rc = poll(pfds, nfds, wait_ms);
        } else {
            // Both pipes closed but the child lingers; just wait.
            rc = poll(nullptr, 0, wait_ms);
        }
        if (rc < 0) {
            if (errno == EINTR) continue;
            const int e = errno;
            kill_group(pid);
            reap(pid, &wstatus);
            return make_status(StatusDomain::Scan, StatusCode::Io, static_cast<u32>(e));
        }

        if (out_idx >= 0 && (pfds[out_idx].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            drain(&out_pipe.r, &out->out, &out->out_truncated, spec.output_cap_bytes);
        }
        if (err_idx >= 0 && (pfds[err_idx].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            drain(&err_pipe.r, &out->err, &out->err_truncated, spec.output_cap_bytes);
        }
    }

    record_exit(wstatus, out);
    return ok_status();
}

} // namespace scanport::scan
