#include "system/process.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace genup {

namespace {

constexpr int kPollIntervalMs = 100;

Result MakePipe(Fd& read_end, Fd& write_end) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Result::FromErrno(errno, "pipe2");
    }
    read_end.Reset(fds[0]);
    write_end.Reset(fds[1]);
    return Result::Ok();
}

void SetNonBlocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

// Inherited environment with `overrides` replacing same-named entries.
std::vector<std::string> ChildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const std::string_view entry(*e);
        const std::string_view key = entry.substr(0, entry.find('='));
        bool replaced = false;
        for (const auto& [k, v] : overrides) {
            if (k == key) {
                replaced = true;
                break;
            }
        }
        if (!replaced) env.emplace_back(entry);
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

// Only async-signal-safe calls between fork and exec; argv and envp are built by the parent.
[[noreturn]] void ExecChild(char* const argv[], char* const envp[], int stdin_fd, int out_fd) {
    ::setpgid(0, 0);
    std::signal(SIGPIPE, SIG_DFL);
    if (::dup2(stdin_fd, STDIN_FILENO) < 0 || ::dup2(out_fd, STDOUT_FILENO) < 0 ||
        ::dup2(out_fd, STDERR_FILENO) < 0) {
        ::_exit(127);
    }
    ::execve("/bin/sh", argv, envp);
    ::_exit(127);
}

void AppendCapped(std::string& out, const char* data, size_t n, size_t limit, bool& truncated) {
    out.append(data, n);
    if (out.size() > limit) {
        out.erase(0, out.size() - limit);
        truncated = true;
    }
}

} // namespace

std::string ProcessResult::Describe() const {
    if (cancelled) return "cancelled";
    if (term_signal != 0) return "killed by signal " + std::to_string(term_signal);
    return "exit code " + std::to_string(exit_code);
}

Result RunProcess(const ProcessSpec& spec, const CancelToken& cancel, ProcessResult& out) {
    out = ProcessResult{};
    if (spec.command.empty()) {
        return Result::Fail(EINVAL, "empty command");
    }

    Fd out_read, out_write;
    auto pr = MakePipe(out_read, out_write);
    if (!pr.is_ok()) return pr;

    Fd in_read, in_write;
    pr = MakePipe(in_read, in_write);
    if (!pr.is_ok()) return pr;

    std::string sh = "sh";
    std::string dash_c = "-c";
    std::string command = spec.command;
    std::array<char*, 4> argv{sh.data(), dash_c.data(), command.data(), nullptr};
    std::vector<std::string> env = ChildEnvironment(spec.env);
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& e : env) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::FromErrno(errno, "fork");
    }
    if (pid == 0) {
        ExecChild(argv.data(), envp.data(), in_read.Get(), out_write.Get());
    }
    // Mirror setpgid in the parent so kill(-pid) works even if the child has not run yet.
    (void)::setpgid(pid, pid);

    in_read.Reset();
    out_write.Reset();
    SetNonBlocking(out_read.Get());
    SetNonBlocking(in_write.Get());

    size_t stdin_off = 0;
    if (spec.stdin_data.empty()) {
        in_write.Reset();
    }

    bool output_open = true;
    bool exited = false;
    int status = 0;
    int wait_errno = 0;
    bool term_sent = false;
    CancelToken::Clock::time_point term_sent_at{};
    std::array<char, 8192> buf{};

    while (output_open || !exited) {
        if (!exited) {
            const pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                exited = true;
            } else if (w < 0 && errno != EINTR) {
                // The child can no longer be waited for (ECHILD when SIGCHLD is ignored).
                wait_errno = errno;
                LogError("waitpid(%d) failed: %s", static_cast<int>(pid), std::strerror(wait_errno));
                exited = true;
            }
        }

        if (!exited && cancel.IsCancelled()) {
            const auto now = CancelToken::Clock::now();
            if (!term_sent) {
                LogWarn("Cancelling child pid=%d (%s)", static_cast<int>(pid), ToString(cancel.Reason()));
                ::kill(-pid, SIGTERM);
                term_sent = true;
                term_sent_at = now;
                out.cancelled = true;
            } else if (now - term_sent_at >= spec.kill_grace) {
                ::kill(-pid, SIGKILL);
            }
        }

        std::array<pollfd, 2> pfds{};
        nfds_t nfds = 0;
        if (output_open) {
            pfds[nfds++] = pollfd{out_read.Get(), POLLIN, 0};
        }
        const bool want_stdin = in_write.Valid();
        if (want_stdin) {
            pfds[nfds++] = pollfd{in_write.Get(), POLLOUT, 0};
        }

        if (nfds == 0) {
            // Child closed its output but is still running; keep polling for exit and cancel.
            (void)::poll(nullptr, 0, kPollIntervalMs);
            continue;
        }

        const int pr_n = ::poll(pfds.data(), nfds, kPollIntervalMs);
        if (pr_n < 0 && errno != EINTR) {
            const int err = errno;
            LogError("poll failed: %s", std::strerror(err));
            ::kill(-pid, SIGKILL);
            output_open = false;
            in_write.Reset();
            continue;
        }

        for (nfds_t i = 0; pr_n > 0 && i < nfds; ++i) {
            if (pfds[i].fd == out_read.Get() && (pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                while (true) {
                    const ssize_t n = ::read(out_read.Get(), buf.data(), buf.size());
                    if (n > 0) {
                        AppendCapped(out.output, buf.data(), static_cast<size_t>(n),
                                     spec.output_limit, out.output_truncated);
                        continue;
                    }
                    if (n == 0) {
                        output_open = false;
                        out_read.Reset();
                    } else if (errno == EINTR) {
                        continue;
                    }
                    break;
                }
            } else if (want_stdin && pfds[i].fd == in_write.Get() &&
                       (pfds[i].revents & (POLLOUT | POLLERR | POLLHUP))) {
                const ssize_t n = ::write(in_write.Get(), spec.stdin_data.data() + stdin_off,
                                          spec.stdin_data.size() - stdin_off);
                if (n > 0) {
                    stdin_off += static_cast<size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
                    stdin_off >= spec.stdin_data.size()) {
                    in_write.Reset();
                }
            }
        }

        // A backgrounded grandchild may keep the pipe open; stop once the child is gone
        // and nothing is left to read.
        if (exited && output_open && pr_n == 0) {
            output_open = false;
            out_read.Reset();
        }
    }

    if (wait_errno != 0) {
        return Result::FromErrno(wait_errno, "waitpid");
    }
    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.term_signal = WTERMSIG(status);
    }
    return Result::Ok();
}

std::string LastNonEmptyLine(const std::string& text) {
    size_t end = text.size();
    while (end > 0) {
        size_t start = text.rfind('\n', end - 1);
        start = (start == std::string::npos) ? 0 : start + 1;
        std::string line = text.substr(start, end - start);
        const auto first = line.find_first_not_of(" \t\r");
        if (first != std::string::npos) {
            const auto last = line.find_last_not_of(" \t\r");
            return line.substr(first, last - first + 1);
        }
        end = (start == 0) ? 0 : start - 1;
    }
    return {};
}

} // namespace genup
