#include "runtime/process.hpp"
#include <spdlog/spdlog.h>

#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <sched.h>
#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <mutex>
#include <vector>

extern char** environ;

namespace sandpit::runtime {

namespace {

constexpr int POLL_SLICE_MS = 50;

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Child side: a limit that cannot be applied aborts the launch
void set_rlimit_or_die(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = value;
    rl.rlim_max = value;
    if (setrlimit(resource, &rl) != 0) {
        _exit(126);
    }
}

void child_fail(const char* what) {
    // Only async-signal-safe calls after fork
    (void)!write(STDERR_FILENO, what, std::strlen(what));
    _exit(126);
}

// Read what is available; false once the stream hit EOF
bool drain(int fd, std::string& out, size_t limit, bool& truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = limit > out.size() ? limit - out.size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            out.append(buf, take);
            if (take < static_cast<size_t>(n)) {
                truncated = true;
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = SIG_IGN;
        if (sigaction(SIGPIPE, &sa, nullptr) != 0) {
            spdlog::warn("Cannot ignore SIGPIPE: {}", strerror(errno));
        }
    });
}

} // namespace

// ============================================================================
// Process Runner
// ============================================================================

void kill_process_group(pid_t pgid) {
    if (pgid <= 0) return;
    if (kill(-pgid, SIGKILL) < 0 && errno != ESRCH) {
        spdlog::debug("kill(-{}) failed: {}", pgid, strerror(errno));
    }
}

bool run_process(const ProcessSpec& spec, ProcessResult& result) {
    result = ProcessResult{};
    if (spec.argv.empty() || spec.argv[0].empty()) {
        result.error = "empty argv";
        return false;
    }

    ignore_sigpipe_once();

    // Everything the child touches is built before fork
    std::vector<char*> argv;
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    auto overridden = [&spec](const std::string& kv) {
        std::string key = kv.substr(0, kv.find('='));
        if (key == "LD_PRELOAD" || key == "LD_LIBRARY_PATH") return true;
        for (const auto& extra : spec.env) {
            if (extra.compare(0, key.size() + 1, key + "=") == 0) return true;
        }
        return false;
    };
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        if (!overridden(kv)) env_storage.push_back(std::move(kv));
    }
    env_storage.insert(env_storage.end(), spec.env.begin(), spec.env.end());
    std::vector<char*> envp;
    for (auto& kv : env_storage) {
        envp.push_back(const_cast<char*>(kv.c_str()));
    }
    envp.push_back(nullptr);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int sync_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, sync_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (pipe2(in_pipe, O_CLOEXEC) < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 ||
        pipe2(err_pipe, O_CLOEXEC) < 0 || pipe2(sync_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe failed: ") + strerror(errno);
        close_all();
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();

    if (pid < 0) {
        result.error = std::string("fork failed: ") + strerror(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        // Own process group so a timeout kill reaches every descendant
        setpgid(0, 0);

        // Wait for the parent (cgroup placement)
        char go;
        ssize_t r;
        do {
            r = read(sync_pipe[0], &go, 1);
        } while (r < 0 && errno == EINTR);

        if (dup2(in_pipe[0], STDIN_FILENO) < 0 ||
            dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[1], STDERR_FILENO) < 0) {
            _exit(126);
        }

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        if (maxfd > 4096) maxfd = 4096;
        for (int fd = 3; fd < maxfd; fd++) {
            close(fd);
        }

        signal(SIGPIPE, SIG_DFL);

        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            child_fail("sandpit: cannot enter working directory\n");
        }
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0 ||
            prctl(PR_SET_PDEATHSIG, SIGKILL) != 0) {
            child_fail("sandpit: prctl failed\n");
        }

        const auto& lim = spec.limits;
        if (lim.address_space_bytes > 0) set_rlimit_or_die(RLIMIT_AS, lim.address_space_bytes);
        if (lim.cpu_time_sec > 0) set_rlimit_or_die(RLIMIT_CPU, lim.cpu_time_sec);
        if (lim.file_size_bytes > 0) set_rlimit_or_die(RLIMIT_FSIZE, lim.file_size_bytes);
        if (lim.max_open_files > 0) set_rlimit_or_die(RLIMIT_NOFILE, lim.max_open_files);

        if (spec.isolate_network && unshare(CLONE_NEWNET) != 0) {
            child_fail("sandpit: cannot isolate network\n");
        }

        execvpe(argv[0], argv.data(), envp.data());
        const char msg[] = "sandpit: exec failed\n";
        (void)!write(STDERR_FILENO, msg, sizeof(msg) - 1);
        _exit(127);
    }

    // Parent
    if (setpgid(pid, pid) < 0 && errno != EACCES) {
        spdlog::debug("setpgid({}) failed: {}", pid, strerror(errno));
    }
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(sync_pipe[0]);

    if (spec.on_spawn) {
        spec.on_spawn(pid);
    }
    if (write(sync_pipe[1], "x", 1) != 1) {
        spdlog::warn("Failed to release child {}: {}", pid, strerror(errno));
    }
    close_fd(sync_pipe[1]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    int in_fd = in_pipe[1];
    out_pipe[0] = err_pipe[0] = in_pipe[1] = -1;

    if (!set_nonblocking(out_fd) || !set_nonblocking(err_fd) || !set_nonblocking(in_fd)) {
        spdlog::warn("Failed to make pipes non-blocking for PID {}", pid);
    }

    size_t stdin_offset = 0;
    if (spec.stdin_data.empty()) {
        close_fd(in_fd);
    }

    int status = 0;
    bool exited = false;

    while (!exited) {
        std::vector<pollfd> fds;
        if (out_fd >= 0) fds.push_back({out_fd, POLLIN, 0});
        if (err_fd >= 0) fds.push_back({err_fd, POLLIN, 0});
        if (in_fd >= 0) fds.push_back({in_fd, POLLOUT, 0});

        int slice = POLL_SLICE_MS;
        if (spec.timeout.count() > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            auto remaining = spec.timeout - elapsed;
            if (remaining.count() < slice) slice = std::max<int>(1, static_cast<int>(remaining.count()));
        }
        if (!fds.empty()) {
            if (poll(fds.data(), fds.size(), slice) < 0 && errno != EINTR) {
                spdlog::warn("poll failed for PID {}: {}", pid, strerror(errno));
            }
        } else {
            usleep(slice * 1000);
        }

        if (out_fd >= 0 && !drain(out_fd, result.stdout_data, spec.output_limit, result.stdout_truncated)) {
            close_fd(out_fd);
        }
        if (err_fd >= 0 && !drain(err_fd, result.stderr_data, spec.output_limit, result.stderr_truncated)) {
            close_fd(err_fd);
        }
        if (in_fd >= 0) {
            ssize_t n = write(in_fd, spec.stdin_data.data() + stdin_offset,
                              spec.stdin_data.size() - stdin_offset);
            if (n > 0) {
                stdin_offset += static_cast<size_t>(n);
            }
            if ((n < 0 && errno != EAGAIN && errno != EINTR) || stdin_offset >= spec.stdin_data.size()) {
                close_fd(in_fd);
            }
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            exited = true;
            break;
        }

        bool cancelled = spec.cancel && spec.cancel->load();
        bool timed_out = spec.timeout.count() > 0 &&
                         std::chrono::steady_clock::now() - start >= spec.timeout;
        if (cancelled || timed_out) {
            result.cancelled = cancelled;
            result.timed_out = timed_out && !cancelled;
            kill_process_group(pid);
            if (kill(pid, SIGKILL) < 0 && errno != ESRCH) {
                spdlog::warn("kill({}) failed: {}", pid, strerror(errno));
            }
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            exited = true;
        }
    }

    // Collect what is left, then reap stragglers still holding the pipes
    if (out_fd >= 0) drain(out_fd, result.stdout_data, spec.output_limit, result.stdout_truncated);
    if (err_fd >= 0) drain(err_fd, result.stderr_data, spec.output_limit, result.stderr_truncated);
    kill_process_group(pid);
    close_fd(out_fd);
    close_fd(err_fd);
    close_fd(in_fd);

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    } else {
        result.exit_code = 128;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return true;
}

} // namespace sandpit::runtime
