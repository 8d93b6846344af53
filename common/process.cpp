// ============================================================
// process.cpp -- fork/execv child with captured stdout/stderr
// ============================================================

#include "process.hpp"
#include <chrono>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

// Time between SIGTERM and SIGKILL once the timeout has expired
static constexpr int KILL_GRACE_MS = 2000;
static constexpr size_t READ_CHUNK = 4096;

namespace {

// Owns one file descriptor
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    ~Fd() { close(); }

    Fd(Fd&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    Fd& operator=(Fd&& o) noexcept {
        if (this != &o) {
            close();
            fd_ = o.fd_;
            o.fd_ = -1;
        }
        return *this;
    }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    int get() const { return fd_; }
    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

void make_pipe(Fd& rd, Fd& wr) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::runtime_error("pipe2() failed: " + os_error_str(last_os_error()));
    }
    rd = Fd(fds[0]);
    wr = Fd(fds[1]);
}

int wait_child(pid_t pid) {
    int st = 0;
    while (::waitpid(pid, &st, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error("waitpid() failed: " + os_error_str(last_os_error()));
        }
    }
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return -1;
}

// Child side: only async-signal-safe calls from here on
[[noreturn]] void exec_child(int in_fd, int out_fd, int err_fd,
                             const char* path, char* const* argv) {
    ::dup2(in_fd, STDIN_FILENO);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);
    ::execv(path, argv);
    static const char msg[] = "execv failed: ";
    ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
    ignored = ::write(STDERR_FILENO, path, std::strlen(path));
    ignored = ::write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    ::_exit(PROCESS_EXEC_FAILED_STATUS);
}

} // namespace

namespace process {

ProcessResult run(const std::vector<std::string>& argv, int timeout_secs) {
    if (argv.empty()) {
        throw std::invalid_argument("process::run: empty argv");
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    Fd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
    if (dev_null.get() < 0) {
        throw std::runtime_error("open(/dev/null) failed: " + os_error_str(last_os_error()));
    }
    Fd out_rd, out_wr, err_rd, err_wr;
    make_pipe(out_rd, out_wr);
    make_pipe(err_rd, err_wr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error("fork() failed: " + os_error_str(last_os_error()));
    }
    if (pid == 0) {
        exec_child(dev_null.get(), out_wr.get(), err_wr.get(), cargv[0], cargv.data());
    }

    out_wr.close();
    err_wr.close();
    dev_null.close();

    using clock = std::chrono::steady_clock;
    enum class Phase { RUNNING, TERM_SENT, KILL_SENT };
    Phase phase = Phase::RUNNING;
    auto deadline = clock::now() + std::chrono::seconds(timeout_secs);

    ProcessResult res;
    struct pollfd pfd[2];
    pfd[0].fd = out_rd.get();
    pfd[0].events = POLLIN;
    pfd[1].fd = err_rd.get();
    pfd[1].events = POLLIN;
    std::string* sinks[2] = { &res.out, &res.err };
    char buf[READ_CHUNK];

    while (pfd[0].fd >= 0 || pfd[1].fd >= 0) {
        int wait_ms = -1;
        if (timeout_secs > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                            deadline - clock::now()).count();
            wait_ms = left > 0 ? (int)left : 0;
        }

        int rc = ::poll(pfd, 2, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            int err = last_os_error();
            ::kill(pid, SIGKILL);
            wait_child(pid);
            throw std::runtime_error("poll() failed: " + os_error_str(err));
        }

        if (rc == 0) {
            if (phase == Phase::RUNNING) {
                res.timed_out = true;
                ::kill(pid, SIGTERM);
                phase = Phase::TERM_SENT;
            } else if (phase == Phase::TERM_SENT) {
                ::kill(pid, SIGKILL);
                phase = Phase::KILL_SENT;
            } else {
                // A descendant still holds the pipes open
                break;
            }
            deadline = clock::now() + std::chrono::milliseconds(KILL_GRACE_MS);
            continue;
        }

        for (int i = 0; i < 2; ++i) {
            if (pfd[i].fd < 0 || pfd[i].revents == 0) continue;
            ssize_t n = ::read(pfd[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, (size_t)n);
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                pfd[i].fd = -1;
            }
        }
    }

    res.exit_status = wait_child(pid);
    if (res.timed_out) {
        res.err += "timed out after " + std::to_string(timeout_secs) + "s\n";
        res.exit_status = PROCESS_TIMEOUT_STATUS;
    }
    return res;
}

} // namespace process
