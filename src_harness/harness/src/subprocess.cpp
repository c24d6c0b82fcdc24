#include "patchgrade_harness/subprocess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kTruncatedMarker = "[... output truncated ...]\n";

// Owns one file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_{fd} {}
    ~Fd() { reset(); }

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

// Capture buffer that never holds much more than twice its limit.
struct BoundedBuffer {
    std::size_t limit;
    std::string data;
    bool truncated{false};

    void append(const char* bytes, std::size_t n) {
        data.append(bytes, n);
        if (data.size() > 2 * limit) {
            data.erase(0, data.size() - limit);
            truncated = true;
        }
    }

    std::string finish() {
        if (data.size() > limit) {
            data.erase(0, data.size() - limit);
            truncated = true;
        }
        if (truncated) {
            data.insert(0, kTruncatedMarker);
        }
        return std::move(data);
    }
};

void set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::runtime_error sys_error(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

}  // namespace

namespace patchgrade::harness {

std::string tail_excerpt(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) {
        return text;
    }
    return std::string{kTruncatedMarker} + text.substr(text.size() - limit);
}

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("run_process: empty argv");
    }

    int out_pipe[2];
    int err_pipe[2];
    int in_pair[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) throw sys_error("pipe2");
    Fd out_read{out_pipe[0]}, out_write{out_pipe[1]};
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) throw sys_error("pipe2");
    Fd err_read{err_pipe[0]}, err_write{err_pipe[1]};
    // A socket for stdin lets us write with MSG_NOSIGNAL when the child exits early.
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, in_pair) != 0) throw sys_error("socketpair");
    Fd in_parent{in_pair[0]}, in_child{in_pair[1]};

    // Everything the child touches is prepared before fork().
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw sys_error("fork");
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(in_child.get(), STDIN_FILENO);
        ::dup2(out_write.get(), STDOUT_FILENO);
        ::dup2(err_write.get(), STDERR_FILENO);
        ::execvp(cargv[0], cargv.data());
        static constexpr char kMsg[] = "run_process: exec failed\n";
        [[maybe_unused]] const auto ignored = ::write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
        ::_exit(127);
    }

    out_write.reset();
    err_write.reset();
    in_child.reset();
    ::shutdown(in_parent.get(), SHUT_RD);

    set_nonblocking(out_read.get());
    set_nonblocking(err_read.get());
    set_nonblocking(in_parent.get());

    BoundedBuffer out_buf{options.max_output_bytes, {}};
    BoundedBuffer err_buf{options.max_output_bytes, {}};
    std::size_t stdin_offset = 0;
    if (options.stdin_data.empty()) {
        in_parent.reset();
    }

    const auto deadline = options.timeout ? std::optional<Clock::time_point>{Clock::now() + *options.timeout}
                                          : std::nullopt;
    bool timed_out = false;
    std::optional<Clock::time_point> drain_deadline;
    std::array<char, 8192> chunk{};

    while (out_read.valid() || err_read.valid()) {
        std::vector<pollfd> fds;
        if (out_read.valid()) fds.push_back({out_read.get(), POLLIN, 0});
        if (err_read.valid()) fds.push_back({err_read.get(), POLLIN, 0});
        if (in_parent.valid()) fds.push_back({in_parent.get(), POLLOUT, 0});

        int wait_ms = -1;
        const auto limit = drain_deadline ? drain_deadline : deadline;
        if (limit) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*limit - Clock::now());
            wait_ms = static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, left.count()));
        }

        const int ready = ::poll(fds.data(), fds.size(), wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            ::kill(-pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
            throw sys_error("poll");
        }
        if (ready == 0) {
            if (drain_deadline) {
                break;  // descendants still hold the pipes; stop waiting for them
            }
            timed_out = true;
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            in_parent.reset();
            drain_deadline = Clock::now() + std::chrono::seconds(1);
            continue;
        }

        for (const auto& p : fds) {
            if (p.revents == 0) continue;
            if (p.fd == in_parent.get()) {
                const auto remaining = options.stdin_data.size() - stdin_offset;
                const auto n = ::send(p.fd, options.stdin_data.data() + stdin_offset, remaining, MSG_NOSIGNAL);
                if (n > 0) {
                    stdin_offset += static_cast<std::size_t>(n);
                }
                if ((n < 0 && errno != EAGAIN && errno != EINTR) || stdin_offset >= options.stdin_data.size()) {
                    in_parent.reset();
                }
                continue;
            }
            Fd& source = (p.fd == out_read.get()) ? out_read : err_read;
            BoundedBuffer& sink = (p.fd == out_read.get()) ? out_buf : err_buf;
            const auto n = ::read(p.fd, chunk.data(), chunk.size());
            if (n > 0) {
                sink.append(chunk.data(), static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                source.reset();
            }
        }
    }
    in_parent.reset();

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw sys_error("waitpid");
        }
    }

    ProcessResult result;
    result.timed_out = timed_out;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    result.stdout_text = out_buf.finish();
    result.stderr_text = err_buf.finish();
    result.truncated = out_buf.truncated || err_buf.truncated;
    return result;
}

}  // namespace patchgrade::harness
