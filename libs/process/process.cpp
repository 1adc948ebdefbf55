/**
 * @file process.cpp
 * @brief fork/exec runner with poll-based capture
 */

#include "evmverify/process.hpp"

#include "evmverify/outcome.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace evmverify::process {

namespace {

constexpr int kPollIntervalMs = 50;
constexpr int kExecFailedStatus = 127;
constexpr int kChdirFailedStatus = 126;

/**
 * @brief Owning file descriptor
 */
class UniqueFd
{
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept
        : m_fd(fd)
    {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept
        : m_fd(std::exchange(other.m_fd, -1))
    {}
    UniqueFd& operator=(UniqueFd&& other) noexcept
    {
        if (this != &other) {
            reset(std::exchange(other.m_fd, -1));
        }
        return *this;
    }
    ~UniqueFd() { reset(); }

    [[nodiscard]] int get() const noexcept { return m_fd; }
    [[nodiscard]] bool valid() const noexcept { return m_fd >= 0; }

    void reset(int fd = -1) noexcept
    {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
        m_fd = fd;
    }

private:
    int m_fd = -1;
};

struct Pipe
{
    UniqueFd read_end;
    UniqueFd write_end;
};

[[nodiscard]] Error spawn_error(std::string_view what)
{
    return Error::make(std::string(error_code::kProcessSpawnFailed),
                       std::format("{}: {}", what, std::strerror(errno)));
}

[[nodiscard]] Result<Pipe> make_pipe()
{
    std::array<int, 2> fds{};
    // O_CLOEXEC so builds forked concurrently from other workers never inherit these ends.
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return std::unexpected(spawn_error("Failed to create pipe"));
    }
    return Pipe{.read_end = UniqueFd(fds[0]), .write_end = UniqueFd(fds[1])};
}

void set_nonblocking(int fd) noexcept
{
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/**
 * @brief Read what is available; close the descriptor on EOF
 */
void drain(UniqueFd& fd, std::string& sink)
{
    std::array<char, 4096> buffer{};
    while (fd.valid()) {
        const ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
        if (n > 0) {
            const auto room = kMaxCapturedBytes - std::min(sink.size(), kMaxCapturedBytes);
            sink.append(buffer.data(), std::min(room, static_cast<std::size_t>(n)));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        fd.reset();
    }
}

[[nodiscard]] int decode_status(int status) noexcept
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

/// Only async-signal-safe calls from here on
[[noreturn]] void exec_child(const std::vector<char*>& argv,
                             const char* cwd,
                             int stdout_fd,
                             int stderr_fd) noexcept
{
    ::setpgid(0, 0);
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);
    if (cwd != nullptr && ::chdir(cwd) != 0) {
        constexpr std::string_view kMessage = "evmverify: cannot enter working directory\n";
        [[maybe_unused]] auto written = ::write(STDERR_FILENO, kMessage.data(), kMessage.size());
        ::_exit(kChdirFailedStatus);
    }
    ::execvp(argv[0], argv.data());
    constexpr std::string_view kMessage = "evmverify: exec failed\n";
    [[maybe_unused]] auto written = ::write(STDERR_FILENO, kMessage.data(), kMessage.size());
    ::_exit(kExecFailedStatus);
}

}  // namespace

std::string describe_command(const std::vector<std::string>& argv)
{
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            out += std::format("'{}'", arg);
        } else {
            out += arg;
        }
    }
    return out;
}

Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                  const std::filesystem::path& cwd,
                                  std::chrono::seconds timeout)
{
    if (argv.empty()) {
        return std::unexpected(Error::make(std::string(error_code::kProcessSpawnFailed),
                                           "Cannot run an empty command"));
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);
    const std::string cwd_text = cwd.string();
    const char* cwd_ptr = cwd_text.empty() ? nullptr : cwd_text.c_str();

    auto out_pipe = make_pipe();
    if (!out_pipe) {
        return std::unexpected(out_pipe.error());
    }
    auto err_pipe = make_pipe();
    if (!err_pipe) {
        return std::unexpected(err_pipe.error());
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(spawn_error("Failed to fork"));
    }
    if (pid == 0) {
        exec_child(c_argv, cwd_ptr, out_pipe->write_end.get(), err_pipe->write_end.get());
    }

    // Both sides call setpgid so the group exists before any kill.
    ::setpgid(pid, pid);
    out_pipe->write_end.reset();
    err_pipe->write_end.reset();
    set_nonblocking(out_pipe->read_end.get());
    set_nonblocking(err_pipe->read_end.get());

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;

    while (true) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        for (auto* fd : {&out_pipe->read_end, &err_pipe->read_end}) {
            if (fd->valid()) {
                fds[count++] = pollfd{.fd = fd->get(), .events = POLLIN, .revents = 0};
            }
        }
        if (count > 0) {
            ::poll(fds.data(), count, kPollIntervalMs);
        } else {
            ::usleep(kPollIntervalMs * 1000);
        }
        drain(out_pipe->read_end, result.stdout_text);
        drain(err_pipe->read_end, result.stderr_text);

        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            return std::unexpected(spawn_error("Failed to wait for child"));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            ::kill(-pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            return std::unexpected(Error::make(
                std::string(error_code::kTimeout),
                std::format("'{}' exceeded {}s and was killed", describe_command(argv),
                            timeout.count())));
        }
    }

    // Collect anything written between the last poll and exit.
    drain(out_pipe->read_end, result.stdout_text);
    drain(err_pipe->read_end, result.stderr_text);
    // The byte cap can split a character.
    for (auto* text : {&result.stdout_text, &result.stderr_text}) {
        if (text->size() >= kMaxCapturedBytes) {
            text->resize(common::utf8_complete_prefix(*text).size());
        }
    }
    result.exit_code = decode_status(status);
    return result;
}

}  // namespace evmverify::process
