#include "worker/test_engine.hpp"

#include "trl_platform.hpp"
#include "utils/logger.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace testrelay::worker
{

namespace
{
constexpr std::string_view kBundlePlaceholder = "{bundle}";
constexpr std::size_t kStderrTail = 2000;
constexpr std::size_t kReadChunk = 4096;

std::atomic<uint64_t> g_bundle_seq{0};

// Deletes the bundle file when the run is over, whatever the outcome.
struct TempFile
{
    std::filesystem::path path;

    explicit TempFile(std::filesystem::path p) : path(std::move(p)) {}
    TempFile(const TempFile &) = delete;
    TempFile &operator=(const TempFile &) = delete;
    ~TempFile()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

struct Fd
{
    int fd{-1};

    Fd() = default;
    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;
    ~Fd() { reset(); }
    void reset() noexcept
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
};

void make_pipe(Fd &read_end, Fd &write_end)
{
    int fds[2];
    if (::pipe(fds) != 0)
    {
        throw std::system_error(errno, std::generic_category(), "CommandEngine: pipe");
    }
    read_end.fd = fds[0];
    write_end.fd = fds[1];
    ::fcntl(read_end.fd, F_SETFD, FD_CLOEXEC);
    ::fcntl(write_end.fd, F_SETFD, FD_CLOEXEC);
}

std::string substitute(std::string command, const std::string &path)
{
    std::size_t pos = 0;
    while ((pos = command.find(kBundlePlaceholder, pos)) != std::string::npos)
    {
        command.replace(pos, kBundlePlaceholder.size(), path);
        pos += path.size();
    }
    return command;
}

int wait_child(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw std::system_error(errno, std::generic_category(), "CommandEngine: waitpid");
        }
    }
    return status;
}

// Reaps @p pid if it exits before @p deadline.
std::optional<int> wait_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline)
{
    constexpr std::chrono::milliseconds kReapPoll{10};
    while (true)
    {
        int status = 0;
        const pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid)
        {
            return status;
        }
        if (rc < 0 && errno != EINTR)
        {
            throw std::system_error(errno, std::generic_category(), "CommandEngine: waitpid");
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            return std::nullopt;
        }
        std::this_thread::sleep_for(kReapPoll);
    }
}

std::string tail(const std::string &s, std::size_t n)
{
    return s.size() <= n ? s : s.substr(s.size() - n);
}
} // namespace

CommandEngine::CommandEngine(std::string command, std::filesystem::path work_dir)
    : m_command(std::move(command)), m_work_dir(std::move(work_dir))
{
    if (m_command.empty())
    {
        throw std::invalid_argument("CommandEngine: command must not be empty");
    }
}

nlohmann::json CommandEngine::execute(std::span<const uint8_t> bundle, const ExecutionOptions &options)
{
    TempFile file{m_work_dir / fmt::format("testrelay-{}-{}.bundle", platform::get_pid(),
                                           g_bundle_seq.fetch_add(1) + 1)};
    {
        std::ofstream out(file.path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char *>(bundle.data()),
                  static_cast<std::streamsize>(bundle.size()));
        if (!out)
        {
            throw std::runtime_error("CommandEngine: cannot write bundle to " + file.path.string());
        }
    }

    const std::string cmd = substitute(m_command, file.path.string());
    LOGGER_DEBUG("CommandEngine: job {}: running '{}'", options.job_id, cmd);

    Fd out_r;
    Fd out_w;
    Fd err_r;
    Fd err_w;
    make_pipe(out_r, out_w);
    make_pipe(err_r, err_w);

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        throw std::system_error(errno, std::generic_category(), "CommandEngine: fork");
    }
    if (pid == 0)
    {
        // Child: own process group so a timeout kill reaches the whole pipeline.
        ::setpgid(0, 0);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0)
        {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_w.fd, STDOUT_FILENO);
        ::dup2(err_w.fd, STDERR_FILENO);
        ::execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr));
        _exit(127);
    }
    ::setpgid(pid, pid);
    out_w.reset();
    err_w.reset();

    std::string out_text;
    std::string err_text;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool timed_out = false;
    char buf[kReadChunk];

    while (out_r.fd >= 0 || err_r.fd >= 0)
    {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            timed_out = true;
            break;
        }
        pollfd fds[2] = {{out_r.fd, POLLIN, 0}, {err_r.fd, POLLIN, 0}};
        const int rc = ::poll(fds, 2, static_cast<int>(remaining.count()));
        if (rc < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const int err = errno;
            ::kill(-pid, SIGKILL);
            static_cast<void>(wait_child(pid));
            throw std::system_error(err, std::generic_category(), "CommandEngine: poll");
        }
        for (int i = 0; i < 2; ++i)
        {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            {
                continue;
            }
            Fd &src = i == 0 ? out_r : err_r;
            std::string &dst = i == 0 ? out_text : err_text;
            const ssize_t n = ::read(src.fd, buf, sizeof(buf));
            if (n > 0)
            {
                dst.append(buf, static_cast<std::size_t>(n));
            }
            else if (n == 0 || errno != EINTR)
            {
                src.reset();
            }
        }
    }

    // The command may close its output and keep running.
    std::optional<int> reaped;
    if (!timed_out)
    {
        reaped = wait_child_until(pid, deadline);
    }
    if (!reaped)
    {
        ::kill(-pid, SIGKILL);
        static_cast<void>(wait_child(pid));
        throw std::runtime_error(
            fmt::format("command timed out after {} ms", options.timeout.count()));
    }

    const int status = *reaped;
    if (WIFSIGNALED(status))
    {
        throw std::runtime_error(fmt::format("command killed by signal {}: {}", WTERMSIG(status),
                                             tail(err_text, kStderrTail)));
    }
    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code != 0)
    {
        throw std::runtime_error(
            fmt::format("command exited with status {}: {}", code, tail(err_text, kStderrTail)));
    }

    LOGGER_DEBUG("CommandEngine: job {}: {} bytes of output", options.job_id, out_text.size());
    try
    {
        return nlohmann::json::parse(out_text);
    }
    catch (const nlohmann::json::parse_error &)
    {
        return nlohmann::json{{"stdout", out_text}};
    }
}

} // namespace testrelay::worker
