#include "utils/logger_sinks/file_sink.hpp"

#include <cerrno>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include <fmt/format.h>

namespace testrelay::utils
{

FileSink::FileSink(const std::filesystem::path &path) : m_path(path)
{
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", m_path.string(), ec.message()));
    }
}

FileSink::~FileSink()
{
    if (m_fd != -1)
    {
        ::close(m_fd);
        m_fd = -1;
    }
}

void FileSink::write(const LogMessage &msg)
{
    const std::string line = format_logmsg(msg);
    const char *data = line.data();
    std::size_t remaining = line.size();
    while (remaining > 0)
    {
        const ssize_t n = ::write(m_fd, data, remaining);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            throw std::system_error(errno, std::generic_category(),
                                    "write failed for log file " + m_path.string());
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
}

void FileSink::flush()
{
    // EINVAL means the descriptor is a pipe or terminal, which has nothing to sync.
    if (m_fd != -1 && ::fsync(m_fd) != 0 && errno != EINVAL)
    {
        throw std::system_error(errno, std::generic_category(),
                                "fsync failed for log file " + m_path.string());
    }
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace testrelay::utils
