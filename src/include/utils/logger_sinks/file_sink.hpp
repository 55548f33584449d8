#pragma once

#include <filesystem>
#include <string>

#include "utils/logger_sinks/sink.hpp"

namespace testrelay::utils
{

/**
 * @brief Appends formatted records to a file opened with O_APPEND.
 * @throws std::runtime_error from the constructor when the file cannot be opened.
 * @throws std::system_error from write() when the descriptor rejects the data.
 */
class FileSink : public Sink
{
  public:
    explicit FileSink(const std::filesystem::path &path);
    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;
    void flush() override;
    std::string description() const override;

  private:
    std::filesystem::path m_path;
    int m_fd{-1};
};

} // namespace testrelay::utils
