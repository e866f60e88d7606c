#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <stdexcept>

#include <fmt/chrono.h>

Logger::Logger(LogLevel minLevel) : minLevel_(minLevel)
{
}

Logger::~Logger() = default;

void Logger::addStream(std::FILE *stream)
{
    if (!stream)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.push_back(stream);
}

void Logger::addFile(const std::filesystem::path &path)
{
    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.string().c_str(), "a"));
    if (!file)
    {
        throw std::runtime_error(fmt::format("Cannot open log file: {}", path.string()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    streams_.push_back(file.get());
    files_.push_back(std::move(file));
}

void Logger::setMinLevel(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

void Logger::log(LogLevel level, const std::string &message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < minLevel_ || streams_.empty())
    {
        return;
    }

    const std::string line = fmt::format("{} - {} - {}\n", currentTimestamp(), levelName(level), message);
    for (std::FILE *stream : streams_)
    {
        fmt::print(stream, "{}", line);
        std::fflush(stream);
    }
}

const char *Logger::levelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    default:
        return "UNKNOWN";
    }
}

std::string Logger::currentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch())
                      .count() %
                  1000;

    return fmt::format("{:%Y-%m-%d %H:%M:%S},{:03d}", fmt::localtime(seconds), millis);
}
