#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

/**
 * Thread-safe line logger.
 * Each record is written as "2024-05-01 12:00:00,123 - INFO - message" to
 * every attached sink. A logger without sinks discards everything, which keeps
 * the engine usable in tests without touching shared output.
 *
 * The engine receives a Logger& rather than using a process-wide instance.
 */
class Logger
{
public:
    explicit Logger(LogLevel minLevel = LogLevel::Info);
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    /**
     * Attach a stream the logger does not own (e.g. stdout).
     */
    void addStream(std::FILE *stream);

    /**
     * Open a log file in append mode and attach it.
     *
     * @param path Log file path
     * @throws std::runtime_error if the file cannot be opened
     */
    void addFile(const std::filesystem::path &path);

    void setMinLevel(LogLevel level);

    void log(LogLevel level, const std::string &message);

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::Debug, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::Info, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void warning(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::Warning, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args &&...args)
    {
        log(LogLevel::Error, fmt::format(format, std::forward<Args>(args)...));
    }

    static const char *levelName(LogLevel level);

private:
    struct FileCloser
    {
        void operator()(std::FILE *fp) const noexcept
        {
            if (fp)
            {
                std::fclose(fp);
            }
        }
    };

    static std::string currentTimestamp();

    std::mutex mutex_;
    LogLevel minLevel_;
    std::vector<std::FILE *> streams_;
    std::vector<std::unique_ptr<std::FILE, FileCloser>> files_;
};
