#include "file_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>

#include <fmt/core.h>

std::uint64_t localFileSize(const std::filesystem::path &filePath)
{
    if (!std::filesystem::exists(filePath))
    {
        return 0;
    }
    return static_cast<std::uint64_t>(std::filesystem::file_size(filePath));
}

std::time_t getFileModifiedTime(const std::filesystem::path &filePath)
{
    struct stat info{};
    if (::stat(filePath.c_str(), &info) != 0)
    {
        throw std::runtime_error(fmt::format("Cannot stat {}: {}", filePath.string(), std::strerror(errno)));
    }
    return info.st_mtime;
}

void setFileModifiedTime(const std::filesystem::path &filePath, std::time_t timestamp)
{
    // Touch: make sure the file exists before changing its times
    if (!std::filesystem::exists(filePath))
    {
        std::ofstream touch(filePath, std::ios::binary | std::ios::app);
        if (!touch)
        {
            throw std::runtime_error(fmt::format("Cannot create file: {}", filePath.string()));
        }
    }

    struct timespec times[2];
    times[0].tv_sec = 0;
    times[0].tv_nsec = UTIME_OMIT; // keep access time
    times[1].tv_sec = timestamp;
    times[1].tv_nsec = 0;

    if (::utimensat(AT_FDCWD, filePath.c_str(), times, 0) != 0)
    {
        throw std::runtime_error(fmt::format("Cannot set modified time of {}: {}",
                                             filePath.string(), std::strerror(errno)));
    }
}

void createFolder(const std::filesystem::path &folderPath)
{
    std::error_code ec;
    std::filesystem::create_directories(folderPath, ec);

    // Another worker may have created it in between
    if (ec && !std::filesystem::is_directory(folderPath))
    {
        throw std::filesystem::filesystem_error("Cannot create folder", folderPath, ec);
    }
}
