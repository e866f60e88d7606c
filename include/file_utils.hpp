#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>

/**
 * Size of a file in bytes, or 0 if it does not exist.
 *
 * @throws std::filesystem::filesystem_error if the file exists but cannot be stat'ed
 */
std::uint64_t localFileSize(const std::filesystem::path &filePath);

/**
 * Modified time of a file in whole seconds since the epoch.
 *
 * @throws std::runtime_error if the file cannot be stat'ed
 */
std::time_t getFileModifiedTime(const std::filesystem::path &filePath);

/**
 * Set the modified time of a file (seconds since the epoch), leaving the
 * access time untouched. Creates the file if it does not exist.
 *
 * @throws std::runtime_error if the file cannot be created or updated
 */
void setFileModifiedTime(const std::filesystem::path &filePath, std::time_t timestamp);

/**
 * Create a folder and its parents if they don't exist (like mkdir -p).
 *
 * @throws std::filesystem::filesystem_error on failure
 */
void createFolder(const std::filesystem::path &folderPath);
