#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * Read the batch input: one URL per line, in file order.
 * Trailing '\r' is stripped; duplicates and blank lines are kept (a blank
 * line later fails as an invalid URL).
 *
 * @throws ConfigError if the file cannot be opened
 */
std::vector<std::string> readUrlList(const std::filesystem::path &path);
