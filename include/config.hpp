#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

/**
 * Raised for any problem that must stop the run before network activity:
 * unreadable or incomplete config file, out-of-range values, missing folders.
 */
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Command-line options.
 * Populated by CLI11 argument parser in main().
 */
struct CliOptions
{
    std::string configFile;
    std::string logFile = "download.log"; // Same default as the log sink name

    bool showVersion = false;
};

/**
 * Validated batch configuration.
 * Populated from the INI file named on the command line.
 */
struct BatchConfig
{
    // [folders]
    std::filesystem::path downloadsFolder;

    // [files]
    std::filesystem::path inputFile;

    // [network] (seconds)
    int connectTimeout = 10;
    int readTimeout = 30;

    // [settings]
    int maxWorkers = 4;
    int retryCount = 3;
    int retryDelay = 5; // seconds
    bool uniqueFilenames = true;

    /**
     * Check every value against its allowed range.
     *
     * @throws ConfigError describing the first invalid value
     */
    void validate() const;
};

/**
 * Read an INI configuration file.
 * Sections and keys:
 *   [folders]  downloads
 *   [files]    input
 *   [network]  connect_timeout, read_timeout
 *   [settings] max_workers, retry_count, retry_delay, unique_filenames (optional)
 *
 * Does not validate; call BatchConfig::validate() on the result.
 *
 * @param path Path to the INI file
 * @return Parsed configuration
 * @throws ConfigError if the file cannot be read, a key is missing or a
 *         number does not parse
 */
BatchConfig loadConfig(const std::filesystem::path &path);
