#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

namespace
{

using ConfigValues = std::map<std::string, std::string>;

const std::string &requireValue(const ConfigValues &values, const std::string &key)
{
    auto it = values.find(key);
    if (it == values.end())
    {
        throw ConfigError(fmt::format("Missing configuration value: {}", key));
    }
    return it->second;
}

int parseInt(const std::string &key, const std::string &text)
{
    size_t consumed = 0;
    int value = 0;
    try
    {
        value = std::stoi(text, &consumed);
    }
    catch (const std::exception &)
    {
        throw ConfigError(fmt::format("Invalid integer for {}: '{}'", key, text));
    }

    // Reject trailing garbage such as "5s"
    if (consumed != text.size())
    {
        throw ConfigError(fmt::format("Invalid integer for {}: '{}'", key, text));
    }
    return value;
}

bool parseBool(const std::string &key, const std::string &text)
{
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1")
    {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0")
    {
        return false;
    }
    throw ConfigError(fmt::format("Invalid boolean for {}: '{}'", key, text));
}

} // namespace

BatchConfig loadConfig(const std::filesystem::path &path)
{
    std::vector<CLI::ConfigItem> items;
    try
    {
        items = CLI::ConfigINI().from_file(path.string());
    }
    catch (const CLI::Error &e)
    {
        throw ConfigError(fmt::format("Cannot read config file {}: {}", path.string(), e.what()));
    }

    // Flatten "[section] key = value" into "section.key"
    ConfigValues values;
    for (const auto &item : items)
    {
        // CLI11 emits "++"/"--" markers when entering/leaving a section
        if (item.name == "++" || item.name == "--")
        {
            continue;
        }
        values[item.fullname()] = item.inputs.empty() ? std::string() : item.inputs.front();
    }

    BatchConfig config;
    config.downloadsFolder = requireValue(values, "folders.downloads");
    config.inputFile = requireValue(values, "files.input");
    config.connectTimeout = parseInt("network.connect_timeout", requireValue(values, "network.connect_timeout"));
    config.readTimeout = parseInt("network.read_timeout", requireValue(values, "network.read_timeout"));
    config.maxWorkers = parseInt("settings.max_workers", requireValue(values, "settings.max_workers"));
    config.retryCount = parseInt("settings.retry_count", requireValue(values, "settings.retry_count"));
    config.retryDelay = parseInt("settings.retry_delay", requireValue(values, "settings.retry_delay"));

    auto unique = values.find("settings.unique_filenames");
    if (unique != values.end())
    {
        config.uniqueFilenames = parseBool(unique->first, unique->second);
    }

    return config;
}

void BatchConfig::validate() const
{
    if (!std::filesystem::is_directory(downloadsFolder))
    {
        throw ConfigError(fmt::format("Invalid downloads folder: {}", downloadsFolder.string()));
    }
    if (!std::filesystem::is_regular_file(inputFile))
    {
        throw ConfigError(fmt::format("Input file does not exist or is not a file: {}", inputFile.string()));
    }
    if (connectTimeout <= 0)
    {
        throw ConfigError(fmt::format("Invalid connect timeout: {}. Must be a positive integer.", connectTimeout));
    }
    if (readTimeout <= 0)
    {
        throw ConfigError(fmt::format("Invalid read timeout: {}. Must be a positive integer.", readTimeout));
    }
    if (maxWorkers <= 0)
    {
        throw ConfigError(fmt::format("Invalid max workers: {}. Must be a positive integer.", maxWorkers));
    }
    if (retryCount < 0)
    {
        throw ConfigError(fmt::format("Invalid retry count: {}. Must be a non-negative integer.", retryCount));
    }
    if (retryDelay < 0)
    {
        throw ConfigError(fmt::format("Invalid retry delay: {}. Must be a non-negative integer.", retryDelay));
    }
}
