#include "naming_policy.hpp"

#include <chrono>
#include <ctime>
#include <random>
#include <stdexcept>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "file_utils.hpp"
#include "logger.hpp"
#include "url.hpp"

namespace
{

// Longest file name most filesystems accept
constexpr size_t MAX_FILENAME_LENGTH = 255;

int randomSuffix()
{
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(0, 9999);
    return dis(gen);
}

} // namespace

PrefixFolderNamingPolicy::PrefixFolderNamingPolicy(std::filesystem::path downloadsFolder,
                                                   bool uniqueNames,
                                                   Logger &logger)
    : downloadsFolder_(std::move(downloadsFolder)), uniqueNames_(uniqueNames), logger_(logger)
{
}

std::string PrefixFolderNamingPolicy::subfolderFor(const std::string &stem)
{
    if (stem.rfind("DM_", 0) == 0)
    {
        return "DM";
    }
    if (stem.rfind("DO_", 0) == 0)
    {
        return "DO";
    }
    if (stem.rfind("DA_", 0) == 0)
    {
        return "DA";
    }
    return "";
}

std::string PrefixFolderNamingPolicy::generateUniqueFilename(const std::string &stem, const std::string &extension)
{
    const std::string timestamp = fmt::format("{:%Y%m%d%H%M%S}", fmt::localtime(std::time(nullptr)));
    const std::string random = std::to_string(randomSuffix());

    // Room left for the stem once extension, timestamp, number and two
    // underscores are accounted for
    const size_t reserved = extension.size() + 1 + timestamp.size() + random.size() + 2;
    const size_t maxStem = reserved < MAX_FILENAME_LENGTH ? MAX_FILENAME_LENGTH - reserved : 0;

    std::string trimmed = stem.size() > maxStem ? stem.substr(0, maxStem) : stem;
    return fmt::format("{}_{}_{}{}", trimmed, timestamp, random, extension);
}

std::filesystem::path PrefixFolderNamingPolicy::destinationFor(const std::string &encodedUrl)
{
    const std::filesystem::path urlPath(parseUrl(encodedUrl).path);
    std::string stem = urlPath.stem().string();
    const std::string extension = urlPath.extension().string();
    if (stem.empty())
    {
        stem = "download"; // URL ends in '/'
    }

    if (!std::filesystem::is_directory(downloadsFolder_))
    {
        throw std::runtime_error(fmt::format("Invalid downloads folder: {}", downloadsFolder_.string()));
    }

    std::filesystem::path folder = downloadsFolder_;
    const std::string subfolder = subfolderFor(stem);
    if (subfolder.empty())
    {
        logger_.warning("No subfolder specified for URL: {}", encodedUrl);
    }
    else
    {
        folder /= subfolder;
        createFolder(folder);
    }

    return uniqueNames_ ? claimUnique(folder, stem, extension)
                        : claimDeterministic(encodedUrl, folder, stem, extension);
}

std::filesystem::path PrefixFolderNamingPolicy::claimDeterministic(const std::string &encodedUrl,
                                                                   const std::filesystem::path &folder,
                                                                   const std::string &stem,
                                                                   const std::string &extension)
{
    std::lock_guard<std::mutex> lock(claimsMutex_);

    auto known = pathByUrl_.find(encodedUrl);
    if (known != pathByUrl_.end())
    {
        return known->second;
    }

    std::filesystem::path candidate = folder / (stem + extension);
    for (int n = 1; claimedPaths_.count(candidate) > 0; ++n)
    {
        candidate = folder / fmt::format("{}_{}{}", stem, n, extension);
    }

    if (candidate.filename() != stem + extension)
    {
        logger_.warning("Name clash for URL: {}; storing it as {}", encodedUrl, candidate.filename().string());
    }

    claimedPaths_.insert(candidate);
    pathByUrl_.emplace(encodedUrl, candidate);
    return candidate;
}

std::filesystem::path PrefixFolderNamingPolicy::claimUnique(const std::filesystem::path &folder,
                                                            const std::string &stem,
                                                            const std::string &extension)
{
    std::lock_guard<std::mutex> lock(claimsMutex_);

    std::filesystem::path candidate;
    do
    {
        candidate = folder / generateUniqueFilename(stem, extension);
    } while (claimedPaths_.count(candidate) > 0);

    claimedPaths_.insert(candidate);
    return candidate;
}
