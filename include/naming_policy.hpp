#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>

class Logger;

/**
 * Decides where a downloaded URL is stored.
 * Implementations must return paths that do not collide across URLs
 * dispatched in the same batch.
 */
class NamingPolicy
{
public:
    virtual ~NamingPolicy() = default;

    /**
     * Resolve (and prepare the folders for) the destination of a URL.
     *
     * @param encodedUrl Percent-encoded absolute URL
     * @return Destination file path
     * @throws std::runtime_error if the destination folder is unusable
     */
    virtual std::filesystem::path destinationFor(const std::string &encodedUrl) = 0;
};

/**
 * Files go under the downloads folder, in a subfolder chosen by the file name
 * prefix: "DM_*" -> DM/, "DO_*" -> DO/, "DA_*" -> DA/, anything else stays at
 * the top level.
 *
 * With unique names on, "DM_x.jpg" becomes "DM/DM_x_20240501120000_42.jpg";
 * with unique names off it stays "DM/DM_x.jpg", so re-runs find the file again.
 *
 * Paths are never shared between two different URLs for the lifetime of the
 * policy: a deterministic name already taken by another URL gets a "_<n>"
 * suffix ("DM/DM_x_1.jpg"). The same URL asked again gets its earlier path
 * back, so later rounds resume the same file.
 */
class PrefixFolderNamingPolicy : public NamingPolicy
{
public:
    PrefixFolderNamingPolicy(std::filesystem::path downloadsFolder, bool uniqueNames, Logger &logger);

    std::filesystem::path destinationFor(const std::string &encodedUrl) override;

    /**
     * Subfolder for a file stem, or "" if the stem has no known prefix.
     */
    static std::string subfolderFor(const std::string &stem);

    /**
     * Append "_<YYYYmmddHHMMSS>_<random>" to a stem, truncating the stem so
     * the whole name (extension included) fits in 255 bytes.
     */
    static std::string generateUniqueFilename(const std::string &stem, const std::string &extension);

private:
    std::filesystem::path claimDeterministic(const std::string &encodedUrl,
                                             const std::filesystem::path &folder,
                                             const std::string &stem,
                                             const std::string &extension);
    std::filesystem::path claimUnique(const std::filesystem::path &folder,
                                      const std::string &stem,
                                      const std::string &extension);

    std::filesystem::path downloadsFolder_;
    bool uniqueNames_;
    Logger &logger_;

    std::mutex claimsMutex_;
    std::set<std::filesystem::path> claimedPaths_;
    std::map<std::string, std::filesystem::path> pathByUrl_;
};
