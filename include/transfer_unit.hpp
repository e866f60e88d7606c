#pragma once

#include <ctime>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class HttpClient;
class Logger;
class NamingPolicy;

/**
 * Result of one download attempt for one URL.
 * Either success with a path, or failure with a message (and the
 * destination path if one had been resolved). Never both.
 */
struct TransferOutcome
{
    std::string url;
    bool success = false;
    std::filesystem::path path;
    std::string errorMessage;

    static TransferOutcome succeeded(std::string url, std::filesystem::path path);
    static TransferOutcome failed(std::string url, std::filesystem::path path, std::string message);
};

/**
 * Downloads or resumes a single URL into a single file.
 *
 * What happens depends only on the remote size, the remote Last-Modified and
 * the local file size, so running it again over a half-populated folder
 * continues where the last run stopped:
 *   - local mtime == remote Last-Modified   -> done, nothing transferred
 *   - local size  >= remote Content-Length  -> done, nothing transferred
 *   - otherwise GET "Range: bytes=<local size>-"
 *       206 -> append, 200 -> overwrite, anything else -> failure
 *       416 with no Content-Length and a non-empty local file -> done
 *   - final size must equal Content-Length; the file is kept either way
 *   - mtime is set to Last-Modified (mismatch is only a warning)
 *
 * Safe to call from several threads. Attempts that resolve to the same
 * destination run one after the other.
 */
class TransferUnit
{
public:
    TransferUnit(HttpClient &http, NamingPolicy &naming, Logger &logger);

    /**
     * Run one attempt. Never throws: every error becomes a failed outcome.
     */
    TransferOutcome run(const std::string &url) const;

private:
    TransferOutcome transfer(const std::string &url,
                             const std::string &encodedUrl,
                             const std::filesystem::path &destination) const;

    /**
     * Copy the remote Last-Modified onto the file and check it stuck.
     * Problems are logged as warnings only.
     */
    void reconcileTimestamp(const std::string &url,
                            const std::filesystem::path &destination,
                            std::time_t remoteTime) const;

    std::shared_ptr<std::mutex> lockFor(const std::filesystem::path &destination) const;

    HttpClient &http_;
    NamingPolicy &naming_;
    Logger &logger_;

    mutable std::mutex locksMutex_;
    mutable std::map<std::filesystem::path, std::shared_ptr<std::mutex>> destinationLocks_;
};
