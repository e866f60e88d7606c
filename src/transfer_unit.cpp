#include "transfer_unit.hpp"

#include <cstdint>
#include <fstream>
#include <optional>
#include <utility>

#include <fmt/core.h>

#include "file_utils.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "naming_policy.hpp"
#include "url.hpp"

namespace
{

constexpr long HTTP_OK = 200;
constexpr long HTTP_PARTIAL_CONTENT = 206;
constexpr long HTTP_RANGE_NOT_SATISFIABLE = 416;
constexpr long HTTP_FIRST_ERROR = 400;

/**
 * Writes a GET body to the destination file.
 * The open mode is picked once the status is known: 206 appends to the
 * partial file, 200 replaces it, anything else is refused.
 */
class DestinationWriter : public ResponseSink
{
public:
    explicit DestinationWriter(std::filesystem::path path) : path_(std::move(path)) {}

    bool onStatus(long statusCode) override
    {
        statusCode_ = statusCode;

        std::ios::openmode mode = std::ios::binary;
        if (statusCode == HTTP_PARTIAL_CONTENT)
        {
            mode |= std::ios::app;
        }
        else if (statusCode == HTTP_OK)
        {
            mode |= std::ios::trunc;
        }
        else
        {
            statusRejected_ = true;
            return false;
        }

        file_.open(path_, mode);
        if (!file_)
        {
            error_ = fmt::format("Cannot open file for writing: {}", path_.string());
            return false;
        }
        return true;
    }

    bool onData(const char *data, size_t size) override
    {
        file_.write(data, static_cast<std::streamsize>(size));
        if (!file_.good())
        {
            error_ = fmt::format("Failed to write to {}", path_.string());
            return false;
        }
        return true;
    }

    /**
     * Flush and close; records an error if buffered data could not be written.
     */
    void close()
    {
        if (!file_.is_open())
        {
            return;
        }
        file_.close();
        if (file_.fail() && error_.empty())
        {
            error_ = fmt::format("Failed to write to {}", path_.string());
        }
    }

    long statusCode() const { return statusCode_; }
    bool statusRejected() const { return statusRejected_; }
    const std::string &error() const { return error_; }

private:
    std::filesystem::path path_;
    std::ofstream file_;
    long statusCode_ = 0;
    bool statusRejected_ = false;
    std::string error_;
};

std::string statusFailureMessage(long statusCode)
{
    return fmt::format("Download failed with status code {}", statusCode);
}

} // namespace

TransferOutcome TransferOutcome::succeeded(std::string url, std::filesystem::path path)
{
    TransferOutcome outcome;
    outcome.url = std::move(url);
    outcome.success = true;
    outcome.path = std::move(path);
    return outcome;
}

TransferOutcome TransferOutcome::failed(std::string url, std::filesystem::path path, std::string message)
{
    TransferOutcome outcome;
    outcome.url = std::move(url);
    outcome.success = false;
    outcome.path = std::move(path);
    outcome.errorMessage = std::move(message);
    return outcome;
}

TransferUnit::TransferUnit(HttpClient &http, NamingPolicy &naming, Logger &logger)
    : http_(http), naming_(naming), logger_(logger)
{
}

TransferOutcome TransferUnit::run(const std::string &url) const
{
    // 1. Reject anything without scheme and host before touching the network
    if (!parseUrl(url).isAbsolute())
    {
        std::string message = fmt::format("Invalid URL: {}", url);
        logger_.error("Error: {}", message);
        return TransferOutcome::failed(url, {}, message);
    }

    // 2. Encode for transport, keeping ':' and '/'
    const std::string encodedUrl = encodeUrl(url);

    std::filesystem::path destination;
    try
    {
        // 3. Destination comes from the naming policy
        destination = naming_.destinationFor(encodedUrl);

        // Duplicate URLs share a destination; only one may write it at a time
        std::shared_ptr<std::mutex> destinationLock = lockFor(destination);
        std::lock_guard<std::mutex> guard(*destinationLock);
        return transfer(url, encodedUrl, destination);
    }
    catch (const std::exception &e)
    {
        logger_.error("Error: Download failed for '{}': {}", url, e.what());
        return TransferOutcome::failed(url, destination, e.what());
    }
}

TransferOutcome TransferUnit::transfer(const std::string &url,
                                       const std::string &encodedUrl,
                                       const std::filesystem::path &destination) const
{
    const bool exists = std::filesystem::exists(destination);

    // One probe serves both the timestamp and the size check
    const RemoteMetadata meta = http_.head(encodedUrl);
    if (meta.statusCode >= HTTP_FIRST_ERROR)
    {
        logger_.error("Error: Download failed for '{}' with status code {} ({})",
                      url, meta.statusCode, httpStatusText(meta.statusCode));
        return TransferOutcome::failed(url, destination, statusFailureMessage(meta.statusCode));
    }

    // 4. Same Last-Modified as the local copy: nothing changed
    if (exists && meta.lastModified && *meta.lastModified == getFileModifiedTime(destination))
    {
        logger_.info("Skipping download: {} (File already exists with the same timestamp)", url);
        return TransferOutcome::succeeded(url, destination);
    }

    // 5. Local copy already as large as the remote one
    const std::uint64_t localSize = localFileSize(destination);
    if (meta.contentLength && localSize >= *meta.contentLength)
    {
        if (!exists)
        {
            // Zero-length remote file: still leave a file behind
            std::ofstream touch(destination, std::ios::binary | std::ios::app);
            if (!touch)
            {
                return TransferOutcome::failed(url, destination,
                                               fmt::format("Cannot create file: {}", destination.string()));
            }
            touch.close();
            if (meta.lastModified)
            {
                reconcileTimestamp(url, destination, *meta.lastModified);
            }
        }
        logger_.info("Skipping download: {} (File already exists and is up to date)", url);
        return TransferOutcome::succeeded(url, destination);
    }

    // 6. Fetch the rest, starting at the local size
    if (localSize > 0)
    {
        logger_.debug("Resuming {} from byte {}", url, localSize);
    }

    DestinationWriter writer(destination);
    const GetResult result = http_.get(encodedUrl, localSize, writer);
    writer.close();

    // Without a Content-Length the size short-circuit cannot run; a server
    // refusing the range past our local size means the file is already whole
    if (writer.statusRejected() && writer.statusCode() == HTTP_RANGE_NOT_SATISFIABLE &&
        !meta.contentLength && localSize > 0)
    {
        logger_.info("Skipping download: {} (File already exists and is up to date)", url);
        std::optional<std::time_t> remoteTime = result.lastModified ? result.lastModified : meta.lastModified;
        if (remoteTime)
        {
            reconcileTimestamp(url, destination, *remoteTime);
        }
        return TransferOutcome::succeeded(url, destination);
    }

    if (writer.statusRejected())
    {
        logger_.error("Error: Download failed for '{}' with status code {} ({})",
                      url, writer.statusCode(), httpStatusText(writer.statusCode()));
        return TransferOutcome::failed(url, destination, statusFailureMessage(writer.statusCode()));
    }
    if (!writer.error().empty())
    {
        logger_.error("Error: Download failed for '{}': {}", url, writer.error());
        return TransferOutcome::failed(url, destination, writer.error());
    }

    // 7. Size must match what the server announced
    if (meta.contentLength)
    {
        if (localFileSize(destination) != *meta.contentLength)
        {
            std::string message = fmt::format("Downloaded file size does not match expected size for '{}'", url);
            logger_.error("Error: {}", message);
            return TransferOutcome::failed(url, destination, message);
        }
    }
    else
    {
        logger_.warning("Warning: Server sent no Content-Length for '{}'; size not verified", url);
    }

    logger_.info("Downloaded: {}", url);

    // 8. Carry over the remote modification time
    std::optional<std::time_t> remoteTime = result.lastModified ? result.lastModified : meta.lastModified;
    if (remoteTime)
    {
        reconcileTimestamp(url, destination, *remoteTime);
    }

    return TransferOutcome::succeeded(url, destination);
}

std::shared_ptr<std::mutex> TransferUnit::lockFor(const std::filesystem::path &destination) const
{
    std::lock_guard<std::mutex> lock(locksMutex_);
    std::shared_ptr<std::mutex> &slot = destinationLocks_[destination];
    if (!slot)
    {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

void TransferUnit::reconcileTimestamp(const std::string &url,
                                      const std::filesystem::path &destination,
                                      std::time_t remoteTime) const
{
    try
    {
        setFileModifiedTime(destination, remoteTime);
        if (getFileModifiedTime(destination) != remoteTime)
        {
            logger_.warning("Warning: Modified time of downloaded file does not match remote file for '{}'", url);
        }
    }
    catch (const std::runtime_error &e)
    {
        logger_.warning("Warning: Could not set modified time for '{}': {}", url, e.what());
    }
}
