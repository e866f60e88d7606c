#pragma once

#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

/**
 * Browser-like User-Agent sent on every request.
 * Some servers reject requests from agents they don't recognise.
 */
inline constexpr const char *DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/125.0.0.0 Safari/537.36";

/**
 * Network-level failure: DNS, connect, TLS, timeout, interrupted transfer.
 * HTTP error statuses are NOT reported this way; they come back as status codes.
 */
class HttpError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Result of a HEAD request.
 */
struct RemoteMetadata
{
    long statusCode = 0;
    std::optional<std::uint64_t> contentLength; // Content-Length, if sent
    std::optional<std::time_t> lastModified;    // Last-Modified as UTC epoch seconds, if sent
};

/**
 * Result of a streamed GET request.
 */
struct GetResult
{
    long statusCode = 0;
    std::optional<std::time_t> lastModified;
    bool abortedBySink = false; // ResponseSink refused the status or a chunk
};

/**
 * Receives the body of a GET response as it arrives.
 */
class ResponseSink
{
public:
    virtual ~ResponseSink() = default;

    /**
     * Called exactly once with the final status code, before any body data
     * (also for empty bodies).
     * @return false to abort the transfer
     */
    virtual bool onStatus(long statusCode) = 0;

    /**
     * Called for each chunk of body data (at most 8 KiB).
     * @return false to abort the transfer
     */
    virtual bool onData(const char *data, size_t size) = 0;
};

/**
 * HTTP transport used by the transfer logic.
 * Implementations must be safe to call from several worker threads at once.
 */
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    /**
     * Metadata-only probe (HEAD).
     *
     * @throws HttpError on network failure
     */
    virtual RemoteMetadata head(const std::string &url) = 0;

    /**
     * GET with "Range: bytes=<offset>-", streaming the body into sink.
     *
     * @throws HttpError on network failure
     */
    virtual GetResult get(const std::string &url, std::uint64_t offset, ResponseSink &sink) = 0;
};

/**
 * Timeouts and headers for CurlHttpClient.
 */
struct HttpOptions
{
    long connectTimeoutSeconds = 10;
    long readTimeoutSeconds = 30; // abort if no byte arrives for this long
    std::string userAgent = DEFAULT_USER_AGENT;
    long maxRedirects = 5;
};

/**
 * HttpClient backed by libcurl.
 * Every request uses its own CURL easy handle (RAII), so one instance can be
 * shared by all workers.
 */
class CurlHttpClient : public HttpClient
{
public:
    explicit CurlHttpClient(HttpOptions options = {});
    ~CurlHttpClient() override;

    // Delete copy operations
    CurlHttpClient(const CurlHttpClient &) = delete;
    CurlHttpClient &operator=(const CurlHttpClient &) = delete;

    RemoteMetadata head(const std::string &url) override;
    GetResult get(const std::string &url, std::uint64_t offset, ResponseSink &sink) override;

private:
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    /**
     * Per-transfer state handed to writeCallback.
     */
    struct WriteContext
    {
        CURL *handle = nullptr;
        ResponseSink *sink = nullptr;
        bool statusDelivered = false;
        bool aborted = false;
    };

    /**
     * Create an easy handle with the options shared by HEAD and GET:
     * URL, User-Agent, redirects, TLS verification, timeouts, error buffer.
     */
    CurlHandle createHandle(const std::string &url, char *errorBuffer) const;

    /**
     * Static callback for libcurl to hand over downloaded data.
     * userdata is a WriteContext*.
     * Returning anything other than size * nmemb aborts the transfer.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    static std::optional<std::time_t> fileTime(CURL *handle);

    /**
     * Build the HttpError message from a CURL code and the error buffer.
     */
    static std::string describeError(CURLcode code, const char *errorBuffer);

    HttpOptions options_;

    // Chunk size handed to writeCallback
    static constexpr long CHUNK_SIZE = 8 * 1024;
};

/**
 * Human-readable text for an HTTP status code (e.g. 404 -> "Not Found").
 */
std::string httpStatusText(long code);
