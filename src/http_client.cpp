#include "http_client.hpp"

#include <cstdlib>
#include <mutex>
#include <utility>

#include <fmt/core.h>

namespace
{

// curl_global_init is not thread-safe; run it once before the first handle
void ensureCurlInitialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

size_t discardCallback(char *, size_t size, size_t nmemb, void *)
{
    return size * nmemb;
}

} // namespace

CurlHttpClient::CurlHttpClient(HttpOptions options) : options_(std::move(options))
{
    ensureCurlInitialized();
}

// Destructor: every handle is owned by the request that created it
CurlHttpClient::~CurlHttpClient() = default;

CurlHttpClient::CurlHandle CurlHttpClient::createHandle(const std::string &url, char *errorBuffer) const
{
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
    {
        throw HttpError("Failed to initialize CURL (out of memory or library error)");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    // Worker threads must not receive SIGALRM from DNS timeouts
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    // HTTPS settings
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);

    // Follow HTTP redirects, with a limit on the chain
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, options_.maxRedirects);

    // Connect timeout, plus a stall detector standing in for a read timeout:
    // abort when less than 1 byte/s arrives for readTimeoutSeconds
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, options_.readTimeoutSeconds);

    // Ask for Last-Modified so CURLINFO_FILETIME_T is filled in
    curl_easy_setopt(curl.get(), CURLOPT_FILETIME, 1L);

    return curl;
}

RemoteMetadata CurlHttpClient::head(const std::string &url)
{
    char errorBuffer[CURL_ERROR_SIZE] = {0};
    CurlHandle curl = createHandle(url, errorBuffer);

    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, discardCallback);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
    {
        throw HttpError(describeError(res, errorBuffer));
    }

    RemoteMetadata meta;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &meta.statusCode);

    // -1 when the server did not send Content-Length
    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0)
    {
        meta.contentLength = static_cast<std::uint64_t>(length);
    }

    meta.lastModified = fileTime(curl.get());
    return meta;
}

GetResult CurlHttpClient::get(const std::string &url, std::uint64_t offset, ResponseSink &sink)
{
    char errorBuffer[CURL_ERROR_SIZE] = {0};
    CurlHandle curl = createHandle(url, errorBuffer);

    // "N-" makes libcurl send "Range: bytes=N-"
    const std::string range = fmt::format("{}-", offset);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());

    WriteContext ctx;
    ctx.handle = curl.get();
    ctx.sink = &sink;
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, CHUNK_SIZE);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(curl.get());

    GetResult result;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.statusCode);
    result.lastModified = fileTime(curl.get());

    if (ctx.aborted)
    {
        // libcurl reports CURLE_WRITE_ERROR; the sink knows the real reason
        result.abortedBySink = true;
        return result;
    }

    if (res != CURLE_OK)
    {
        throw HttpError(describeError(res, errorBuffer));
    }

    // Empty body: writeCallback never ran, deliver the status now
    if (!ctx.statusDelivered)
    {
        ctx.statusDelivered = true;
        result.abortedBySink = !sink.onStatus(result.statusCode);
    }

    return result;
}

size_t CurlHttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *ctx = static_cast<WriteContext *>(userdata);
    const size_t total = size * nmemb;

    if (!ctx->statusDelivered)
    {
        long code = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &code);
        ctx->statusDelivered = true;
        if (!ctx->sink->onStatus(code))
        {
            ctx->aborted = true;
            return 0;
        }
    }

    if (total == 0)
    {
        return 0;
    }

    if (!ctx->sink->onData(ptr, total))
    {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

std::optional<std::time_t> CurlHttpClient::fileTime(CURL *handle)
{
    // -1 when the server did not send Last-Modified
    curl_off_t filetime = -1;
    if (curl_easy_getinfo(handle, CURLINFO_FILETIME_T, &filetime) != CURLE_OK || filetime < 0)
    {
        return std::nullopt;
    }
    return static_cast<std::time_t>(filetime);
}

std::string CurlHttpClient::describeError(CURLcode code, const char *errorBuffer)
{
    if (errorBuffer && errorBuffer[0] != '\0')
    {
        return fmt::format("{} ({})", curl_easy_strerror(code), errorBuffer);
    }
    return curl_easy_strerror(code);
}

// Helper: Get human-readable HTTP status text
std::string httpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 416:
        return "Range Not Satisfiable";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}
