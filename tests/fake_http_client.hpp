#pragma once

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "http_client.hpp"

/**
 * One URL served by FakeHttpClient.
 */
struct FakeResource
{
    std::string body;
    std::optional<std::time_t> lastModified;
    long status = 200;                          // for both HEAD and GET
    bool supportsRanges = true;                 // false: always answer 200 with the full body
    bool sendContentLength = true;
    std::optional<std::uint64_t> announcedLength; // lie about Content-Length
    std::optional<size_t> dropAfter;            // throw HttpError after this many body bytes
};

/**
 * In-memory HttpClient. Unknown URLs answer 404.
 * Records how many requests were made and how many body bytes were sent so
 * tests can check that nothing was transferred twice.
 */
class FakeHttpClient : public HttpClient
{
public:
    void serve(const std::string &url, FakeResource resource)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    RemoteMetadata head(const std::string &url) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++headRequests_;

        RemoteMetadata meta;
        auto it = resources_.find(url);
        if (it == resources_.end())
        {
            meta.statusCode = 404;
            return meta;
        }

        const FakeResource &resource = it->second;
        meta.statusCode = resource.status;
        if (resource.sendContentLength)
        {
            meta.contentLength = resource.announcedLength ? *resource.announcedLength : resource.body.size();
        }
        meta.lastModified = resource.lastModified;
        return meta;
    }

    GetResult get(const std::string &url, std::uint64_t offset, ResponseSink &sink) override
    {
        FakeResource resource;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++getRequests_;
            rangeOffsets_[url].push_back(offset);
            auto it = resources_.find(url);
            if (it != resources_.end())
            {
                resource = it->second;
                found = true;
            }
        }

        GetResult result;
        result.lastModified = resource.lastModified;
        if (!found || resource.status != 200)
        {
            result.statusCode = found ? resource.status : 404;
            result.abortedBySink = !sink.onStatus(result.statusCode);
            return result;
        }

        std::string payload = resource.body;
        result.statusCode = 200;
        if (resource.supportsRanges)
        {
            // Nothing left past the end: real servers refuse the range
            if (offset > 0 && offset >= resource.body.size())
            {
                result.statusCode = 416;
                result.abortedBySink = !sink.onStatus(result.statusCode);
                return result;
            }
            payload = resource.body.substr(static_cast<size_t>(offset));
            result.statusCode = 206;
        }

        if (!sink.onStatus(result.statusCode))
        {
            result.abortedBySink = true;
            return result;
        }

        constexpr size_t CHUNK = 8 * 1024;
        size_t sent = 0;
        while (sent < payload.size())
        {
            if (resource.dropAfter && sent >= *resource.dropAfter)
            {
                throw HttpError("Failure when receiving data from the peer");
            }

            size_t chunk = std::min(CHUNK, payload.size() - sent);
            if (resource.dropAfter)
            {
                chunk = std::min(chunk, *resource.dropAfter - sent);
            }
            if (!sink.onData(payload.data() + sent, chunk))
            {
                result.abortedBySink = true;
                break;
            }
            sent += chunk;
            addBytes(chunk);
        }
        return result;
    }

    int headRequests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return headRequests_;
    }

    int getRequests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return getRequests_;
    }

    std::uint64_t bytesServed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytesServed_;
    }

    std::vector<std::uint64_t> rangeOffsets(const std::string &url) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rangeOffsets_.find(url);
        return it == rangeOffsets_.end() ? std::vector<std::uint64_t>() : it->second;
    }

private:
    void addBytes(size_t count)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bytesServed_ += count;
    }

    mutable std::mutex mutex_;
    std::map<std::string, FakeResource> resources_;
    std::map<std::string, std::vector<std::uint64_t>> rangeOffsets_;
    int headRequests_ = 0;
    int getRequests_ = 0;
    std::uint64_t bytesServed_ = 0;
};
