#include "worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <utility>

#include "config.hpp"
#include "logger.hpp"

WorkerPoolDispatcher::WorkerPoolDispatcher(TransferTask task, Logger &logger)
    : task_(std::move(task)), logger_(logger)
{
}

void WorkerPoolDispatcher::setProgressCallback(ProgressCallback callback)
{
    progress_ = std::move(callback);
}

std::size_t WorkerPoolDispatcher::effectiveWorkers(int maxWorkers, std::size_t urlCount)
{
    if (maxWorkers <= 0)
    {
        throw ConfigError("max_workers must be a positive integer.");
    }
    return std::min(static_cast<std::size_t>(maxWorkers), urlCount);
}

std::vector<TransferOutcome> WorkerPoolDispatcher::dispatch(const std::vector<std::string> &urls, int maxWorkers)
{
    const std::size_t total = urls.size();
    const std::size_t workerCount = effectiveWorkers(maxWorkers, total);
    if (total > 0 && workerCount < static_cast<std::size_t>(maxWorkers))
    {
        logger_.warning("Reduced max_workers to {} to match the number of URLs.", workerCount);
    }
    lastWorkerCount_ = workerCount;

    std::vector<TransferOutcome> results(total);
    if (total == 0)
    {
        return results;
    }

    // Each worker claims the next unclaimed index; every slot of results is
    // written by exactly one thread
    std::atomic<std::size_t> next{0};
    std::size_t completed = 0;

    auto worker = [&]() {
        for (;;)
        {
            const std::size_t index = next.fetch_add(1);
            if (index >= total)
            {
                return;
            }

            results[index] = runTask(urls[index]);

            std::lock_guard<std::mutex> lock(progressMutex_);
            ++completed;
            if (progress_)
            {
                progress_(completed, total);
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workerCount);
    try
    {
        for (std::size_t i = 0; i < workerCount; ++i)
        {
            threads.emplace_back(worker);
        }
    }
    catch (const std::system_error &)
    {
        // Could not start every thread: stop handing out work, then let the
        // running ones finish before reporting
        next.store(total);
        for (auto &thread : threads)
        {
            thread.join();
        }
        throw;
    }

    for (auto &thread : threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }

    return results;
}

TransferOutcome WorkerPoolDispatcher::runTask(const std::string &url) const
{
    try
    {
        return task_(url);
    }
    catch (const std::exception &e)
    {
        logger_.error("Error: Unexpected failure for '{}': {}", url, e.what());
        return TransferOutcome::failed(url, {}, e.what());
    }
}
