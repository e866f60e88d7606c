#include "batch_controller.hpp"

#include <thread>
#include <utility>

#include <fmt/core.h>

#include "config.hpp"
#include "logger.hpp"
#include "worker_pool.hpp"

BatchRetryController::BatchRetryController(WorkerPoolDispatcher &dispatcher, Logger &logger, Sleeper sleeper)
    : dispatcher_(dispatcher), logger_(logger), sleeper_(std::move(sleeper))
{
    if (!sleeper_)
    {
        sleeper_ = [](std::chrono::seconds delay) { std::this_thread::sleep_for(delay); };
    }
}

BatchResult BatchRetryController::runBatch(const std::vector<std::string> &urls,
                                           int concurrencyLimit,
                                           int retryCount,
                                           int retryDelaySeconds)
{
    // All parameter checks happen before the first request goes out
    if (retryCount < 0)
    {
        throw ConfigError(fmt::format("Invalid retry count: {}. Must be a non-negative integer.", retryCount));
    }
    if (retryDelaySeconds < 0)
    {
        throw ConfigError(fmt::format("Invalid retry delay: {}. Must be a non-negative integer.", retryDelaySeconds));
    }
    WorkerPoolDispatcher::effectiveWorkers(concurrencyLimit, urls.size());

    BatchResult result;
    result.totalUrls = urls.size();

    std::vector<std::string> current = urls;
    while (result.state == BatchState::Attempting)
    {
        if (current.empty())
        {
            result.state = BatchState::AllSucceeded;
            break;
        }

        const std::vector<TransferOutcome> outcomes = dispatcher_.dispatch(current, concurrencyLimit);
        ++result.attempts;

        // outcomes[i] belongs to current[i]
        std::vector<std::string> failed;
        for (std::size_t i = 0; i < outcomes.size(); ++i)
        {
            if (!outcomes[i].success)
            {
                failed.push_back(current[i]);
            }
        }

        if (failed.empty())
        {
            result.state = BatchState::AllSucceeded;
            break;
        }

        current = std::move(failed);
        if (result.attempts > retryCount)
        {
            result.state = BatchState::BudgetExhausted;
            break;
        }

        logger_.warning("Retry attempt {} for {} failed URLs.", result.attempts, current.size());
        logger_.info("Waiting for {} seconds before retrying...", retryDelaySeconds);
        sleeper_(std::chrono::seconds(retryDelaySeconds));
    }

    if (result.state == BatchState::AllSucceeded)
    {
        result.overallSuccess = true;
        logger_.info("All downloads completed successfully.");
    }
    else
    {
        result.failedUrls = current;
        logger_.error("Failed to download {} files after {} attempts.", current.size(), result.attempts);
        for (const auto &url : current)
        {
            logger_.error("Failed: {}", url);
        }
    }

    return result;
}
