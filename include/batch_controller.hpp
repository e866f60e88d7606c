#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

class Logger;
class WorkerPoolDispatcher;

/**
 * Where a batch run ended up.
 */
enum class BatchState
{
    Attempting,
    AllSucceeded,   // every URL succeeded
    BudgetExhausted // retries used up with URLs still failing
};

/**
 * Summary returned by BatchRetryController::runBatch.
 */
struct BatchResult
{
    BatchState state = BatchState::Attempting;
    bool overallSuccess = false;
    std::vector<std::string> failedUrls; // still failing after the last round
    int attempts = 0;                    // dispatcher rounds run
    std::size_t totalUrls = 0;

    /**
     * Process exit status: 0 on success, 1 when the budget ran out.
     */
    int exitCode() const { return overallSuccess ? 0 : 1; }
};

/**
 * Re-runs the dispatcher over the URLs that failed, with a fixed pause
 * between rounds, until nothing fails or retryCount extra rounds have run.
 * A URL that succeeded once is never fetched again.
 */
class BatchRetryController
{
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    /**
     * @param dispatcher Runs one round
     * @param logger Receives the per-round and final summary
     * @param sleeper Waits between rounds (defaults to std::this_thread::sleep_for)
     */
    BatchRetryController(WorkerPoolDispatcher &dispatcher, Logger &logger, Sleeper sleeper = {});

    /**
     * Download every URL, retrying failed ones.
     *
     * @param urls Full input list, in order
     * @param concurrencyLimit Worker threads per round (must be > 0)
     * @param retryCount Extra rounds after the first (must be >= 0)
     * @param retryDelaySeconds Pause between rounds (must be >= 0)
     * @throws ConfigError if a parameter is out of range (before any download)
     */
    BatchResult runBatch(const std::vector<std::string> &urls,
                         int concurrencyLimit,
                         int retryCount,
                         int retryDelaySeconds);

private:
    WorkerPoolDispatcher &dispatcher_;
    Logger &logger_;
    Sleeper sleeper_;
};
