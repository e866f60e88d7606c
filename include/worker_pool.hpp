#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "transfer_unit.hpp"

class Logger;

/**
 * Runs a batch of URLs through a fixed number of worker threads.
 *
 * Results are index-aligned with the input: results[i] belongs to urls[i],
 * whatever order the units actually finished in.
 */
class WorkerPoolDispatcher
{
public:
    using TransferTask = std::function<TransferOutcome(const std::string &url)>;

    /**
     * Advisory progress: completed count (monotonic) against the batch size.
     * Called from worker threads, one call at a time.
     */
    using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

    WorkerPoolDispatcher(TransferTask task, Logger &logger);

    void setProgressCallback(ProgressCallback callback);

    /**
     * Run every URL and wait for all of them.
     * A failing (or throwing) task never affects its siblings.
     *
     * @param urls URLs in input order (duplicates allowed)
     * @param maxWorkers Concurrency limit, clamped to urls.size()
     * @return One outcome per URL, same order as urls
     * @throws ConfigError if maxWorkers is not positive
     */
    std::vector<TransferOutcome> dispatch(const std::vector<std::string> &urls, int maxWorkers);

    /**
     * Number of worker threads used by the last dispatch().
     */
    std::size_t lastWorkerCount() const { return lastWorkerCount_; }

    /**
     * Worker count for a batch: maxWorkers, clamped to the number of URLs.
     *
     * @throws ConfigError if maxWorkers is not positive
     */
    static std::size_t effectiveWorkers(int maxWorkers, std::size_t urlCount);

private:
    TransferOutcome runTask(const std::string &url) const;

    TransferTask task_;
    Logger &logger_;
    ProgressCallback progress_;
    std::mutex progressMutex_;
    std::size_t lastWorkerCount_ = 0;
};
