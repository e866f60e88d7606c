#include "worker_pool.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fmt/core.h>

namespace
{

std::vector<std::string> makeUrls(size_t count)
{
    std::vector<std::string> urls;
    for (size_t i = 0; i < count; ++i)
    {
        urls.push_back(fmt::format("https://files.example.com/file{}.bin", i));
    }
    return urls;
}

void testOutcomePairing(TestReport &report)
{
    Logger logger;
    // Every third URL fails; finishing order is scrambled by varying sleeps
    WorkerPoolDispatcher dispatcher(
        [](const std::string &url) {
            const size_t index = std::stoul(url.substr(url.find("file") + 4));
            std::this_thread::sleep_for(std::chrono::milliseconds((17 - index % 17) % 5));
            if (index % 3 == 0)
            {
                return TransferOutcome::failed(url, {}, "boom");
            }
            return TransferOutcome::succeeded(url, "/tmp/" + std::to_string(index));
        },
        logger);

    const auto urls = makeUrls(25);
    const auto results = dispatcher.dispatch(urls, 4);

    report.check(results.size() == urls.size(), "one outcome per URL");

    bool aligned = true;
    std::vector<std::string> failed;
    for (size_t i = 0; i < results.size(); ++i)
    {
        aligned = aligned && results[i].url == urls[i];
        if (!results[i].success)
        {
            failed.push_back(urls[i]);
        }
    }
    report.check(aligned, "outcomes are index-aligned with input");

    std::vector<std::string> expected;
    for (size_t i = 0; i < urls.size(); i += 3)
    {
        expected.push_back(urls[i]);
    }
    report.check(failed == expected, "filtering by failure yields exactly the failing URLs");
}

void testConcurrencyClamp(TestReport &report)
{
    Logger logger;
    std::mutex mutex;
    std::condition_variable cv;
    int active = 0;
    int peak = 0;

    // Each unit waits (bounded) until three are running at once
    WorkerPoolDispatcher dispatcher(
        [&](const std::string &url) {
            std::unique_lock<std::mutex> lock(mutex);
            ++active;
            peak = std::max(peak, active);
            cv.notify_all();
            cv.wait_for(lock, std::chrono::seconds(2), [&] { return peak >= 3; });
            --active;
            return TransferOutcome::succeeded(url, "/tmp/x");
        },
        logger);

    const auto results = dispatcher.dispatch(makeUrls(3), 100);

    report.check(dispatcher.lastWorkerCount() == 3, "100 workers clamp to 3 for 3 URLs");
    report.check(peak == 3, "exactly 3 units ran concurrently");
    report.check(results.size() == 3, "clamped batch still returns 3 outcomes");
}

void testConcurrencyLimitRespected(TestReport &report)
{
    Logger logger;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    WorkerPoolDispatcher dispatcher(
        [&](const std::string &url) {
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now))
            {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --active;
            return TransferOutcome::succeeded(url, "/tmp/x");
        },
        logger);

    dispatcher.dispatch(makeUrls(20), 2);
    report.check(peak.load() <= 2, "never more than max_workers units at once");
    report.check(dispatcher.lastWorkerCount() == 2, "worker count equals limit when URLs outnumber it");
}

void testInvalidLimit(TestReport &report)
{
    Logger logger;
    int calls = 0;
    WorkerPoolDispatcher dispatcher(
        [&](const std::string &url) {
            ++calls;
            return TransferOutcome::succeeded(url, "/tmp/x");
        },
        logger);

    bool threw = false;
    try
    {
        dispatcher.dispatch(makeUrls(2), 0);
    }
    catch (const ConfigError &)
    {
        threw = true;
    }
    report.check(threw, "max_workers = 0 is a configuration error");
    report.check(calls == 0, "no unit runs with an invalid limit");
}

void testThrowingTaskIsIsolated(TestReport &report)
{
    Logger logger;
    WorkerPoolDispatcher dispatcher(
        [](const std::string &url) -> TransferOutcome {
            if (url.find("file1.") != std::string::npos)
            {
                throw std::runtime_error("disk on fire");
            }
            return TransferOutcome::succeeded(url, "/tmp/x");
        },
        logger);

    const auto results = dispatcher.dispatch(makeUrls(3), 3);
    report.check(!results[1].success && results[1].errorMessage == "disk on fire", "exception becomes a failure outcome");
    report.check(results[0].success && results[2].success, "siblings of a throwing unit still succeed");
}

void testProgress(TestReport &report)
{
    Logger logger;
    WorkerPoolDispatcher dispatcher(
        [](const std::string &url) { return TransferOutcome::succeeded(url, "/tmp/x"); },
        logger);

    std::vector<size_t> seen;
    size_t seenTotal = 0;
    dispatcher.setProgressCallback([&](size_t completed, size_t total) {
        seen.push_back(completed);
        seenTotal = total;
    });

    dispatcher.dispatch(makeUrls(10), 4);

    bool monotonic = std::is_sorted(seen.begin(), seen.end()) &&
                     std::adjacent_find(seen.begin(), seen.end()) == seen.end();
    report.check(seen.size() == 10 && seen.back() == 10, "progress reaches the total");
    report.check(monotonic, "progress count increases monotonically");
    report.check(seenTotal == 10, "progress reports the batch size");
}

void testEmptyBatch(TestReport &report)
{
    Logger logger;
    WorkerPoolDispatcher dispatcher(
        [](const std::string &url) { return TransferOutcome::succeeded(url, "/tmp/x"); },
        logger);

    report.check(dispatcher.dispatch({}, 4).empty(), "empty batch returns no outcomes");
}

} // namespace

int main()
{
    try
    {
        TestReport report;
        testOutcomePairing(report);
        testConcurrencyClamp(report);
        testConcurrencyLimitRespected(report);
        testInvalidLimit(report);
        testThrowingTaskIsIsolated(report);
        testProgress(report);
        testEmptyBatch(report);
        return report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
