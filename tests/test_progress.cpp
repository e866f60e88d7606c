#include "progress.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <sstream>
#include <vector>

#include <fmt/core.h>

namespace
{

/**
 * Temporary stream standing in for piped stderr.
 */
class CapturedStream
{
public:
    CapturedStream() : file_(std::tmpfile())
    {
        if (!file_)
        {
            throw std::runtime_error("Could not create temporary stream");
        }
    }

    ~CapturedStream() { std::fclose(file_); }

    CapturedStream(const CapturedStream &) = delete;
    CapturedStream &operator=(const CapturedStream &) = delete;

    std::FILE *get() const { return file_; }

    std::vector<std::string> lines() const
    {
        std::fflush(file_);
        std::rewind(file_);
        std::string content;
        char buffer[4096];
        size_t count = 0;
        while ((count = std::fread(buffer, 1, sizeof(buffer), file_)) > 0)
        {
            content.append(buffer, count);
        }
        std::fseek(file_, 0, SEEK_END);

        std::vector<std::string> result;
        std::istringstream input(content);
        std::string line;
        while (std::getline(input, line))
        {
            result.push_back(line);
        }
        return result;
    }

private:
    std::FILE *file_;
};

bool endsWith(const std::string &text, const std::string &suffix)
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void testOneLinePerPercent(TestReport &report)
{
    CapturedStream stream;
    ConsoleProgress progress(stream.get());

    // 200 files: every other file moves the whole percent
    for (std::size_t completed = 1; completed <= 200; ++completed)
    {
        progress.update(completed, 200);
    }

    const auto lines = stream.lines();
    report.check(lines.size() == 101, "piped output prints one line per whole-percent change");
    report.check(!lines.empty() && endsWith(lines.back(), "200/200 files (100.0%)"), "final update is drawn");
    report.check(!lines.empty() && lines.back().find("[==============================]") != std::string::npos,
                 "full bar at 100%");
    report.check(!lines.empty() && endsWith(lines.front(), "1/200 files (0.5%)"), "first update is drawn");
}

void testSmallBatch(TestReport &report)
{
    CapturedStream stream;
    ConsoleProgress progress(stream.get());
    for (std::size_t completed = 1; completed <= 4; ++completed)
    {
        progress.update(completed, 4);
    }

    const auto lines = stream.lines();
    report.check(lines.size() == 4, "every file of a small batch gets a line");
    report.check(lines.size() == 4 && lines[1] == "Downloading: [===============>              ] 2/4 files (50.0%)",
                 "bar layout");
}

void testNewRoundRestarts(TestReport &report)
{
    CapturedStream stream;
    ConsoleProgress progress(stream.get());

    // Round 1 stops at 0% of 300 files
    progress.update(1, 300);
    progress.update(2, 300);
    report.check(stream.lines().size() == 1, "updates within the same percent are skipped");

    // Round 2 starts at 0% again and still gets its own line
    progress.update(1, 500);
    const auto lines = stream.lines();
    report.check(lines.size() == 2 && endsWith(lines.back(), "1/500 files (0.2%)"), "new round draws its first update");
}

void testEmptyTotal(TestReport &report)
{
    CapturedStream stream;
    ConsoleProgress progress(stream.get());
    progress.update(0, 0);
    report.check(stream.lines().empty(), "empty batch draws nothing");
}

} // namespace

int main()
{
    try
    {
        TestReport report;
        testOneLinePerPercent(report);
        testSmallBatch(report);
        testNewRoundRestarts(report);
        testEmptyTotal(report);
        return report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
