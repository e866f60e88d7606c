#include "progress.hpp"

#include <string>

#include <unistd.h>

#include <fmt/core.h>

ConsoleProgress::ConsoleProgress(std::FILE *stream) : stream_(stream)
{
    // Detect if the stream is a terminal to decide how we render the bar
    isTerminalOutput_ = ::isatty(fileno(stream_));
}

void ConsoleProgress::update(std::size_t completed, std::size_t total)
{
    if (total == 0)
    {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    const bool isComplete = completed >= total;
    const double percentage = (static_cast<double>(completed) / total) * 100.0;
    const int wholePercent = static_cast<int>(completed * 100 / total);

    // A new round restarts the counter
    if (completed == 1)
    {
        lastPrintedPercent_ = -1;
    }

    if (!isComplete)
    {
        if (isTerminalOutput_)
        {
            // Update at most 5 times per second (200ms interval)
            auto sinceLastUpdate = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastProgressTime_).count();
            if (lastPrintedPercent_ >= 0 && sinceLastUpdate < 200)
            {
                return;
            }
        }
        else if (wholePercent == lastPrintedPercent_)
        {
            return;
        }
    }

    lastProgressTime_ = now;
    lastPrintedPercent_ = wholePercent;
    draw(completed, total, percentage);
}

void ConsoleProgress::draw(std::size_t completed, std::size_t total, double percentage)
{
    int filled = static_cast<int>((percentage / 100.0) * BAR_WIDTH);
    std::string bar = "[";
    for (int i = 0; i < BAR_WIDTH; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";

    const bool isComplete = completed >= total;
    if (isTerminalOutput_)
    {
        fmt::print(stream_, "\rDownloading: {} {}/{} files ({:.1f}%)\033[K", bar, completed, total, percentage);
        if (isComplete)
        {
            fmt::print(stream_, "\n");
        }
    }
    else
    {
        fmt::print(stream_, "Downloading: {} {}/{} files ({:.1f}%)\n", bar, completed, total, percentage);
    }
    std::fflush(stream_);
}
