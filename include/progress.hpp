#pragma once

#include <chrono>
#include <cstddef>
#include <cstdio>

/**
 * Console progress bar for a batch:
 *   Downloading: [=========>          ] 5/10 files (50.0%)
 *
 * On a terminal the bar is redrawn in place, at most 5 times per second.
 * Otherwise (piped output) one line is printed per whole-percent change.
 * Pass update() as the dispatcher's progress callback.
 */
class ConsoleProgress
{
public:
    explicit ConsoleProgress(std::FILE *stream = stderr);

    void update(std::size_t completed, std::size_t total);

private:
    void draw(std::size_t completed, std::size_t total, double percentage);

    std::FILE *stream_;
    bool isTerminalOutput_ = true;
    int lastPrintedPercent_ = -1; // whole percent of the last drawn update, -1 before the first
    std::chrono::steady_clock::time_point lastProgressTime_;

    static constexpr int BAR_WIDTH = 30;
};
