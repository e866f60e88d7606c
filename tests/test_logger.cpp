#include "logger.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cstdio>
#include <regex>
#include <stdexcept>

#include <fmt/core.h>

int main()
{
    try
    {
        TestReport report;
        TempDir dir;
        const auto logPath = dir.path() / "download.log";

        {
            Logger logger(LogLevel::Info);
            logger.addFile(logPath);
            logger.debug("hidden {}", 1);
            logger.info("Downloaded: {}", "https://host/a.bin");
            logger.warning("Reduced max_workers to {} to match the number of URLs.", 3);
            logger.error("Error: {}", "Invalid URL: x");
        }

        const std::string content = readFile(logPath);
        report.check(content.find("hidden") == std::string::npos, "records below the minimum level are dropped");
        report.check(content.find(" - INFO - Downloaded: https://host/a.bin\n") != std::string::npos, "info line");
        report.check(content.find(" - WARNING - Reduced max_workers to 3") != std::string::npos, "warning line");
        report.check(content.find(" - ERROR - Error: Invalid URL: x\n") != std::string::npos, "error line");

        const std::regex linePattern("\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2},\\d{3} - INFO - .*");
        const std::string firstLine = content.substr(0, content.find('\n'));
        report.check(std::regex_match(firstLine, linePattern), "timestamp format");

        // Append mode: a second logger adds to the same file
        {
            Logger logger;
            logger.addFile(logPath);
            logger.info("second run");
        }
        const std::string appended = readFile(logPath);
        report.check(appended.find("Downloaded:") != std::string::npos &&
                         appended.find("second run") != std::string::npos,
                     "log file is appended to");

        // Stream sinks get the same lines; the level can be raised later
        std::FILE *stream = std::tmpfile();
        if (!stream)
        {
            throw std::runtime_error("Could not create temporary stream");
        }
        {
            Logger logger;
            logger.addStream(stream);
            logger.info("first");
            logger.setMinLevel(LogLevel::Error);
            logger.warning("dropped");
            logger.error("second");
        }
        std::fflush(stream);
        const long streamSize = std::ftell(stream);
        std::rewind(stream);
        std::string streamed(static_cast<size_t>(streamSize), '\0');
        const size_t readBytes = std::fread(streamed.data(), 1, streamed.size(), stream);
        std::fclose(stream);
        streamed.resize(readBytes);
        report.check(std::count(streamed.begin(), streamed.end(), '\n') == 2, "stream sink receives one line per record");
        report.check(streamed.find(" - INFO - first\n") != std::string::npos &&
                         streamed.find(" - ERROR - second\n") != std::string::npos,
                     "stream sink lines are formatted");
        report.check(streamed.find("dropped") == std::string::npos, "raised minimum level drops warnings");

        bool threw = false;
        try
        {
            Logger logger;
            logger.addFile(dir.path() / "no" / "such" / "dir" / "x.log");
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        report.check(threw, "unopenable log file is reported");

        return report.finish();
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }
}
