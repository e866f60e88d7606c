#include <cstdio>
#include <string>
#include <fmt/core.h>
#include <CLI/CLI.hpp> // CLI11 main header
#include "batch_controller.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "naming_policy.hpp"
#include "progress.hpp"
#include "transfer_unit.hpp"
#include "url_list.hpp"
#include "worker_pool.hpp"

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v") {
            fmt::print("batchfetch v1.0\n");
            fmt::print("Built with:\n");
            fmt::print("  - libcurl: HTTP/HTTPS support\n");
            fmt::print("  - CLI11: Command-line and INI parsing\n");
            fmt::print("  - fmt: Modern string formatting\n");
            return 0;
        }
    }

    // Create CLI11 app
    CLI::App app{"batchfetch v1.0 - Download files from a list of URLs in parallel"};

    // Options struct to be populated
    CliOptions options;

    // ====================================================================
    // DEFINE ARGUMENTS
    // ====================================================================

    // Required positional argument: the INI configuration file
    app.add_option("config_file", options.configFile, "Path to the configuration file")
        ->required()
        ->check(CLI::ExistingFile);

    // Optional: where the log goes besides stdout
    app.add_option("-l,--log-file", options.logFile, "Path to the log file")
        ->default_val("download.log");

    // Optional flag: --version (for help display only, actual handling is done above)
    app.add_flag("-v,--version", options.showVersion, "Display version information");

    // ====================================================================
    // PARSE ARGUMENTS
    // ====================================================================

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    // ====================================================================
    // LOGGING
    // ====================================================================

    Logger logger(LogLevel::Info);
    logger.addStream(stdout);
    try
    {
        logger.addFile(options.logFile);
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }

    // ====================================================================
    // CONFIGURATION + DOWNLOAD
    // ====================================================================

    try
    {
        BatchConfig config = loadConfig(options.configFile);
        config.validate();

        std::vector<std::string> urls = readUrlList(config.inputFile);
        logger.info("Loaded {} URLs from {}", urls.size(), config.inputFile.string());

        HttpOptions httpOptions;
        httpOptions.connectTimeoutSeconds = config.connectTimeout;
        httpOptions.readTimeoutSeconds = config.readTimeout;
        CurlHttpClient http(httpOptions);

        PrefixFolderNamingPolicy naming(config.downloadsFolder, config.uniqueFilenames, logger);
        TransferUnit unit(http, naming, logger);

        WorkerPoolDispatcher dispatcher(
            [&unit](const std::string &url) { return unit.run(url); },
            logger);

        ConsoleProgress progress(stderr);
        dispatcher.setProgressCallback(
            [&progress](std::size_t completed, std::size_t total) { progress.update(completed, total); });

        BatchRetryController controller(dispatcher, logger);
        BatchResult result = controller.runBatch(urls, config.maxWorkers, config.retryCount, config.retryDelay);

        return result.exitCode();
    }
    catch (const ConfigError &e)
    {
        logger.error("Configuration error: {}", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        logger.error("Fatal error: {}", e.what());
        return 1;
    }
}
