/**
 * @file main.cpp
 * @brief Entry point: loads settings, collects tariff identifiers from the grid and exports each one.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "application/ExportFetcher.hpp"
#include "application/GridNavigator.hpp"
#include "application/IdCollector.hpp"
#include "application/PipelineDriver.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileArtifactStore.hpp"
#include "infrastructure/HttplibSession.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/WebDriverSession.hpp"

using namespace tariffharvest;

namespace {

constexpr const char* kComponent = "Main";

std::atomic<bool> g_stopRequested{false};

void HandleSignal(int) {
    g_stopRequested = true;
}

struct CommandLine {
    std::string configPath = "settings.json";
    std::string ids;
    bool showHelp = false;
};

void PrintUsage() {
    std::cout << "Usage: tariff_harvest [options]\n"
              << "  --config FILE      settings file (default: settings.json)\n"
              << "  --output DIR       output directory for Tariff_<id>.xml files\n"
              << "  --max-pages N      stop collecting after N grid pages (0 = no cap)\n"
              << "  --limit N          process at most N identifiers\n"
              << "  --workers N        parallel export workers\n"
              << "  --ids 1,2,3        skip collection and export only these identifiers\n"
              << "  --headless         run the browser without a window\n"
              << "  --help             show this help\n";
}

int ParseCount(const std::string& option, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size() && parsed >= 0) return parsed;
    } catch (const std::exception&) {
    }
    throw std::invalid_argument(option + " expects a non-negative number, got '" + value + "'");
}

// Two passes: --config must be known before the file is loaded, the rest overrides it.
CommandLine ParseArguments(int argc, char** argv, infrastructure::AppConfig* config) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " expects a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            cli.showHelp = true;
        } else if (arg == "--config") {
            cli.configPath = value();
        } else if (arg == "--headless") {
            if (config) config->headless = true;
        } else if (arg == "--output") {
            std::string v = value();
            if (config) config->outputDir = v;
        } else if (arg == "--max-pages") {
            int v = ParseCount(arg, value());
            if (config) config->maxPages = v;
        } else if (arg == "--limit") {
            int v = ParseCount(arg, value());
            if (config) config->maxItems = v;
        } else if (arg == "--workers") {
            int v = ParseCount(arg, value());
            if (config) config->workers = v;
        } else if (arg == "--ids") {
            cli.ids = value();
        } else {
            throw std::invalid_argument("unknown option: " + arg);
        }
    }
    return cli;
}

domain::IdentifierSet CollectIdentifiers(const infrastructure::AppConfig& config,
                                         const std::shared_ptr<infrastructure::Logger>& logger) {
    infrastructure::WebDriverSession::Options browserOptions;
    browserOptions.driverUrl = config.webdriverUrl;
    browserOptions.headless = config.headless;
    browserOptions.windowWidth = config.windowWidth;
    browserOptions.windowHeight = config.windowHeight;

    std::shared_ptr<domain::BrowserSession> browser;
    try {
        browser = std::make_shared<infrastructure::WebDriverSession>(browserOptions, logger);
    } catch (const std::exception& e) {
        throw domain::FatalError(std::string("could not start browser session: ") + e.what());
    }

    application::GridNavigator::Timing timing;
    timing.gridReady = std::chrono::milliseconds(config.gridReadyTimeoutMs);
    timing.pagerAdvance = std::chrono::milliseconds(config.pagerAdvanceTimeoutMs);
    timing.linkWait = std::chrono::milliseconds(config.linkWaitTimeoutMs);
    timing.stalePause = std::chrono::milliseconds(config.stalePauseMs);

    auto navigator = std::make_shared<application::GridNavigator>(browser, config.grid, timing, logger);

    application::IdCollector::Options collectorOptions;
    collectorOptions.baseUrl = config.baseUrl;
    collectorOptions.maxPages = config.maxPages;
    collectorOptions.navigationRetries = config.navigationRetries;

    application::IdCollector collector(navigator, collectorOptions, logger);
    return collector.collect().ids;
}

void PrintSummary(const application::RunSummary& summary, const std::string& outputDir) {
    std::cout << "\n=== Tariff export summary ===\n"
              << "Total identifiers: " << summary.total << "\n"
              << "Skipped (already on disk): " << summary.skipped << "\n"
              << "Downloaded: " << summary.downloaded << "\n"
              << "Failed: " << summary.failed << "\n";
    if (summary.cancelled > 0) {
        std::cout << "Not started (stopped): " << summary.cancelled << "\n";
    }
    if (!summary.failedIds.empty()) {
        std::cout << "Failed identifiers:";
        for (size_t i = 0; i < summary.failedIds.size(); ++i) {
            std::cout << (i == 0 ? " " : ",") << summary.failedIds[i];
        }
        std::cout << "\n";
    }
    std::cout << "Files saved to: " << outputDir << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    infrastructure::AppConfig config;
    CommandLine cli;
    try {
        cli = ParseArguments(argc, argv, nullptr);
        if (cli.showHelp) {
            PrintUsage();
            return 0;
        }
        config = infrastructure::ConfigLoader::Load(cli.configPath);
        ParseArguments(argc, argv, &config);
    } catch (const std::exception& e) {
        std::cerr << "[Main] " << e.what() << std::endl;
        PrintUsage();
        return 1;
    }

    auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "[ConfigLoader] " << problem << std::endl;
        }
        return 1;
    }

    auto logger = std::make_shared<infrastructure::Logger>(
        *infrastructure::Logger::ParseLevel(config.logLevel),
        config.logToFile ? config.logFilename : "");

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
        auto store = std::make_shared<infrastructure::FileArtifactStore>(config.outputDir);
        if (size_t swept = store->sweepTemporaries()) {
            logger->info(kComponent, "Removed " + std::to_string(swept) + " leftover temp files");
        }

        domain::IdentifierSet ids;
        if (!cli.ids.empty()) {
            ids = domain::IdentifierParser::FromList(cli.ids);
            logger->info(kComponent, "Using " + std::to_string(ids.size()) + " identifiers from the command line");
        } else {
            logger->info(kComponent, "Collecting identifiers from " + config.baseUrl);
            ids = CollectIdentifiers(config, logger);
        }

        if (g_stopRequested) {
            logger->warning(kComponent, "Stopped before the export phase");
            return 1;
        }

        infrastructure::HttplibSession::Options httpOptions;
        httpOptions.timeout = std::chrono::milliseconds(config.exportFormTimeoutMs);
        httpOptions.userAgent = config.userAgent;
        httpOptions.maxPooledClients = static_cast<size_t>(config.workers);
        auto http = std::make_shared<infrastructure::HttplibSession>(httpOptions);

        auto fetcher = std::make_shared<application::ExportFetcher>(
            http, config.exportForm, config.exportUrlTemplate, logger);

        application::PipelineDriver::Options pipelineOptions;
        pipelineOptions.retryAttempts = config.retryAttempts;
        pipelineOptions.retryDelay = std::chrono::milliseconds(config.retryDelayMs);
        pipelineOptions.maxItems = static_cast<size_t>(config.maxItems);
        pipelineOptions.workers = static_cast<size_t>(config.workers);

        application::PipelineDriver driver(fetcher, store, pipelineOptions, logger);
        auto summary = driver.run(ids, &g_stopRequested);

        PrintSummary(summary, config.outputDir);
        return summary.failed > 0 ? 2 : 0;
    } catch (const domain::FatalError& e) {
        logger->error(kComponent, std::string("Fatal: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger->error(kComponent, std::string("Unexpected error: ") + e.what());
        return 1;
    }
}
