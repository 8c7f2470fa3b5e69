/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "infrastructure/Logger.hpp"

namespace tariffharvest::infrastructure {

namespace {

template <typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring '" << key << "': " << e.what() << std::endl;
    }
}

void ApplyGrid(const nlohmann::json& j, domain::GridSelectors& grid) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Ignoring 'grid': not an object" << std::endl;
        return;
    }
    ReadKey(j, "showAllSelectors", grid.showAllSelectors);
    ReadKey(j, "busySelector", grid.busySelector);
    ReadKey(j, "exportLinkSelector", grid.exportLinkSelector);
    ReadKey(j, "nextSelectors", grid.nextSelectors);
    ReadKey(j, "summarySelector", grid.summarySelector);
    ReadKey(j, "pagerNumberSelector", grid.pagerNumberSelector);
}

void ApplyExportForm(const nlohmann::json& j, domain::ExportFormProfile& form) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] Ignoring 'exportForm': not an object" << std::endl;
        return;
    }
    ReadKey(j, "statusFields", form.statusFields);
    ReadKey(j, "selectedValue", form.selectedValue);
    ReadKey(j, "formatField", form.formatField);
    ReadKey(j, "plainTextValue", form.plainTextValue);
    ReadKey(j, "binaryValue", form.binaryValue);
    ReadKey(j, "binaryField", form.binaryField);
    ReadKey(j, "eventTargetField", form.eventTargetField);
    ReadKey(j, "eventArgumentField", form.eventArgumentField);
    ReadKey(j, "exportAction", form.exportAction);
}

} // namespace

std::vector<std::string> AppConfig::validate() const {
    std::vector<std::string> problems;
    if (baseUrl.empty()) problems.push_back("baseUrl is empty");
    if (exportUrlTemplate.find("{tid}") == std::string::npos) {
        problems.push_back("exportUrlTemplate has no {tid} placeholder");
    }
    if (outputDir.empty()) problems.push_back("outputDir is empty");
    if (maxPages < 0) problems.push_back("maxPages must be >= 0");
    if (retryAttempts < 1) problems.push_back("retryAttempts must be >= 1");
    if (retryDelayMs < 0) problems.push_back("retryDelayMs must be >= 0");
    if (maxItems < 0) problems.push_back("maxItems must be >= 0");
    if (workers < 1) problems.push_back("workers must be >= 1");
    if (navigationRetries < 0) problems.push_back("navigationRetries must be >= 0");
    for (int timeout : {gridReadyTimeoutMs, pagerAdvanceTimeoutMs, exportFormTimeoutMs, linkWaitTimeoutMs}) {
        if (timeout <= 0) {
            problems.push_back("timeouts must be positive");
            break;
        }
    }
    if (!Logger::ParseLevel(logLevel)) problems.push_back("unknown logLevel: " + logLevel);
    if (grid.showAllSelectors.empty()) problems.push_back("grid.showAllSelectors is empty");
    if (grid.nextSelectors.empty()) problems.push_back("grid.nextSelectors is empty");
    if (grid.exportLinkSelector.empty()) problems.push_back("grid.exportLinkSelector is empty");
    if (auto formProblem = exportForm.validate()) problems.push_back("exportForm: " + *formProblem);
    return problems;
}

void ConfigLoader::Apply(const nlohmann::json& j, AppConfig& config) {
    ReadKey(j, "baseUrl", config.baseUrl);
    ReadKey(j, "exportUrlTemplate", config.exportUrlTemplate);
    ReadKey(j, "outputDir", config.outputDir);
    ReadKey(j, "maxPages", config.maxPages);
    ReadKey(j, "retryAttempts", config.retryAttempts);
    ReadKey(j, "retryDelayMs", config.retryDelayMs);
    ReadKey(j, "maxItems", config.maxItems);
    ReadKey(j, "workers", config.workers);
    ReadKey(j, "gridReadyTimeoutMs", config.gridReadyTimeoutMs);
    ReadKey(j, "pagerAdvanceTimeoutMs", config.pagerAdvanceTimeoutMs);
    ReadKey(j, "exportFormTimeoutMs", config.exportFormTimeoutMs);
    ReadKey(j, "linkWaitTimeoutMs", config.linkWaitTimeoutMs);
    ReadKey(j, "stalePauseMs", config.stalePauseMs);
    ReadKey(j, "navigationRetries", config.navigationRetries);
    ReadKey(j, "webdriverUrl", config.webdriverUrl);
    ReadKey(j, "headless", config.headless);
    ReadKey(j, "windowWidth", config.windowWidth);
    ReadKey(j, "windowHeight", config.windowHeight);
    ReadKey(j, "logLevel", config.logLevel);
    ReadKey(j, "logToFile", config.logToFile);
    ReadKey(j, "logFilename", config.logFilename);
    ReadKey(j, "userAgent", config.userAgent);

    if (j.contains("grid")) ApplyGrid(j.at("grid"), config.grid);
    if (j.contains("exportForm")) ApplyExportForm(j.at("exportForm"), config.exportForm);
}

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config;
    if (!std::filesystem::exists(path)) {
        return config;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] " << path << " is not a JSON object, using defaults" << std::endl;
            return config;
        }
        Apply(j, config);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }

    return config;
}

} // namespace tariffharvest::infrastructure
