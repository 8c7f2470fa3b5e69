/**
 * @file ConfigLoader.hpp
 * @brief Loads the run configuration (settings.json) once at the process boundary.
 *
 * Every key is optional; values that are missing or of the wrong type keep
 * their defaults so a partial settings file is always usable.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "domain/ExportForm.hpp"
#include "domain/GridSelectors.hpp"

namespace tariffharvest::infrastructure {

struct AppConfig {
    std::string baseUrl = "https://etariff.ferc.gov/TariffList.aspx";
    std::string exportUrlTemplate = "https://etariff.ferc.gov/TariffXMLExport.aspx?tid={tid}";
    std::string outputDir = "TariffXML";

    int maxPages = 350;
    int retryAttempts = 3;
    int retryDelayMs = 1000;
    int maxItems = 0;
    int workers = 4;

    int gridReadyTimeoutMs = 30000;
    int pagerAdvanceTimeoutMs = 15000;
    int exportFormTimeoutMs = 60000;
    int linkWaitTimeoutMs = 5000;
    int stalePauseMs = 500;
    int navigationRetries = 1;

    std::string webdriverUrl = "http://127.0.0.1:9515";
    bool headless = false;
    int windowWidth = 1920;
    int windowHeight = 1080;

    std::string logLevel = "INFO";
    bool logToFile = true;
    std::string logFilename = "tariff_harvest.log";
    std::string userAgent = "Mozilla/5.0 (X11; Linux x86_64) TariffHarvest/1.0";

    domain::GridSelectors grid;
    domain::ExportFormProfile exportForm;

    /** @brief Human-readable problems that make the configuration unusable; empty when valid. */
    std::vector<std::string> validate() const;
};

class ConfigLoader {
public:
    /**
     * @brief Reads the given settings file on top of the defaults.
     * A missing file yields the defaults; a malformed file is reported on stderr and ignored.
     */
    static AppConfig Load(const std::string& path);

    /** @brief Applies the keys present in an already parsed document. */
    static void Apply(const nlohmann::json& j, AppConfig& config);
};

} // namespace tariffharvest::infrastructure
