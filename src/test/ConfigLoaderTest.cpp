#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"

using namespace tariffharvest::infrastructure;
namespace fs = std::filesystem;

namespace {

fs::path WriteSettings(const std::string& name, const std::string& content) {
    fs::path path = fs::temp_directory_path() / ("tariffharvest_" + name + ".json");
    std::ofstream(path) << content;
    return path;
}

bool Mentions(const std::vector<std::string>& problems, const std::string& needle) {
    for (const auto& p : problems) {
        if (p.find(needle) != std::string::npos) return true;
    }
    return false;
}

}

static void TestMissingFileUsesDefaults() {
    AppConfig config = ConfigLoader::Load("/nonexistent/tariffharvest/settings.json");
    assert(config.baseUrl == "https://etariff.ferc.gov/TariffList.aspx");
    assert(config.maxPages == 350);
    assert(config.retryAttempts == 3);
    assert(config.outputDir == "TariffXML");
    assert(config.exportForm.statusFields.size() == 7);
    assert(config.validate().empty());
}

static void TestPartialFileOverridesOnlyPresentKeys() {
    auto path = WriteSettings("partial", R"({
        "outputDir": "out",
        "maxPages": 0,
        "headless": true,
        "grid": { "busySelector": ".loading" },
        "exportForm": { "plainTextValue": "Text", "binaryField": "ctl00$Bin" }
    })");
    AppConfig config = ConfigLoader::Load(path.string());
    assert(config.outputDir == "out");
    assert(config.maxPages == 0);
    assert(config.headless);
    assert(config.workers == 4);
    assert(config.grid.busySelector == ".loading");
    assert(!config.grid.nextSelectors.empty());
    assert(config.exportForm.plainTextValue == "Text");
    assert(config.exportForm.binaryField == "ctl00$Bin");
    assert(config.exportForm.formatField == "ctl00$MainContent$rblFormat");
    assert(config.validate().empty());
    fs::remove(path);
}

static void TestWrongTypesKeepDefaults() {
    AppConfig config;
    ConfigLoader::Apply(nlohmann::json::parse(R"({
        "retryAttempts": "five",
        "workers": 2,
        "grid": "not-an-object",
        "exportForm": { "statusFields": 3 }
    })"), config);
    assert(config.retryAttempts == 3);
    assert(config.workers == 2);
    assert(config.grid.exportLinkSelector == "a[href*='tid=']");
    assert(config.exportForm.statusFields.size() == 7);
}

static void TestMalformedFileUsesDefaults() {
    auto path = WriteSettings("malformed", "{ \"maxPages\": 12, ");
    AppConfig config = ConfigLoader::Load(path.string());
    assert(config.maxPages == 350);
    fs::remove(path);

    path = WriteSettings("array", "[1, 2, 3]");
    config = ConfigLoader::Load(path.string());
    assert(config.maxPages == 350);
    fs::remove(path);
}

static void TestValidateReportsProblems() {
    AppConfig config;
    config.exportUrlTemplate = "https://example.test/export";
    config.retryAttempts = 0;
    config.workers = 0;
    config.logLevel = "chatty";
    config.grid.nextSelectors.clear();

    auto problems = config.validate();
    assert(Mentions(problems, "{tid}"));
    assert(Mentions(problems, "retryAttempts"));
    assert(Mentions(problems, "workers"));
    assert(Mentions(problems, "logLevel"));
    assert(Mentions(problems, "nextSelectors"));
}

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;
    TestMissingFileUsesDefaults();
    TestPartialFileOverridesOnlyPresentKeys();
    TestWrongTypesKeepDefaults();
    TestMalformedFileUsesDefaults();
    TestValidateReportsProblems();
    std::cout << "[PASS] Config Loader Test." << std::endl;
    return 0;
}
