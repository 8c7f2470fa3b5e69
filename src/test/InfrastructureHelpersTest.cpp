#include <cassert>
#include <iostream>
#include <nlohmann/json.hpp>

#include "domain/Errors.hpp"
#include "infrastructure/HttplibSession.hpp"
#include "infrastructure/Logger.hpp"
#include "infrastructure/WebDriverSession.hpp"

using namespace tariffharvest;
using infrastructure::HttplibSession;
using infrastructure::WebDriverSession;
using nlohmann::json;

static void TestSplitUrl() {
    auto parts = HttplibSession::SplitUrl("https://etariff.ferc.gov/TariffXMLExport.aspx?tid=100");
    assert(parts);
    assert(parts->origin == "https://etariff.ferc.gov");
    assert(parts->target == "/TariffXMLExport.aspx?tid=100");

    parts = HttplibSession::SplitUrl("HTTP://localhost:9515");
    assert(parts && parts->origin == "http://localhost:9515" && parts->target == "/");

    parts = HttplibSession::SplitUrl("http://host?x=1#frag");
    assert(parts && parts->target == "/?x=1");

    assert(!HttplibSession::SplitUrl("ftp://host/file"));
    assert(!HttplibSession::SplitUrl("TariffList.aspx"));
    assert(!HttplibSession::SplitUrl("https:///path"));
}

static void TestParseSetCookie() {
    auto cookie = HttplibSession::ParseSetCookie("ASP.NET_SessionId=abc123; path=/; HttpOnly");
    assert(cookie && cookie->first == "ASP.NET_SessionId" && cookie->second == "abc123");

    cookie = HttplibSession::ParseSetCookie(" token = x=y ");
    assert(cookie && cookie->first == "token" && cookie->second == "x=y");

    assert(!HttplibSession::ParseSetCookie("HttpOnly"));
    assert(!HttplibSession::ParseSetCookie("=value"));

    HttplibSession session(HttplibSession::Options{});
    assert(session.cookieHeader().empty());
}

static void TestParseElements() {
    const std::string key = "element-6066-11e4-a52e-4f304ffafaa6";
    json value = json::array({json{{key, "e1"}}, json{{"other", "x"}}, json{{key, "e2"}}});
    auto elements = WebDriverSession::ParseElements(value);
    assert(elements.size() == 2);
    assert(elements[0].id == "e1" && elements[1].id == "e2");
    assert(WebDriverSession::ParseElements(json::object()).empty());
    assert(WebDriverSession::ElementReference(domain::ElementHandle{"e9"})[key] == "e9");
}

static void TestErrorMapping() {
    WebDriverSession::ThrowIfError(json(nullptr), 200);
    WebDriverSession::ThrowIfError(json{{"sessionId", "s"}}, 200);

    bool stale = false;
    try {
        WebDriverSession::ThrowIfError(json{{"error", "stale element reference"}, {"message", "gone"}}, 404);
    } catch (const domain::StaleElementError&) {
        stale = true;
    }
    assert(stale);

    bool transient = false;
    try {
        WebDriverSession::ThrowIfError(json{{"error", "no such element"}}, 404);
    } catch (const domain::StaleElementError&) {
        assert(false);
    } catch (const domain::TransientError& e) {
        transient = std::string(e.what()).find("no such element") != std::string::npos;
    }
    assert(transient);

    transient = false;
    try {
        WebDriverSession::ThrowIfError(json("oops"), 500);
    } catch (const domain::TransientError&) {
        transient = true;
    }
    assert(transient);
}

static void TestCapabilities() {
    WebDriverSession::Options options;
    options.windowWidth = 1280;
    options.windowHeight = 720;
    json args = WebDriverSession::BuildCapabilities(options)["capabilities"]["alwaysMatch"]["goog:chromeOptions"]["args"];
    bool hasWindow = false;
    bool hasHeadless = false;
    for (const auto& arg : args) {
        if (arg == "--window-size=1280,720") hasWindow = true;
        if (arg == "--headless=new") hasHeadless = true;
    }
    assert(hasWindow && !hasHeadless);

    options.headless = true;
    args = WebDriverSession::BuildCapabilities(options)["capabilities"]["alwaysMatch"]["goog:chromeOptions"]["args"];
    hasHeadless = false;
    for (const auto& arg : args) {
        if (arg == "--headless=new") hasHeadless = true;
    }
    assert(hasHeadless);
}

static void TestLogLevels() {
    using infrastructure::Logger;
    using infrastructure::LogLevel;
    assert(Logger::ParseLevel("debug") == LogLevel::Debug);
    assert(Logger::ParseLevel("WARN") == LogLevel::Warning);
    assert(Logger::ParseLevel("Error") == LogLevel::Error);
    assert(!Logger::ParseLevel("verbose"));
    assert(std::string(Logger::LevelName(LogLevel::Info)) == "INFO");
}

int main() {
    std::cout << "[Test] Starting Infrastructure Helpers Test..." << std::endl;
    TestSplitUrl();
    TestParseSetCookie();
    TestParseElements();
    TestErrorMapping();
    TestCapabilities();
    TestLogLevels();
    std::cout << "[PASS] Infrastructure Helpers Test." << std::endl;
    return 0;
}
