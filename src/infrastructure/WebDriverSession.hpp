/**
 * @file WebDriverSession.hpp
 * @brief BrowserSession backed by a W3C WebDriver endpoint (e.g. chromedriver).
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "domain/BrowserSession.hpp"
#include "infrastructure/Logger.hpp"

namespace httplib {
class Client;
}

namespace tariffharvest::infrastructure {

/**
 * @class WebDriverSession
 * @brief Opens one browser session on construction and closes it on destruction.
 *
 * WebDriver "stale element reference" errors surface as StaleElementError,
 * every other protocol error as TransientError. Commands issued from inside
 * waitUntil are cut off at the wait's deadline rather than commandTimeout.
 * Not safe for concurrent waits from several threads.
 */
class WebDriverSession : public domain::BrowserSession {
public:
    struct Options {
        std::string driverUrl = "http://127.0.0.1:9515";
        bool headless = false;
        int windowWidth = 1920;
        int windowHeight = 1080;
        std::chrono::milliseconds pollInterval{250};
        std::chrono::milliseconds commandTimeout{120000};
    };

    /** @brief Creates the remote session. Throws std::runtime_error if the driver refuses. */
    WebDriverSession(Options options, std::shared_ptr<Logger> logger);
    ~WebDriverSession() override;

    WebDriverSession(const WebDriverSession&) = delete;
    WebDriverSession& operator=(const WebDriverSession&) = delete;

    void navigate(const std::string& url) override;
    std::vector<domain::ElementHandle> find(const std::string& selector) override;
    void click(const domain::ElementHandle& element) override;
    std::string execute(const std::string& script, const std::vector<domain::ElementHandle>& args = {}) override;
    std::optional<std::string> getAttribute(const domain::ElementHandle& element, const std::string& name) override;
    std::string getText(const domain::ElementHandle& element) override;
    bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) override;

    /** @brief Capabilities body sent on session creation. */
    static nlohmann::json BuildCapabilities(const Options& options);

    /** @brief Throws the matching domain error when the response value is a WebDriver error object. */
    static void ThrowIfError(const nlohmann::json& value, int httpStatus);

    static nlohmann::json ElementReference(const domain::ElementHandle& element);
    static std::vector<domain::ElementHandle> ParseElements(const nlohmann::json& value);

private:
    nlohmann::json command(const std::string& method, const std::string& path,
                           const nlohmann::json& body = nlohmann::json::object());
    std::string sessionPath(const std::string& suffix) const;

    Options m_options;
    std::shared_ptr<Logger> m_logger;
    std::unique_ptr<httplib::Client> m_client;
    std::string m_sessionId;
    std::mutex m_mutex;
    std::optional<std::chrono::steady_clock::time_point> m_waitDeadline;
};

} // namespace tariffharvest::infrastructure
