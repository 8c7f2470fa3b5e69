/**
 * @file WebDriverSession.cpp
 * @brief Implementation of WebDriverSession.
 */

#include "infrastructure/WebDriverSession.hpp"
#include <httplib.h>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include "domain/Errors.hpp"

namespace tariffharvest::infrastructure {

using json = nlohmann::json;

namespace {
constexpr const char* kElementKey = "element-6066-11e4-a52e-4f304ffafaa6";
constexpr const char* kComponent = "WebDriverSession";

using Clock = std::chrono::steady_clock;

// Installs a wait deadline for the lifetime of one waitUntil call.
class DeadlineScope {
public:
    DeadlineScope(std::optional<Clock::time_point>& slot, Clock::time_point deadline)
        : m_slot(slot), m_previous(slot) {
        m_slot = m_previous ? std::min(*m_previous, deadline) : deadline;
    }
    ~DeadlineScope() { m_slot = m_previous; }

    DeadlineScope(const DeadlineScope&) = delete;
    DeadlineScope& operator=(const DeadlineScope&) = delete;

private:
    std::optional<Clock::time_point>& m_slot;
    std::optional<Clock::time_point> m_previous;
};
}

json WebDriverSession::BuildCapabilities(const Options& options) {
    json args = json::array({
        "--no-sandbox",
        "--disable-dev-shm-usage",
        "--window-size=" + std::to_string(options.windowWidth) + "," + std::to_string(options.windowHeight)
    });
    if (options.headless) {
        args.push_back("--headless=new");
    }
    return {
        {"capabilities", {
            {"alwaysMatch", {
                {"browserName", "chrome"},
                {"goog:chromeOptions", {{"args", args}}}
            }}
        }}
    };
}

void WebDriverSession::ThrowIfError(const json& value, int httpStatus) {
    if (!value.is_object() || !value.contains("error")) {
        if (httpStatus >= 400) {
            throw domain::TransientError("WebDriver HTTP " + std::to_string(httpStatus));
        }
        return;
    }
    std::string error = value.value("error", std::string("unknown error"));
    std::string message = value.value("message", std::string());
    if (error == "stale element reference") {
        throw domain::StaleElementError(message.empty() ? error : message);
    }
    throw domain::TransientError("WebDriver " + error + (message.empty() ? "" : ": " + message));
}

json WebDriverSession::ElementReference(const domain::ElementHandle& element) {
    return {{kElementKey, element.id}};
}

std::vector<domain::ElementHandle> WebDriverSession::ParseElements(const json& value) {
    std::vector<domain::ElementHandle> elements;
    if (!value.is_array()) return elements;
    for (const auto& item : value) {
        if (item.is_object() && item.contains(kElementKey)) {
            elements.push_back(domain::ElementHandle{item[kElementKey].get<std::string>()});
        }
    }
    return elements;
}

WebDriverSession::WebDriverSession(Options options, std::shared_ptr<Logger> logger)
    : m_options(std::move(options)), m_logger(std::move(logger)) {
    m_client = std::make_unique<httplib::Client>(m_options.driverUrl);
    m_client->set_keep_alive(true);
    m_client->set_read_timeout(m_options.commandTimeout);

    json value = command("POST", "/session", BuildCapabilities(m_options));
    if (!value.is_object() || !value.contains("sessionId")) {
        throw std::runtime_error("WebDriver did not return a session id");
    }
    m_sessionId = value["sessionId"].get<std::string>();
    m_logger->info(kComponent, "Browser session " + m_sessionId + " started");
}

WebDriverSession::~WebDriverSession() {
    if (m_sessionId.empty()) return;
    try {
        command("DELETE", "/session/" + m_sessionId);
        m_logger->info(kComponent, "Browser closed");
    } catch (const std::exception& e) {
        m_logger->warning(kComponent, std::string("Failed to close browser session: ") + e.what());
    }
}

std::string WebDriverSession::sessionPath(const std::string& suffix) const {
    return "/session/" + m_sessionId + suffix;
}

json WebDriverSession::command(const std::string& method, const std::string& path, const json& body) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto readTimeout = m_options.commandTimeout;
    if (m_waitDeadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*m_waitDeadline - Clock::now());
        if (remaining.count() <= 0) {
            throw domain::NavigationTimeout("wait deadline passed before " + method + " " + path);
        }
        readTimeout = std::min(readTimeout, remaining);
    }
    m_client->set_read_timeout(readTimeout);

    auto send = [&]() -> httplib::Result {
        if (method == "GET") return m_client->Get(path);
        if (method == "DELETE") return m_client->Delete(path);
        return m_client->Post(path, body.dump(), "application/json");
    };
    httplib::Result res = send();

    if (!res) {
        throw domain::TransientError("WebDriver " + method + " " + path + " failed: " + httplib::to_string(res.error()));
    }

    json parsed;
    try {
        parsed = json::parse(res->body);
    } catch (const json::parse_error& e) {
        throw domain::TransientError("WebDriver returned invalid JSON (HTTP " + std::to_string(res->status) + "): " + e.what());
    }

    json value = parsed.contains("value") ? parsed["value"] : json();
    ThrowIfError(value, res->status);
    return value;
}

void WebDriverSession::navigate(const std::string& url) {
    command("POST", sessionPath("/url"), {{"url", url}});
}

std::vector<domain::ElementHandle> WebDriverSession::find(const std::string& selector) {
    return ParseElements(command("POST", sessionPath("/elements"), {{"using", "css selector"}, {"value", selector}}));
}

void WebDriverSession::click(const domain::ElementHandle& element) {
    command("POST", sessionPath("/element/" + element.id + "/click"));
}

std::string WebDriverSession::execute(const std::string& script, const std::vector<domain::ElementHandle>& args) {
    json jsonArgs = json::array();
    for (const auto& element : args) {
        jsonArgs.push_back(ElementReference(element));
    }
    return command("POST", sessionPath("/execute/sync"), {{"script", script}, {"args", jsonArgs}}).dump();
}

std::optional<std::string> WebDriverSession::getAttribute(const domain::ElementHandle& element, const std::string& name) {
    json value = command("GET", sessionPath("/element/" + element.id + "/attribute/" + name));
    if (value.is_null()) return std::nullopt;
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

std::string WebDriverSession::getText(const domain::ElementHandle& element) {
    json value = command("GET", sessionPath("/element/" + element.id + "/text"));
    return value.is_string() ? value.get<std::string>() : std::string();
}

bool WebDriverSession::waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    DeadlineScope scope(m_waitDeadline, deadline);
    while (true) {
        try {
            if (predicate()) return true;
        } catch (const domain::StaleElementError& e) {
            m_logger->debug(kComponent, std::string("Stale element while waiting: ") + e.what());
        } catch (const domain::TransientError& e) {
            // A command cut short by the deadline ends the wait; earlier failures are real.
            if (Clock::now() < deadline) throw;
            m_logger->debug(kComponent, std::string("Wait expired during a command: ") + e.what());
            return false;
        }
        auto now = Clock::now();
        if (now >= deadline) return false;
        std::this_thread::sleep_for(std::min<Clock::duration>(m_options.pollInterval, deadline - now));
    }
}

} // namespace tariffharvest::infrastructure
