/**
 * @file GridNavigator.cpp
 * @brief Implementation of GridNavigator.
 */

#include "application/GridNavigator.hpp"
#include <algorithm>
#include <cctype>
#include <thread>
#include "domain/Errors.hpp"

namespace tariffharvest::application {

namespace {
constexpr const char* kComponent = "GridNavigator";

// Runs a DOM read; a single stale-element fault is absorbed and the read repeated once.
template <typename Step>
auto RetryOnceIfStale(Step&& step, const char* what, std::chrono::milliseconds pause,
                      infrastructure::Logger& logger) -> decltype(step()) {
    try {
        return step();
    } catch (const domain::StaleElementError& e) {
        logger.debug(kComponent, std::string(what) + " hit a stale element, retrying: " + e.what());
    }
    std::this_thread::sleep_for(pause);
    try {
        return step();
    } catch (const domain::StaleElementError& e) {
        throw domain::TransientError(std::string(what) + " failed on stale elements twice: " + e.what());
    }
}

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}
}

GridNavigator::GridNavigator(std::shared_ptr<domain::BrowserSession> session,
                             domain::GridSelectors selectors,
                             Timing timing,
                             std::shared_ptr<infrastructure::Logger> logger)
    : m_session(std::move(session)),
      m_selectors(std::move(selectors)),
      m_timing(timing),
      m_logger(std::move(logger)) {}

void GridNavigator::open(const std::string& url) {
    try {
        m_session->navigate(url);
    } catch (const std::exception& e) {
        throw domain::FatalError("cannot load grid page " + url + ": " + e.what());
    }
    m_state = NavigatorState::Idle;
    m_logger->info(kComponent, "Opened " + url);
}

void GridNavigator::activate() {
    std::optional<domain::ElementHandle> control;
    std::string matched;
    bool found = false;
    try {
        found = m_session->waitUntil([&] {
            for (const auto& selector : m_selectors.showAllSelectors) {
                auto elements = m_session->find(selector);
                if (!elements.empty()) {
                    control = elements.front();
                    matched = selector;
                    return true;
                }
            }
            return false;
        }, m_timing.gridReady);
    } catch (const domain::TransientError& e) {
        throw domain::FatalError("\"show all records\" control lookup failed: " + std::string(e.what()));
    }

    if (!found || !control) {
        throw domain::FatalError("\"show all records\" control not found");
    }

    try {
        m_session->click(*control);
    } catch (const std::exception& e) {
        throw domain::FatalError("\"show all records\" control could not be clicked: " + std::string(e.what()));
    }
    m_logger->info(kComponent, "Activated show-all via " + matched);

    m_state = NavigatorState::Loading;
    waitForReady();
}

void GridNavigator::waitForReady() {
    bool idle = m_session->waitUntil([this] {
        return m_session->find(m_selectors.busySelector).empty();
    }, m_timing.gridReady);
    if (!idle) {
        throw domain::NavigationTimeout("grid busy indicator did not clear");
    }

    bool hasLinks = m_session->waitUntil([this] {
        return !m_session->find(m_selectors.exportLinkSelector).empty();
    }, m_timing.linkWait);
    if (!hasLinks) {
        m_logger->info(kComponent, "No export links on this page");
    }
    m_state = NavigatorState::Ready;
}

domain::IdentifierSet GridNavigator::extractIdentifiers() {
    return RetryOnceIfStale([this] {
        domain::IdentifierSet ids;
        for (const auto& link : m_session->find(m_selectors.exportLinkSelector)) {
            for (const char* attribute : {"href", "onclick"}) {
                auto target = m_session->getAttribute(link, attribute);
                if (!target) continue;
                if (auto id = domain::IdentifierParser::FromLinkTarget(*target)) {
                    ids.insert(*id);
                    break;
                }
            }
        }
        return ids;
    }, "identifier extraction", m_timing.stalePause, *m_logger);
}

bool GridNavigator::isDisabled(const domain::ElementHandle& element) {
    auto disabled = m_session->getAttribute(element, "disabled");
    if (disabled && ToLower(*disabled) != "false") return true;

    auto ariaDisabled = m_session->getAttribute(element, "aria-disabled");
    if (ariaDisabled && ToLower(*ariaDisabled) == "true") return true;

    auto cssClass = m_session->getAttribute(element, "class");
    return cssClass && ToLower(*cssClass).find("disabled") != std::string::npos;
}

std::optional<domain::ElementHandle> GridNavigator::findNextControl() {
    for (const auto& selector : m_selectors.nextSelectors) {
        auto elements = m_session->find(selector);
        if (elements.empty()) continue;
        if (isDisabled(elements.front())) {
            m_logger->debug(kComponent, "Next control " + selector + " is disabled");
            return std::nullopt;
        }
        return elements.front();
    }
    return std::nullopt;
}

bool GridNavigator::hasNextPage() {
    return RetryOnceIfStale([this] { return findNextControl().has_value(); },
                            "pager lookup", m_timing.stalePause, *m_logger);
}

std::string GridNavigator::readSummary() {
    auto elements = m_session->find(m_selectors.summarySelector);
    if (elements.empty()) return "";
    return Trim(m_session->getText(elements.front()));
}

void GridNavigator::scriptClick(const domain::ElementHandle& element) {
    m_session->execute("arguments[0].click();", {element});
}

AdvanceResult GridNavigator::advance() {
    auto next = RetryOnceIfStale([this] { return findNextControl(); },
                                 "pager lookup", m_timing.stalePause, *m_logger);
    if (!next) {
        m_logger->info(kComponent, "No further pages");
        return AdvanceResult::NoMorePages;
    }

    std::string before = RetryOnceIfStale([this] { return readSummary(); },
                                          "summary read", m_timing.stalePause, *m_logger);
    scriptClick(*next);
    m_state = NavigatorState::Loading;

    bool changed = m_session->waitUntil([&] {
        try {
            return readSummary() != before;
        } catch (const domain::StaleElementError&) {
            return false;
        }
    }, m_timing.pagerAdvance);

    if (!changed) {
        m_state = NavigatorState::Ready;
        throw domain::NavigationTimeout("page summary did not change after clicking next (was \"" + before + "\")");
    }
    return AdvanceResult::Advanced;
}

int GridNavigator::estimateTotalPages() {
    try {
        int highest = 0;
        for (const auto& element : m_session->find(m_selectors.pagerNumberSelector)) {
            std::string text = Trim(m_session->getText(element));
            if (text.empty() || text.size() > 6 ||
                !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
                continue;
            }
            highest = std::max(highest, std::stoi(text));
        }
        if (highest > 0) return highest;
    } catch (const domain::TransientError& e) {
        m_logger->warning(kComponent, std::string("Could not determine total pages: ") + e.what());
    }
    return kFallbackTotalPages;
}

} // namespace tariffharvest::application
