/**
 * @file BrowserSession.hpp
 * @brief Capability interface of the rendering-engine session that hosts the tariff grid.
 */

#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tariffharvest::domain {

/** @brief Opaque reference to an element of the current page. May go stale after a content swap. */
struct ElementHandle {
    std::string id;
};

/**
 * @class BrowserSession
 * @brief Abstract interface for an interactive, stateful browser session.
 *
 * Element reads throw StaleElementError when the referenced element was
 * replaced since it was found. Any compliant implementation is substitutable.
 */
class BrowserSession {
public:
    virtual ~BrowserSession() = default;

    /** @brief Loads the given URL in the session's current window. */
    virtual void navigate(const std::string& url) = 0;

    /** @brief Finds all elements matching a CSS selector; an empty result is not an error. */
    virtual std::vector<ElementHandle> find(const std::string& selector) = 0;

    /** @brief Native click on an element. */
    virtual void click(const ElementHandle& element) = 0;

    /**
     * @brief Runs a synchronous script in the page context.
     * @param args Elements exposed to the script as `arguments[i]`.
     * @return The script's return value serialised as JSON text.
     */
    virtual std::string execute(const std::string& script, const std::vector<ElementHandle>& args = {}) = 0;

    /** @brief Reads an attribute; nullopt when the element lacks it. */
    virtual std::optional<std::string> getAttribute(const ElementHandle& element, const std::string& name) = 0;

    /** @brief Visible text of an element. */
    virtual std::string getText(const ElementHandle& element) = 0;

    /**
     * @brief Polls the predicate until it returns true or the timeout expires.
     * @return false on timeout.
     */
    virtual bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) = 0;
};

} // namespace tariffharvest::domain
