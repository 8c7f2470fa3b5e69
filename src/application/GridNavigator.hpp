/**
 * @file GridNavigator.hpp
 * @brief Drives the paginated tariff grid through a BrowserSession.
 */

#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "domain/BrowserSession.hpp"
#include "domain/GridSelectors.hpp"
#include "domain/Identifier.hpp"
#include "infrastructure/Logger.hpp"

namespace tariffharvest::application {

enum class NavigatorState { Idle, Loading, Ready };

enum class AdvanceResult { Advanced, NoMorePages };

/**
 * @class GridNavigator
 * @brief State machine Idle -> Loading -> Ready over the server-rendered grid.
 *
 * The grid swaps its content in place without a URL change, so a page
 * transition is only recognised by the page-summary text changing. A grid
 * that re-renders an identical summary for a new page is not detected.
 */
class GridNavigator {
public:
    struct Timing {
        std::chrono::milliseconds gridReady{30000};
        std::chrono::milliseconds pagerAdvance{15000};
        std::chrono::milliseconds linkWait{5000};
        std::chrono::milliseconds stalePause{500};
    };

    /** @brief Fallback when the pager shows no page numbers. */
    static constexpr int kFallbackTotalPages = 300;

    GridNavigator(std::shared_ptr<domain::BrowserSession> session,
                  domain::GridSelectors selectors,
                  Timing timing,
                  std::shared_ptr<infrastructure::Logger> logger);

    /** @brief Loads the grid page. Throws FatalError when the page cannot be reached. */
    void open(const std::string& url);

    /**
     * @brief Clicks the "show all records" control and waits for the grid to settle.
     * @throws FatalError when the control cannot be found or clicked.
     * @throws NavigationTimeout when the busy indicator never clears.
     */
    void activate();

    /**
     * @brief Identifiers of every export link on the current page.
     * @throws TransientError after a repeated stale-element fault.
     */
    domain::IdentifierSet extractIdentifiers();

    /**
     * @brief Clicks "next" and waits for the page summary to change.
     *
     * Leaves the navigator Loading on success; the caller settles the new
     * page with waitForReady(). A failed settle must not lead to another
     * click, the grid has already moved.
     * @return NoMorePages when the "next" control is absent or disabled.
     * @throws NavigationTimeout when the summary text does not change in time.
     */
    AdvanceResult advance();

    /**
     * @brief Waits for the busy indicator to clear and for export links to appear.
     * @throws NavigationTimeout when the busy indicator never clears.
     */
    void waitForReady();

    /** @brief True when an enabled "next" control is present. Does not click. */
    bool hasNextPage();

    /** @brief Highest page number shown by the pager, or kFallbackTotalPages. */
    int estimateTotalPages();

    NavigatorState state() const { return m_state; }

private:
    std::optional<domain::ElementHandle> findNextControl();
    bool isDisabled(const domain::ElementHandle& element);
    std::string readSummary();
    void scriptClick(const domain::ElementHandle& element);

    std::shared_ptr<domain::BrowserSession> m_session;
    domain::GridSelectors m_selectors;
    Timing m_timing;
    std::shared_ptr<infrastructure::Logger> m_logger;
    NavigatorState m_state = NavigatorState::Idle;
};

} // namespace tariffharvest::application
