/**
 * @file IdCollector.hpp
 * @brief Walks every page of the grid and accumulates the identifiers of its export links.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "application/GridNavigator.hpp"
#include "domain/Identifier.hpp"
#include "infrastructure/Logger.hpp"

namespace tariffharvest::application {

enum class CollectionStop {
    Exhausted,        // pager reported no further pages
    PageCap,          // configured page cap reached
    StallGuard,       // far more pages than the pager advertised
    NavigationFailed  // advancing kept timing out
};

const char* ToString(CollectionStop stop);

struct CollectionResult {
    domain::IdentifierSet ids;
    int pagesVisited = 0;
    int estimatedTotalPages = 0;
    CollectionStop stop = CollectionStop::Exhausted;
};

/**
 * @class IdCollector
 * @brief Single-threaded orchestration of the GridNavigator across all pages.
 */
class IdCollector {
public:
    struct Options {
        std::string baseUrl;
        int maxPages = 350;         // 0 disables the cap
        int navigationRetries = 1;  // extra attempts for a failed advance or settle
    };

    /** @brief Pages allowed beyond the estimate: multiplier x estimate + slack. */
    static constexpr int kStallMultiplier = 2;
    static constexpr int kStallSlack = 10;

    IdCollector(std::shared_ptr<GridNavigator> navigator, Options options,
                std::shared_ptr<infrastructure::Logger> logger);

    /**
     * @brief Runs the whole collection.
     * @throws FatalError when enumeration cannot begin.
     */
    CollectionResult collect();

private:
    std::optional<AdvanceResult> advanceWithRetry(int page);
    bool settleWithRetry(int page);
    bool morePagesAhead();

    std::shared_ptr<GridNavigator> m_navigator;
    Options m_options;
    std::shared_ptr<infrastructure::Logger> m_logger;
};

} // namespace tariffharvest::application
