/**
 * @file IdCollector.cpp
 * @brief Implementation of IdCollector.
 */

#include "application/IdCollector.hpp"
#include "domain/Errors.hpp"

namespace tariffharvest::application {

namespace {
constexpr const char* kComponent = "IdCollector";
}

const char* ToString(CollectionStop stop) {
    switch (stop) {
        case CollectionStop::Exhausted: return "no further pages";
        case CollectionStop::PageCap: return "page cap reached";
        case CollectionStop::StallGuard: return "stall guard tripped";
        case CollectionStop::NavigationFailed: return "navigation kept failing";
    }
    return "unknown";
}

IdCollector::IdCollector(std::shared_ptr<GridNavigator> navigator, Options options,
                         std::shared_ptr<infrastructure::Logger> logger)
    : m_navigator(std::move(navigator)), m_options(std::move(options)), m_logger(std::move(logger)) {}

std::optional<AdvanceResult> IdCollector::advanceWithRetry(int page) {
    for (int attempt = 0; attempt <= m_options.navigationRetries; ++attempt) {
        try {
            return m_navigator->advance();
        } catch (const domain::TransientError& e) {
            m_logger->warning(kComponent, "Advancing past page " + std::to_string(page) +
                                          " failed (attempt " + std::to_string(attempt + 1) + "): " + e.what());
        }
    }
    return std::nullopt;
}

bool IdCollector::settleWithRetry(int page) {
    for (int attempt = 0; attempt <= m_options.navigationRetries; ++attempt) {
        try {
            m_navigator->waitForReady();
            return true;
        } catch (const domain::TransientError& e) {
            m_logger->warning(kComponent, "Page " + std::to_string(page) + " did not settle (attempt " +
                                          std::to_string(attempt + 1) + "): " + e.what());
        }
    }
    return false;
}

bool IdCollector::morePagesAhead() {
    try {
        return m_navigator->hasNextPage();
    } catch (const domain::TransientError& e) {
        m_logger->warning(kComponent, std::string("Pager lookup failed: ") + e.what());
        return true;
    }
}

CollectionResult IdCollector::collect() {
    CollectionResult result;

    m_navigator->open(m_options.baseUrl);
    try {
        m_navigator->activate();
    } catch (const domain::NavigationTimeout& e) {
        throw domain::FatalError(std::string("grid never became ready after activation: ") + e.what());
    }

    result.estimatedTotalPages = m_navigator->estimateTotalPages();
    const int stallBound = result.estimatedTotalPages * kStallMultiplier + kStallSlack;
    m_logger->info(kComponent, "Estimated total pages: " + std::to_string(result.estimatedTotalPages));

    while (true) {
        const int page = ++result.pagesVisited;

        domain::IdentifierSet pageIds;
        try {
            pageIds = m_navigator->extractIdentifiers();
        } catch (const domain::TransientError& e) {
            m_logger->warning(kComponent, "Page " + std::to_string(page) + ": extraction failed: " + e.what());
        }

        const size_t before = result.ids.size();
        result.ids.insert(pageIds.begin(), pageIds.end());
        const size_t added = result.ids.size() - before;

        m_logger->info(kComponent, "Page " + std::to_string(page) + ": " + std::to_string(pageIds.size()) +
                                   " identifiers, " + std::to_string(added) + " new, " +
                                   std::to_string(result.ids.size()) + " total");
        if (added == 0 && page > 1) {
            m_logger->warning(kComponent, "Page " + std::to_string(page) + " yielded no new identifiers");
        }

        // A pager that is already exhausted outranks the safety stops.
        if (m_options.maxPages > 0 && page >= m_options.maxPages) {
            result.stop = morePagesAhead() ? CollectionStop::PageCap : CollectionStop::Exhausted;
            break;
        }
        if (page >= stallBound) {
            result.stop = morePagesAhead() ? CollectionStop::StallGuard : CollectionStop::Exhausted;
            break;
        }

        auto advanced = advanceWithRetry(page);
        if (!advanced) {
            result.stop = CollectionStop::NavigationFailed;
            break;
        }
        if (*advanced == AdvanceResult::NoMorePages) {
            result.stop = CollectionStop::Exhausted;
            break;
        }
        // The summary already moved; clicking again would skip this page.
        if (!settleWithRetry(page + 1)) {
            m_logger->warning(kComponent, "Page " + std::to_string(page + 1) + " still busy, extracting anyway");
        }
    }

    if (result.ids.empty()) {
        m_logger->info(kComponent, "Grid exposed no identifiers");
    }
    m_logger->info(kComponent, "Collection finished after " + std::to_string(result.pagesVisited) +
                               " pages (" + ToString(result.stop) + "), " +
                               std::to_string(result.ids.size()) + " identifiers");
    return result;
}

} // namespace tariffharvest::application
