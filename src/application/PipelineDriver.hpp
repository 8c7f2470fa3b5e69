/**
 * @file PipelineDriver.hpp
 * @brief Feeds collected identifiers through the export source with skip-if-present and bounded retry.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "domain/ArtifactStore.hpp"
#include "domain/ExportSource.hpp"
#include "domain/Identifier.hpp"
#include "infrastructure/Logger.hpp"

namespace tariffharvest::application {

enum class ItemStatus { Skipped, Downloaded, Failed, Cancelled };

const char* ToString(ItemStatus status);

struct ItemOutcome {
    domain::Identifier id = 0;
    ItemStatus status = ItemStatus::Cancelled;
    int attempts = 0;
    std::string lastError;
};

struct RunSummary {
    size_t total = 0;
    size_t skipped = 0;
    size_t downloaded = 0;
    size_t failed = 0;
    size_t cancelled = 0;
    std::vector<domain::Identifier> failedIds;
    std::vector<ItemOutcome> outcomes; // in work-list order
};

/**
 * @class PipelineDriver
 * @brief Export phase orchestration.
 *
 * Work runs in ascending identifier order. For each identifier: an existing
 * artifact short-circuits the fetch; otherwise fetch + persist is attempted up
 * to the retry budget with a fixed pause in between. A failed identifier
 * never aborts the run.
 */
class PipelineDriver {
public:
    struct Options {
        int retryAttempts = 3;
        std::chrono::milliseconds retryDelay{1000};
        size_t maxItems = 0; // 0 = no cap
        size_t workers = 1;
    };

    using ProgressCallback = std::function<void(const ItemOutcome&)>;

    PipelineDriver(std::shared_ptr<domain::ExportSource> source,
                   std::shared_ptr<domain::ArtifactStore> store,
                   Options options,
                   std::shared_ptr<infrastructure::Logger> logger);

    /** @brief Sorted, capped work list derived from the identifier set. */
    std::vector<domain::Identifier> buildWorkList(const domain::IdentifierSet& ids) const;

    /**
     * @brief Processes every identifier of the work list.
     * @param stopFlag Raised externally to stop taking new identifiers.
     * @param onItem Called from the worker thread after each finished identifier.
     */
    RunSummary run(const domain::IdentifierSet& ids,
                   const std::atomic<bool>* stopFlag = nullptr,
                   ProgressCallback onItem = nullptr);

private:
    ItemOutcome processOne(domain::Identifier id);

    std::shared_ptr<domain::ExportSource> m_source;
    std::shared_ptr<domain::ArtifactStore> m_store;
    Options m_options;
    std::shared_ptr<infrastructure::Logger> m_logger;
};

} // namespace tariffharvest::application
