/**
 * @file PipelineDriver.cpp
 * @brief Implementation of PipelineDriver.
 */

#include "application/PipelineDriver.hpp"
#include <algorithm>
#include <thread>
#include "application/WorkerPool.hpp"

namespace tariffharvest::application {

namespace {
constexpr const char* kComponent = "PipelineDriver";
}

const char* ToString(ItemStatus status) {
    switch (status) {
        case ItemStatus::Skipped: return "skipped";
        case ItemStatus::Downloaded: return "downloaded";
        case ItemStatus::Failed: return "failed";
        case ItemStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

PipelineDriver::PipelineDriver(std::shared_ptr<domain::ExportSource> source,
                               std::shared_ptr<domain::ArtifactStore> store,
                               Options options,
                               std::shared_ptr<infrastructure::Logger> logger)
    : m_source(std::move(source)),
      m_store(std::move(store)),
      m_options(options),
      m_logger(std::move(logger)) {
    m_options.retryAttempts = std::max(1, m_options.retryAttempts);
}

std::vector<domain::Identifier> PipelineDriver::buildWorkList(const domain::IdentifierSet& ids) const {
    std::vector<domain::Identifier> work(ids.begin(), ids.end());
    std::sort(work.begin(), work.end());
    if (m_options.maxItems > 0 && work.size() > m_options.maxItems) {
        work.resize(m_options.maxItems);
    }
    return work;
}

ItemOutcome PipelineDriver::processOne(domain::Identifier id) {
    ItemOutcome outcome;
    outcome.id = id;
    const std::string tag = "tid=" + std::to_string(id);

    if (m_store->exists(id)) {
        outcome.status = ItemStatus::Skipped;
        m_logger->info(kComponent, tag + ": already at " + m_store->locationOf(id) + ", skipping");
        return outcome;
    }

    for (int attempt = 1; attempt <= m_options.retryAttempts; ++attempt) {
        outcome.attempts = attempt;
        try {
            std::string bytes = m_source->fetch(id);
            m_store->write(id, bytes);
            outcome.status = ItemStatus::Downloaded;
            outcome.lastError.clear();
            m_logger->info(kComponent, tag + ": saved " + std::to_string(bytes.size()) + " bytes to " + m_store->locationOf(id));
            return outcome;
        } catch (const std::exception& e) {
            outcome.lastError = e.what();
            m_logger->warning(kComponent, tag + ": attempt " + std::to_string(attempt) + "/" +
                                          std::to_string(m_options.retryAttempts) + " failed: " + e.what());
        }
        if (attempt < m_options.retryAttempts && m_options.retryDelay.count() > 0) {
            std::this_thread::sleep_for(m_options.retryDelay);
        }
    }

    outcome.status = ItemStatus::Failed;
    m_logger->error(kComponent, tag + ": giving up after " + std::to_string(outcome.attempts) + " attempts");
    return outcome;
}

RunSummary PipelineDriver::run(const domain::IdentifierSet& ids,
                               const std::atomic<bool>* stopFlag,
                               ProgressCallback onItem) {
    const std::vector<domain::Identifier> work = buildWorkList(ids);

    RunSummary summary;
    summary.total = work.size();
    summary.outcomes.resize(work.size());
    for (size_t i = 0; i < work.size(); ++i) {
        summary.outcomes[i].id = work[i];
    }

    m_logger->info(kComponent, "Processing " + std::to_string(work.size()) + " identifiers with " +
                               std::to_string(std::max<size_t>(1, m_options.workers)) + " worker(s)");

    // Each index is owned by exactly one worker, so outcome slots need no lock.
    WorkerPool pool(m_options.workers);
    pool.forEachIndex(work.size(), [&](size_t index) {
        summary.outcomes[index] = processOne(work[index]);
        if (onItem) onItem(summary.outcomes[index]);
    }, stopFlag);

    for (const auto& outcome : summary.outcomes) {
        switch (outcome.status) {
            case ItemStatus::Skipped: ++summary.skipped; break;
            case ItemStatus::Downloaded: ++summary.downloaded; break;
            case ItemStatus::Failed:
                ++summary.failed;
                summary.failedIds.push_back(outcome.id);
                break;
            case ItemStatus::Cancelled: ++summary.cancelled; break;
        }
    }

    if (summary.cancelled > 0) {
        m_logger->warning(kComponent, "Stop requested, " + std::to_string(summary.cancelled) + " identifiers not started");
    }
    m_logger->info(kComponent, "Done: " + std::to_string(summary.total) + " total, " +
                               std::to_string(summary.skipped) + " skipped, " +
                               std::to_string(summary.downloaded) + " downloaded, " +
                               std::to_string(summary.failed) + " failed");
    return summary;
}

} // namespace tariffharvest::application
