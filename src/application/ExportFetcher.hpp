/**
 * @file ExportFetcher.hpp
 * @brief Replays a tariff's export form as a single GET + POST exchange.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/ExportForm.hpp"
#include "domain/ExportSource.hpp"
#include "domain/HttpSession.hpp"
#include "infrastructure/Logger.hpp"

namespace tariffharvest::application {

/**
 * @class ExportFetcher
 * @brief Loads the export form, overlays the export selections and posts it back.
 *
 * Every field scraped from the form is posted back untouched except the ones
 * the profile governs; anti-forgery and tracking fields depend on that.
 * One attempt per call, retries belong to the PipelineDriver.
 */
class ExportFetcher : public domain::ExportSource {
public:
    ExportFetcher(std::shared_ptr<domain::HttpSession> session,
                  domain::ExportFormProfile profile,
                  std::string exportUrlTemplate,
                  std::shared_ptr<infrastructure::Logger> logger);

    /**
     * @brief Fetches the export document of one identifier.
     * @throws domain::ExportError on a non-2xx status or transport failure of either request.
     */
    std::string fetch(domain::Identifier id) override;

    std::string exportUrl(domain::Identifier id) const;

private:
    std::shared_ptr<domain::HttpSession> m_session;
    domain::ExportFormProfile m_profile;
    std::string m_urlTemplate;
    std::shared_ptr<infrastructure::Logger> m_logger;
};

} // namespace tariffharvest::application
