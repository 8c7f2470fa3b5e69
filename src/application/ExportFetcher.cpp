/**
 * @file ExportFetcher.cpp
 * @brief Implementation of ExportFetcher.
 */

#include "application/ExportFetcher.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/FormStateExtractor.hpp"

namespace tariffharvest::application {

namespace {
constexpr const char* kComponent = "ExportFetcher";

void EnsureOk(const domain::HttpResponse& response, const char* step, domain::Identifier id) {
    if (response.ok()) return;
    std::string detail = response.status == 0
        ? "transport error: " + response.error
        : "HTTP " + std::to_string(response.status);
    throw domain::ExportError(std::string(step) + " for tid=" + std::to_string(id) + " failed: " + detail,
                              response.status);
}
}

ExportFetcher::ExportFetcher(std::shared_ptr<domain::HttpSession> session,
                             domain::ExportFormProfile profile,
                             std::string exportUrlTemplate,
                             std::shared_ptr<infrastructure::Logger> logger)
    : m_session(std::move(session)),
      m_profile(std::move(profile)),
      m_urlTemplate(std::move(exportUrlTemplate)),
      m_logger(std::move(logger)) {}

std::string ExportFetcher::exportUrl(domain::Identifier id) const {
    return domain::IdentifierParser::ExpandTemplate(m_urlTemplate, id);
}

std::string ExportFetcher::fetch(domain::Identifier id) {
    const std::string url = exportUrl(id);

    domain::HttpResponse form = m_session->get(url);
    EnsureOk(form, "export form GET", id);

    domain::FormFields scraped = infrastructure::FormStateExtractor::Extract(form.body);
    m_logger->debug(kComponent, "tid=" + std::to_string(id) + ": scraped " + std::to_string(scraped.size()) + " form fields");

    domain::FormFields payload = domain::FormOverlay::Apply(scraped, m_profile);

    domain::HttpResponse exported = m_session->postForm(url, payload);
    EnsureOk(exported, "export POST", id);

    return std::move(exported.body);
}

} // namespace tariffharvest::application
