/**
 * @file HttpSession.hpp
 * @brief Interface for the cookie-preserving request/response channel used by the export phase.
 */

#pragma once
#include <string>
#include "domain/ExportForm.hpp"

namespace tariffharvest::domain {

struct HttpResponse {
    int status = 0;       // 0 when the request never got a response
    std::string body;     // raw bytes, verbatim
    std::string error;    // transport error description

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @class HttpSession
 * @brief Abstract HTTP client that keeps cookies and headers across requests to the same host.
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class HttpSession {
public:
    virtual ~HttpSession() = default;

    virtual HttpResponse get(const std::string& url) = 0;

    /** @brief POSTs the fields as an application/x-www-form-urlencoded body. */
    virtual HttpResponse postForm(const std::string& url, const FormFields& fields) = 0;
};

} // namespace tariffharvest::domain
