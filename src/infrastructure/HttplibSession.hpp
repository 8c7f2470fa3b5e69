/**
 * @file HttplibSession.hpp
 * @brief HttpSession over cpp-httplib with a shared cookie jar and pooled keep-alive clients.
 */

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "domain/HttpSession.hpp"

namespace httplib {
class Client;
}

namespace tariffharvest::infrastructure {

/**
 * @class HttplibSession
 * @brief Thread-safe HTTP session for the export phase.
 *
 * httplib::Client is not safe for concurrent requests, so each call borrows a
 * client for its origin from a small pool and returns it afterwards. Cookies
 * set by any response are replayed on every later request.
 */
class HttplibSession : public domain::HttpSession {
public:
    struct Options {
        std::chrono::milliseconds timeout{60000};
        std::string userAgent;
        size_t maxPooledClients = 8;
    };

    struct UrlParts {
        std::string origin; // scheme://host[:port]
        std::string target; // path and query, at least "/"
    };

    explicit HttplibSession(Options options);
    ~HttplibSession() override;

    HttplibSession(const HttplibSession&) = delete;
    HttplibSession& operator=(const HttplibSession&) = delete;

    domain::HttpResponse get(const std::string& url) override;
    domain::HttpResponse postForm(const std::string& url, const domain::FormFields& fields) override;

    /** @brief Splits an absolute http(s) URL; nullopt for anything else. */
    static std::optional<UrlParts> SplitUrl(const std::string& url);

    /** @brief Extracts the name/value pair of a Set-Cookie header value. */
    static std::optional<std::pair<std::string, std::string>> ParseSetCookie(const std::string& header);

    /** @brief Current jar rendered as a Cookie header value. */
    std::string cookieHeader() const;

private:
    std::unique_ptr<httplib::Client> acquire(const std::string& origin);
    void release(const std::string& origin, std::unique_ptr<httplib::Client> client);

    template <typename Request>
    domain::HttpResponse perform(const std::string& url, Request&& request);

    Options m_options;

    std::mutex m_poolMutex;
    std::map<std::string, std::vector<std::unique_ptr<httplib::Client>>> m_pool;

    mutable std::mutex m_cookieMutex;
    std::map<std::string, std::string> m_cookies;
};

} // namespace tariffharvest::infrastructure
