/**
 * @file HttplibSession.cpp
 * @brief Implementation of HttplibSession.
 */

#include "infrastructure/HttplibSession.hpp"
#include <algorithm>
#include <cctype>
#include <httplib.h>

namespace tariffharvest::infrastructure {

namespace {
std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}
}

HttplibSession::HttplibSession(Options options)
    : m_options(std::move(options)) {}

HttplibSession::~HttplibSession() = default;

std::optional<HttplibSession::UrlParts> HttplibSession::SplitUrl(const std::string& url) {
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) return std::nullopt;

    std::string scheme = url.substr(0, schemeEnd);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (scheme != "http" && scheme != "https") return std::nullopt;

    size_t hostStart = schemeEnd + 3;
    size_t targetStart = url.find_first_of("/?#", hostStart);
    std::string host = url.substr(hostStart, targetStart == std::string::npos ? std::string::npos : targetStart - hostStart);
    if (host.empty()) return std::nullopt;

    UrlParts parts;
    parts.origin = scheme + "://" + host;
    parts.target = targetStart == std::string::npos ? "/" : url.substr(targetStart);
    size_t fragment = parts.target.find('#');
    if (fragment != std::string::npos) parts.target.erase(fragment);
    if (parts.target.empty() || parts.target[0] != '/') parts.target.insert(0, "/");
    return parts;
}

std::optional<std::pair<std::string, std::string>> HttplibSession::ParseSetCookie(const std::string& header) {
    std::string pair = header.substr(0, header.find(';'));
    size_t eq = pair.find('=');
    if (eq == std::string::npos) return std::nullopt;
    std::string name = Trim(pair.substr(0, eq));
    if (name.empty()) return std::nullopt;
    return std::make_pair(name, Trim(pair.substr(eq + 1)));
}

std::string HttplibSession::cookieHeader() const {
    std::lock_guard<std::mutex> lock(m_cookieMutex);
    std::string header;
    for (const auto& [name, value] : m_cookies) {
        if (!header.empty()) header += "; ";
        header += name + "=" + value;
    }
    return header;
}

std::unique_ptr<httplib::Client> HttplibSession::acquire(const std::string& origin) {
    {
        std::lock_guard<std::mutex> lock(m_poolMutex);
        auto it = m_pool.find(origin);
        if (it != m_pool.end() && !it->second.empty()) {
            auto client = std::move(it->second.back());
            it->second.pop_back();
            return client;
        }
    }

    auto client = std::make_unique<httplib::Client>(origin);
    client->set_keep_alive(true);
    client->set_follow_location(true);
    client->set_connection_timeout(std::chrono::seconds(10));
    client->set_read_timeout(m_options.timeout);
    client->set_write_timeout(m_options.timeout);
    return client;
}

void HttplibSession::release(const std::string& origin, std::unique_ptr<httplib::Client> client) {
    std::lock_guard<std::mutex> lock(m_poolMutex);
    auto& idle = m_pool[origin];
    if (idle.size() < m_options.maxPooledClients) {
        idle.push_back(std::move(client));
    }
}

template <typename Request>
domain::HttpResponse HttplibSession::perform(const std::string& url, Request&& request) {
    domain::HttpResponse response;

    auto parts = SplitUrl(url);
    if (!parts) {
        response.error = "unsupported URL: " + url;
        return response;
    }

    httplib::Headers headers;
    if (!m_options.userAgent.empty()) {
        headers.emplace("User-Agent", m_options.userAgent);
    }
    std::string cookies = cookieHeader();
    if (!cookies.empty()) {
        headers.emplace("Cookie", cookies);
    }

    auto client = acquire(parts->origin);
    httplib::Result result = request(*client, parts->target, headers);

    if (result) {
        response.status = result->status;
        response.body = result->body;

        std::lock_guard<std::mutex> lock(m_cookieMutex);
        size_t count = result->get_header_value_count("Set-Cookie");
        for (size_t i = 0; i < count; ++i) {
            if (auto cookie = ParseSetCookie(result->get_header_value("Set-Cookie", i))) {
                m_cookies[cookie->first] = cookie->second;
            }
        }
    } else {
        response.error = httplib::to_string(result.error());
    }

    release(parts->origin, std::move(client));
    return response;
}

domain::HttpResponse HttplibSession::get(const std::string& url) {
    return perform(url, [](httplib::Client& cli, const std::string& target, const httplib::Headers& headers) {
        return cli.Get(target, headers);
    });
}

domain::HttpResponse HttplibSession::postForm(const std::string& url, const domain::FormFields& fields) {
    httplib::Params params(fields.begin(), fields.end());
    return perform(url, [&params](httplib::Client& cli, const std::string& target, const httplib::Headers& headers) {
        return cli.Post(target, headers, params);
    });
}

} // namespace tariffharvest::infrastructure
