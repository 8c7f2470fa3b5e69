/**
 * @file ScriptedHttpSession.hpp
 * @brief HttpSession that replays queued responses and records every request.
 */

#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include "domain/HttpSession.hpp"

namespace tariffharvest::test {

class ScriptedHttpSession : public domain::HttpSession {
public:
    struct Post {
        std::string url;
        domain::FormFields fields;
    };

    // Queued responses are used first; the defaults answer once a queue runs dry.
    std::deque<domain::HttpResponse> getQueue;
    std::deque<domain::HttpResponse> postQueue;
    domain::HttpResponse defaultGet{200, "<form></form>", ""};
    domain::HttpResponse defaultPost{200, "<Tariff/>", ""};

    domain::HttpResponse get(const std::string& url) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        gets.push_back(url);
        return next(getQueue, defaultGet);
    }

    domain::HttpResponse postForm(const std::string& url, const domain::FormFields& fields) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        posts.push_back(Post{url, fields});
        return next(postQueue, defaultPost);
    }

    std::vector<std::string> gets;
    std::vector<Post> posts;

private:
    static domain::HttpResponse next(std::deque<domain::HttpResponse>& queue, const domain::HttpResponse& fallback) {
        if (queue.empty()) return fallback;
        domain::HttpResponse response = queue.front();
        queue.pop_front();
        return response;
    }

    std::mutex m_mutex;
};

} // namespace tariffharvest::test
