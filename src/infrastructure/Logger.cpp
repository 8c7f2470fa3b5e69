/**
 * @file Logger.cpp
 * @brief Implementation of Logger.
 */

#include "infrastructure/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace tariffharvest::infrastructure {

namespace {
std::string Timestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&in_time_t, &local);
    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
}

Logger::Logger(LogLevel threshold, const std::string& filename)
    : m_threshold(threshold) {
    if (!filename.empty()) {
        m_file.open(filename, std::ios::app);
        if (!m_file.is_open()) {
            std::cerr << "[Logger] Could not open log file: " << filename << std::endl;
        }
    }
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    if (level < m_threshold) return;

    std::string line = Timestamp() + " - " + LevelName(level) + " - [" + component + "] " + message;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (level >= LogLevel::Warning) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
    if (m_file.is_open()) {
        m_file << line << '\n';
        m_file.flush();
    }
}

std::optional<LogLevel> Logger::ParseLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c){ return std::toupper(c); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

const char* Logger::LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

} // namespace tariffharvest::infrastructure
