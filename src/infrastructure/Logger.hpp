/**
 * @file Logger.hpp
 * @brief Thread-safe "[Component] message" logging to the console and an optional log file.
 *
 * Created once at the process boundary and handed to each service.
 */

#pragma once
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

namespace tariffharvest::infrastructure {

enum class LogLevel { Debug = 0, Info, Warning, Error };

class Logger {
public:
    /**
     * @param threshold Messages below this level are dropped.
     * @param filename Also append every line to this file when non-empty.
     */
    explicit Logger(LogLevel threshold = LogLevel::Info, const std::string& filename = "");

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message) { log(LogLevel::Debug, component, message); }
    void info(const std::string& component, const std::string& message) { log(LogLevel::Info, component, message); }
    void warning(const std::string& component, const std::string& message) { log(LogLevel::Warning, component, message); }
    void error(const std::string& component, const std::string& message) { log(LogLevel::Error, component, message); }

    LogLevel threshold() const { return m_threshold; }

    /** @brief "DEBUG", "INFO", "WARNING"/"WARN", "ERROR", case-insensitive. */
    static std::optional<LogLevel> ParseLevel(const std::string& name);
    static const char* LevelName(LogLevel level);

private:
    LogLevel m_threshold;
    std::ofstream m_file;
    std::mutex m_mutex;
};

} // namespace tariffharvest::infrastructure
