/**
 * @file Errors.hpp
 * @brief Failure taxonomy shared by the collection and export phases.
 *
 * FatalError aborts the run. Everything derived from TransientError is retried
 * by the orchestrating service and, once its budget is exhausted, degrades to a
 * recorded per-item or per-page failure.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace tariffharvest::domain {

/** @brief The run cannot start or continue at all (e.g. activation control unreachable). */
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief A failure that may succeed when the step is attempted again. */
class TransientError : public std::runtime_error {
public:
    explicit TransientError(const std::string& message) : std::runtime_error(message) {}
};

/** @brief An element reference was invalidated by an in-place content replacement. */
class StaleElementError : public TransientError {
public:
    explicit StaleElementError(const std::string& message) : TransientError(message) {}
};

/** @brief A bounded wait (grid ready, pager change) expired. */
class NavigationTimeout : public TransientError {
public:
    explicit NavigationTimeout(const std::string& message) : TransientError(message) {}
};

/**
 * @class ExportError
 * @brief Export request failed; status is 0 for transport errors.
 */
class ExportError : public TransientError {
public:
    ExportError(const std::string& message, int status)
        : TransientError(message), m_status(status) {}

    int status() const { return m_status; }

private:
    int m_status;
};

} // namespace tariffharvest::domain
