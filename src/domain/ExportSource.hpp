/**
 * @file ExportSource.hpp
 * @brief Interface for anything able to produce the export document of one identifier.
 */

#pragma once
#include <string>
#include "domain/Identifier.hpp"

namespace tariffharvest::domain {

class ExportSource {
public:
    virtual ~ExportSource() = default;

    /**
     * @brief Single best-effort attempt; no internal retry.
     * @return The response body verbatim.
     * @throws TransientError (usually ExportError) on failure.
     */
    virtual std::string fetch(Identifier id) = 0;
};

} // namespace tariffharvest::domain
