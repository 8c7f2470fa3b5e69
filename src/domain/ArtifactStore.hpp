/**
 * @file ArtifactStore.hpp
 * @brief Durable storage of export documents, one artifact per identifier.
 */

#pragma once
#include <string>
#include "domain/Identifier.hpp"

namespace tariffharvest::domain {

/**
 * @class ArtifactStore
 * @brief The presence of an identifier's artifact is the only "already done" marker.
 */
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    virtual bool exists(Identifier id) const = 0;

    /**
     * @brief Persists the bytes all-or-nothing. A reader never observes a truncated artifact.
     * @throws std::runtime_error when the artifact could not be placed.
     */
    virtual void write(Identifier id, const std::string& bytes) = 0;

    /** @brief Human-readable location used in log lines. */
    virtual std::string locationOf(Identifier id) const = 0;
};

} // namespace tariffharvest::domain
