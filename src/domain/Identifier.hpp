/**
 * @file Identifier.hpp
 * @brief Record identifiers scraped from the tariff grid's export links.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tariffharvest::domain {

/** @brief Positive numeric token taken from a `tid=<digits>` link target. */
using Identifier = std::uint64_t;

/** @brief Ordered, deduplicated identifiers gathered during collection. */
using IdentifierSet = std::set<Identifier>;

/**
 * @class IdentifierParser
 * @brief Static helpers for reading identifiers out of link targets and deriving names from them.
 */
class IdentifierParser {
public:
    /**
     * @brief Parses the first `tid=<digits>` occurrence in a link target.
     * @return The identifier, or nullopt when absent, zero or out of range.
     */
    static std::optional<Identifier> FromLinkTarget(const std::string& target);

    /** @brief Collects every identifier found in the given targets. */
    static IdentifierSet FromLinkTargets(const std::vector<std::string>& targets);

    /** @brief Parses a comma separated list such as "100,101,102". Throws std::invalid_argument. */
    static IdentifierSet FromList(const std::string& list);

    /** @brief `Tariff_<id>.xml` */
    static std::string ArtifactFilename(Identifier id);

    /** @brief Replaces every `{tid}` placeholder in the template with the identifier. */
    static std::string ExpandTemplate(const std::string& urlTemplate, Identifier id);
};

} // namespace tariffharvest::domain
