/**
 * @file FileArtifactStore.hpp
 * @brief Artifact store laid out as `<output_dir>/Tariff_<id>.xml`, written atomically.
 */

#pragma once
#include <filesystem>
#include <string>
#include "domain/ArtifactStore.hpp"

namespace tariffharvest::infrastructure {

/**
 * @class FileArtifactStore
 * @brief One file per identifier; the filename derives only from the identifier.
 *
 * Writes go to a unique temp file beside the target and are renamed into
 * place, so concurrent writers of the same identifier never leave a torn file.
 */
class FileArtifactStore : public domain::ArtifactStore {
public:
    /** @brief Creates the output directory if needed. Throws std::filesystem::filesystem_error. */
    explicit FileArtifactStore(const std::filesystem::path& outputDir);

    bool exists(domain::Identifier id) const override;
    void write(domain::Identifier id, const std::string& bytes) override;
    std::string locationOf(domain::Identifier id) const override;

    std::filesystem::path pathFor(domain::Identifier id) const;

    /**
     * @brief Removes `*.tmp` leftovers of an interrupted earlier run.
     * @return Number of files removed.
     */
    size_t sweepTemporaries();

private:
    std::filesystem::path m_outputDir;
};

} // namespace tariffharvest::infrastructure
