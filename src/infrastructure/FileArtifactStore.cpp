/**
 * @file FileArtifactStore.cpp
 * @brief Implementation of FileArtifactStore.
 */

#include "infrastructure/FileArtifactStore.hpp"
#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace tariffharvest::infrastructure {

namespace fs = std::filesystem;

FileArtifactStore::FileArtifactStore(const fs::path& outputDir)
    : m_outputDir(outputDir) {
    if (!fs::exists(m_outputDir)) {
        fs::create_directories(m_outputDir);
    }
}

fs::path FileArtifactStore::pathFor(domain::Identifier id) const {
    return m_outputDir / domain::IdentifierParser::ArtifactFilename(id);
}

bool FileArtifactStore::exists(domain::Identifier id) const {
    std::error_code ec;
    return fs::is_regular_file(pathFor(id), ec);
}

std::string FileArtifactStore::locationOf(domain::Identifier id) const {
    return pathFor(id).string();
}

void FileArtifactStore::write(domain::Identifier id, const std::string& bytes) {
    fs::path finalPath = pathFor(id);

    // Unique per writer: filename.<thread>.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto threadTag = std::hash<std::thread::id>{}(std::this_thread::get_id());
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(threadTag) + "." + std::to_string(timestamp) + ".tmp";

    if (!fs::exists(m_outputDir)) {
        fs::create_directories(m_outputDir);
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw std::runtime_error("failed to open temp file: " + tempPath.string());
        }
        ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("write failed: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw std::runtime_error("rename to " + finalPath.string() + " failed: " + ec.message());
    }
}

size_t FileArtifactStore::sweepTemporaries() {
    size_t removed = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(m_outputDir, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto name = entry.path().filename().string();
        if (name.rfind("Tariff_", 0) == 0 && entry.path().extension() == ".tmp") {
            std::error_code removeError;
            if (fs::remove(entry.path(), removeError)) {
                ++removed;
            } else if (removeError) {
                std::cerr << "[FileArtifactStore] Could not remove " << entry.path() << ": "
                          << removeError.message() << std::endl;
            }
        }
    }
    return removed;
}

} // namespace tariffharvest::infrastructure
