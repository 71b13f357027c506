#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "server/ArtifactStore.hpp"

namespace chunkwire {

/**
 * Filesystem store. Partial uploads live in <base>/.partial/<name>.part and are
 * renamed onto <base>/<name> when finalized, so a finished file appears atomically.
 */
class FileStorage : public ArtifactStore {
public:
    explicit FileStorage(const std::string& basePath = "storage");

    void begin(const std::string& name) override;
    void append(const std::string& name, const std::vector<uint8_t>& bytes) override;
    void finalize(const std::string& name) override;
    void discard(const std::string& name) override;
    std::vector<std::string> listCompleted() const override;

    // Reads a finished file
    std::vector<uint8_t> readFile(const std::string& name) const;

    // Gets the full path for a finished file
    std::string getFullPath(const std::string& name) const;
    std::string getPartialPath(const std::string& name) const;

    // Ensures the storage directories exist
    void ensureStorageDirectory() const;

    static const char* partialDirName() { return ".partial"; }

private:
    std::filesystem::path basePath_;

    void checkName(const std::string& name) const;
};

} // namespace chunkwire
