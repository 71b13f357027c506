#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkwire {

/**
 * Persistence used by the reassembler. A name moves through
 * begin -> append* -> finalize, or is dropped with discard.
 * Nothing is visible under the final name before finalize.
 *
 * Failures throw StorageError. Names the store cannot hold throw std::invalid_argument.
 */
class ArtifactStore {
public:
    virtual ~ArtifactStore() = default;

    // Create an empty partial artifact, replacing any earlier partial one
    virtual void begin(const std::string& name) = 0;
    virtual void append(const std::string& name, const std::vector<uint8_t>& bytes) = 0;
    // Publish the partial artifact under its final name
    virtual void finalize(const std::string& name) = 0;
    virtual void discard(const std::string& name) = 0;

    virtual std::vector<std::string> listCompleted() const = 0;
};

} // namespace chunkwire
