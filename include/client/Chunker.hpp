#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include "protocol/ChunkFrame.hpp"

namespace chunkwire {

/**
 * Lazy, order-preserving split of a file into fixed-size chunk frames.
 * Only the chunk returned by next() is held in memory. A zero-byte file yields a
 * single empty final chunk.
 */
class Chunker {
public:
    // Throws LocalIOError if the path is missing, not a regular file or unreadable
    Chunker(const std::string& path, size_t chunkSize);

    const std::string& filename() const { return filename_; }
    uint64_t fileSize() const { return fileSize_; }
    size_t chunkSize() const { return chunkSize_; }
    uint32_t total() const { return total_; }

    // Index of the chunk next() will return
    uint32_t position() const { return next_; }
    bool hasNext() const { return next_ < total_; }

    // Throws LocalIOError on a short read and std::out_of_range past the end
    ChunkFrame next();

    // Start over from chunk 0
    void rewind();

    static uint32_t chunkCount(uint64_t fileSize, size_t chunkSize);

private:
    std::string path_;
    std::string filename_;
    std::ifstream in_;
    uint64_t fileSize_ = 0;
    size_t chunkSize_;
    uint32_t total_ = 0;
    uint32_t next_ = 0;
};

} // namespace chunkwire
