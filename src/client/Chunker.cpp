#include "client/Chunker.hpp"
#include "core/Error.hpp"
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace chunkwire {

namespace fs = std::filesystem;

Chunker::Chunker(const std::string& path, size_t chunkSize)
    : path_(path), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    std::error_code ec;
    fs::file_status status = fs::status(path_, ec);
    if (ec || !fs::exists(status)) {
        throw LocalIOError("File not found: " + path_);
    }
    if (!fs::is_regular_file(status)) {
        throw LocalIOError("Not a regular file: " + path_);
    }

    fileSize_ = fs::file_size(path_, ec);
    if (ec) {
        throw LocalIOError("Cannot stat " + path_ + ": " + ec.message());
    }

    in_.open(path_, std::ios::binary);
    if (!in_) {
        throw LocalIOError("Cannot open " + path_ + " (" + std::strerror(errno) + ")");
    }

    filename_ = fs::path(path_).filename().string();
    total_ = chunkCount(fileSize_, chunkSize_);
}

uint32_t Chunker::chunkCount(uint64_t fileSize, size_t chunkSize) {
    if (fileSize == 0) {
        return 1;
    }
    uint64_t count = (fileSize + chunkSize - 1) / chunkSize;
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw LocalIOError("File too large for chunk size " + std::to_string(chunkSize));
    }
    return static_cast<uint32_t>(count);
}

ChunkFrame Chunker::next() {
    if (!hasNext()) {
        throw std::out_of_range("No chunks left in " + filename_);
    }

    uint64_t offset = static_cast<uint64_t>(next_) * chunkSize_;
    uint64_t remaining = fileSize_ - std::min<uint64_t>(offset, fileSize_);
    size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, chunkSize_));

    ChunkFrame frame;
    frame.filename = filename_;
    frame.index = next_;
    frame.total = total_;
    frame.isFinal = (next_ == total_ - 1);
    frame.payload.resize(want);

    if (want > 0) {
        in_.read(reinterpret_cast<char*>(frame.payload.data()), static_cast<std::streamsize>(want));
        if (static_cast<size_t>(in_.gcount()) != want) {
            throw LocalIOError("Short read in " + path_ + " at chunk " + std::to_string(next_) +
                               ": expected " + std::to_string(want) + " bytes, got " +
                               std::to_string(in_.gcount()));
        }
    }

    ++next_;
    return frame;
}

void Chunker::rewind() {
    in_.clear();
    in_.seekg(0, std::ios::beg);
    if (!in_) {
        throw LocalIOError("Cannot rewind " + path_);
    }
    next_ = 0;
}

} // namespace chunkwire
