#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "protocol/ChunkFrame.hpp"
#include "server/ArtifactStore.hpp"

namespace chunkwire {

struct UploadSession {
    uint32_t expectedNextIndex = 0;
    uint32_t total = 0;
    uint64_t bytesWritten = 0;
    bool complete = false;
};

enum class ReceiveStatus {
    Accepted,   // appended, more chunks expected
    Duplicate,  // already stored, nothing written
    Completed,  // final chunk appended and artifact published
    Rejected,
};

enum class RejectReason {
    None,
    OrderingViolation,
    Malformed,
    Storage,
};

const char* to_string(RejectReason reason);

struct ReceiveResult {
    ReceiveStatus status = ReceiveStatus::Rejected;
    RejectReason reason = RejectReason::None;
    uint32_t expected = 0;      // next index the session wants
    std::string message;

    bool ok() const { return status != ReceiveStatus::Rejected; }
};

/**
 * Server side state machine rebuilding files from in-order chunks.
 *
 * One session per filename, created by chunk 0 and finished by the final chunk.
 * Calls for the same filename are serialized; different filenames proceed in parallel.
 * An out-of-order chunk is rejected without touching the session, an already stored
 * chunk is acknowledged without writing it again.
 *
 * Per-filename state is dropped as soon as no session is left, only the totals of the
 * last completedHistory finished uploads are remembered for late final-chunk ACKs.
 */
class Reassembler {
public:
    explicit Reassembler(ArtifactStore& store, size_t completedHistory = 1024);

    ReceiveResult receiveChunk(const ChunkFrame& frame);
    ReceiveResult receiveChunk(const std::string& filename, uint32_t index, uint32_t total,
                               const std::vector<uint8_t>& payload, bool isFinal);

    // Drops an in-progress session and its partial artifact
    void abandon(const std::string& filename);

    std::optional<UploadSession> snapshot(const std::string& filename) const;
    size_t activeSessions() const;
    size_t trackedFilenames() const;
    size_t completedRecords() const;

    // Last path component of name; empty if nothing usable is left
    static std::string sanitizeFilename(const std::string& name);

private:
    struct Entry {
        std::mutex writer;
        std::optional<UploadSession> session;
    };

    ArtifactStore& store_;
    const size_t completedHistory_;
    mutable std::mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    std::unordered_map<std::string, uint32_t> completed_;   // filename -> total of last finished upload
    std::deque<std::string> completedOrder_;                // oldest first

    std::shared_ptr<Entry> entryFor(const std::string& filename);
    std::shared_ptr<Entry> findEntry(const std::string& filename) const;
    ReceiveResult apply(const std::string& name, const ChunkFrame& frame, Entry& entry);
    void releaseIfIdle(const std::string& filename, const std::shared_ptr<Entry>& entry);
    void recordCompleted(const std::string& filename, uint32_t total);
    void startSession(const std::string& filename, Entry& entry, uint32_t total);
    bool completedWithTotal(const std::string& filename, uint32_t total) const;
};

} // namespace chunkwire
