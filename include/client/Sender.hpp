#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include "client/Chunker.hpp"
#include "client/Transport.hpp"
#include "core/CancelToken.hpp"
#include "core/Config.hpp"
#include "core/Error.hpp"
#include "protocol/ChunkFrame.hpp"

namespace chunkwire {

// Per-chunk delivery state. Failed goes back to InFlight while attempts remain.
enum class ChunkState {
    Pending,
    InFlight,
    Acked,
    Failed,
    Aborted,
};

const char* to_string(ChunkState state);

/**
 * Outcome of a single request, or of a chunk's whole retry sequence.
 */
struct SendOutcome {
    ErrorKind kind = ErrorKind::None;
    long status = 0;            // HTTP status, 0 if nothing came back
    uint32_t expected = 0;      // server's next expected index on OrderingViolation
    unsigned attempts = 0;
    std::string message;        // server "message" on success, diagnostic otherwise

    bool acked() const { return kind == ErrorKind::None; }
};

struct TransferResult {
    std::string filename;
    uint32_t chunksSent = 0;
    uint32_t chunksTotal = 0;
    bool success = false;
    std::chrono::milliseconds elapsed{0};
    ErrorKind errorKind = ErrorKind::None;
    std::string error;
};

struct ChunkProgress {
    std::string filename;
    uint32_t chunksSent = 0;
    uint32_t chunksTotal = 0;
    double percent = 0.0;
    std::string message;
};

/**
 * Drives a file's chunks through the transport one at a time, in index order.
 * A chunk gets up to config.maxRetries attempts; transient failures are retried with
 * exponential backoff, permanent failures and ordering violations abort at once.
 */
class Sender {
public:
    using ProgressCallback = std::function<void(const ChunkProgress&)>;

    Sender(const ClientConfig& config, Transport& transport);

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    // Called after every acknowledged chunk; defaults to printing a progress line
    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    // Checked between chunks and during retry delays; the token must outlive the sender
    void setCancelToken(const CancelToken* token) { cancel_ = token ? token : &neverCancelled_; }

    // Exactly one request for one chunk
    SendOutcome sendChunk(const ChunkFrame& chunk, unsigned attempt);

    TransferResult upload(const std::string& path);

    // Delay to wait after the given failed attempt (1-based)
    std::chrono::milliseconds retryDelayFor(unsigned failedAttempt) const;

    std::string uploadUrl(const ChunkFrame& chunk) const;

    // Maps a transport response onto the error taxonomy
    static SendOutcome classify(const TransportResponse& response);

    static void printProgress(const ChunkProgress& progress);

private:
    ClientConfig config_;
    Transport& transport_;
    const WireProfile& wire_;
    ProgressCallback progress_;
    CancelToken neverCancelled_;
    const CancelToken* cancel_;

    SendOutcome deliver(const ChunkFrame& chunk);
};

} // namespace chunkwire
