#include "client/Sender.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chunkwire {

using json = nlohmann::json;

const char* to_string(ChunkState state) {
    switch (state) {
        case ChunkState::Pending: return "PENDING";
        case ChunkState::InFlight: return "IN_FLIGHT";
        case ChunkState::Acked: return "ACKED";
        case ChunkState::Failed: return "FAILED";
        case ChunkState::Aborted: return "ABORTED";
        default: return "UNKNOWN";
    }
}

Sender::Sender(const ClientConfig& config, Transport& transport)
    : config_(config),
      transport_(transport),
      wire_(WireProfile::byName(config.wireProfile)),
      progress_(&Sender::printProgress),
      cancel_(&neverCancelled_) {
    config_.validate();
}

std::string Sender::uploadUrl(const ChunkFrame& chunk) const {
    std::string base = config_.serverUrl;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/upload?" + url::encodeQuery(chunk.toQuery(wire_));
}

std::chrono::milliseconds Sender::retryDelayFor(unsigned failedAttempt) const {
    if (failedAttempt == 0) failedAttempt = 1;
    double factor = std::pow(config_.backoffMultiplier, static_cast<double>(failedAttempt - 1));
    double delay = static_cast<double>(config_.retryDelay.count()) * factor;
    double cap = static_cast<double>(config_.maxRetryDelay.count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(delay, cap)));
}

SendOutcome Sender::classify(const TransportResponse& response) {
    SendOutcome outcome;
    outcome.status = response.status;

    if (!response.delivered) {
        outcome.kind = ErrorKind::Transient;
        outcome.message = response.timedOut ? "timeout: " + response.error : response.error;
        return outcome;
    }

    json body;
    bool isJson = true;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error&) {
        isJson = false;
    }
    if (isJson && body.is_object() && body.contains("message") && body["message"].is_string()) {
        outcome.message = body["message"].get<std::string>();
    }

    long status = response.status;
    if (status >= 200 && status < 300) {
        if (!isJson) {
            std::cerr << "[sender] Non-JSON response body, treating as success" << std::endl;
        }
        outcome.kind = ErrorKind::None;
        return outcome;
    }

    if (outcome.message.empty()) {
        outcome.message = "HTTP " + std::to_string(status) + ": " + response.body.substr(0, 200);
    }

    if (status >= 500 || status == 408 || status == 429) {
        outcome.kind = ErrorKind::Transient;
    } else if (status == 409 && isJson && body.is_object() &&
               body.value("error", std::string()) == "ordering_violation" &&
               body.contains("expected") && body["expected"].is_number_unsigned()) {
        outcome.kind = ErrorKind::OrderingViolation;
        outcome.expected = body["expected"].get<uint32_t>();
    } else {
        outcome.kind = ErrorKind::Permanent;
    }
    return outcome;
}

SendOutcome Sender::sendChunk(const ChunkFrame& chunk, unsigned attempt) {
    RequestOptions options;
    options.timeout = config_.requestTimeout;
    options.closeConnection = config_.closeConnection;

    SendOutcome outcome;
    try {
        outcome = classify(transport_.get(uploadUrl(chunk), options));
    } catch (const std::exception& e) {
        outcome.kind = ErrorKind::Transient;
        outcome.message = std::string("Unexpected transport error: ") + e.what();
    }
    outcome.attempts = attempt;

    // The server already holds this chunk and wants the next one: our ACK got lost
    if (outcome.kind == ErrorKind::OrderingViolation && outcome.expected == chunk.index + 1) {
        std::cout << "[sender] Chunk " << chunk.index + 1 << " already stored on server" << std::endl;
        outcome.kind = ErrorKind::None;
    }
    return outcome;
}

SendOutcome Sender::deliver(const ChunkFrame& chunk) {
    ChunkState state = ChunkState::Pending;
    SendOutcome outcome;

    for (unsigned attempt = 1; attempt <= config_.maxRetries; ++attempt) {
        if (state == ChunkState::Failed) {
            auto delay = retryDelayFor(attempt - 1);
            std::cout << "[sender] Retrying chunk " << chunk.index + 1 << "/" << chunk.total
                      << " in " << delay.count() << " ms (attempt " << attempt << "/"
                      << config_.maxRetries << ")" << std::endl;
            if (cancel_->waitFor(delay)) {
                outcome.kind = ErrorKind::Cancelled;
                outcome.message = "Cancelled while waiting to retry";
                return outcome;
            }
        }

        state = ChunkState::InFlight;
        outcome = sendChunk(chunk, attempt);

        if (outcome.acked()) {
            state = ChunkState::Acked;
            return outcome;
        }

        state = ChunkState::Failed;
        std::cerr << "[sender] Chunk " << chunk.index + 1 << "/" << chunk.total << " "
                  << to_string(state) << " (" << to_string(outcome.kind) << "): "
                  << outcome.message << std::endl;

        if (outcome.kind != ErrorKind::Transient) {
            break;
        }
    }

    state = ChunkState::Aborted;
    std::cerr << "[sender] Chunk " << chunk.index + 1 << "/" << chunk.total << " "
              << to_string(state) << " after " << outcome.attempts << " attempt(s)" << std::endl;
    return outcome;
}

TransferResult Sender::upload(const std::string& path) {
    auto start = std::chrono::steady_clock::now();
    TransferResult result;

    auto finish = [&result, start]() -> TransferResult {
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    };

    try {
        Chunker chunker(path, config_.chunkSize);
        result.filename = chunker.filename();
        result.chunksTotal = chunker.total();

        std::cout << "[sender] Uploading " << chunker.filename() << " (" << chunker.fileSize()
                  << " bytes, " << chunker.total() << " chunks of " << chunker.chunkSize()
                  << ")" << std::endl;

        while (chunker.hasNext()) {
            if (cancel_->cancelled()) {
                result.errorKind = ErrorKind::Cancelled;
                result.error = "Upload cancelled after " + std::to_string(result.chunksSent) + " chunks";
                std::cerr << "[sender] " << result.error << std::endl;
                return finish();
            }

            ChunkFrame chunk = chunker.next();
            SendOutcome outcome = deliver(chunk);
            if (!outcome.acked()) {
                result.errorKind = outcome.kind;
                result.error = "Chunk " + std::to_string(chunk.index + 1) + "/" +
                               std::to_string(chunk.total) + " failed: " + outcome.message;
                return finish();
            }

            ++result.chunksSent;
            if (progress_) {
                ChunkProgress progress;
                progress.filename = result.filename;
                progress.chunksSent = result.chunksSent;
                progress.chunksTotal = result.chunksTotal;
                progress.percent = 100.0 * result.chunksSent / result.chunksTotal;
                progress.message = outcome.message;
                progress_(progress);
            }
        }
    } catch (const LocalIOError& e) {
        std::cerr << "[sender] " << e.what() << std::endl;
        result.errorKind = ErrorKind::LocalIO;
        result.error = e.what();
        return finish();
    }

    result.success = true;
    return finish();
}

void Sender::printProgress(const ChunkProgress& progress) {
    std::ostringstream line;
    line << "Sent chunk " << progress.chunksSent << "/" << progress.chunksTotal << " ("
         << std::fixed << std::setprecision(1) << progress.percent << "%)";
    std::cout << line.str() << std::endl;
    if (!progress.message.empty()) {
        std::cout << "   " << progress.message << std::endl;
    }
}

} // namespace chunkwire
