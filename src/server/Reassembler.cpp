#include "server/Reassembler.hpp"
#include "core/Error.hpp"
#include <iostream>
#include <stdexcept>

namespace chunkwire {

namespace {

ReceiveResult reject(RejectReason reason, uint32_t expected, const std::string& message) {
    ReceiveResult result;
    result.status = ReceiveStatus::Rejected;
    result.reason = reason;
    result.expected = expected;
    result.message = message;
    return result;
}

ReceiveResult acknowledge(ReceiveStatus status, uint32_t expected, const std::string& message) {
    ReceiveResult result;
    result.status = status;
    result.expected = expected;
    result.message = message;
    return result;
}

std::string position(uint32_t index, uint32_t total) {
    return std::to_string(index + 1) + "/" + std::to_string(total);
}

} // namespace

const char* to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::None: return "none";
        case RejectReason::OrderingViolation: return "ordering_violation";
        case RejectReason::Malformed: return "malformed";
        case RejectReason::Storage: return "storage";
        default: return "unknown";
    }
}

Reassembler::Reassembler(ArtifactStore& store, size_t completedHistory)
    : store_(store), completedHistory_(completedHistory) {}

std::string Reassembler::sanitizeFilename(const std::string& name) {
    std::string result = name;
    size_t lastSlash = result.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        result = result.substr(lastSlash + 1);
    }
    if (result == "." || result == ".." || result.find('\0') != std::string::npos) {
        return "";
    }
    return result;
}

std::shared_ptr<Reassembler::Entry> Reassembler::entryFor(const std::string& filename) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto& entry = entries_[filename];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

std::shared_ptr<Reassembler::Entry> Reassembler::findEntry(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = entries_.find(filename);
    return it == entries_.end() ? nullptr : it->second;
}

void Reassembler::releaseIfIdle(const std::string& filename, const std::shared_ptr<Entry>& entry) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = entries_.find(filename);
    if (it == entries_.end() || it->second != entry) return;
    // The table and the caller hold the only references, so no writer can be inside
    if (entry.use_count() == 2 && !entry->session) {
        entries_.erase(it);
    }
}

void Reassembler::recordCompleted(const std::string& filename, uint32_t total) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto inserted = completed_.insert({filename, total});
    if (!inserted.second) {
        inserted.first->second = total;
        return;
    }
    completedOrder_.push_back(filename);
    while (completedOrder_.size() > completedHistory_) {
        completed_.erase(completedOrder_.front());
        completedOrder_.pop_front();
    }
}

bool Reassembler::completedWithTotal(const std::string& filename, uint32_t total) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = completed_.find(filename);
    return it != completed_.end() && it->second == total;
}

void Reassembler::startSession(const std::string& filename, Entry& entry, uint32_t total) {
    store_.begin(filename);
    UploadSession session;
    session.total = total;
    entry.session = session;
    std::cout << "[reassembler] New upload: " << filename << " (" << total << " chunks)" << std::endl;
}

ReceiveResult Reassembler::receiveChunk(const std::string& filename, uint32_t index, uint32_t total,
                                        const std::vector<uint8_t>& payload, bool isFinal) {
    ChunkFrame frame;
    frame.filename = filename;
    frame.index = index;
    frame.total = total;
    frame.payload = payload;
    frame.isFinal = isFinal;
    return receiveChunk(frame);
}

ReceiveResult Reassembler::receiveChunk(const ChunkFrame& frame) {
    std::string name = sanitizeFilename(frame.filename);
    if (name.empty()) {
        return reject(RejectReason::Malformed, 0, "Invalid filename: '" + frame.filename + "'");
    }
    std::string problem = frame.violation();
    if (!problem.empty()) {
        return reject(RejectReason::Malformed, 0, problem);
    }

    auto entry = entryFor(name);
    ReceiveResult result;
    {
        std::lock_guard<std::mutex> writer(entry->writer);
        result = apply(name, frame, *entry);
    }
    releaseIfIdle(name, entry);
    return result;
}

ReceiveResult Reassembler::apply(const std::string& name, const ChunkFrame& frame, Entry& entry) {
    auto& session = entry.session;

    try {
        if (!session) {
            if (frame.index != 0) {
                if (frame.isFinal && completedWithTotal(name, frame.total)) {
                    return acknowledge(ReceiveStatus::Duplicate, 0,
                                       "Chunk " + position(frame.index, frame.total) + " already received, " + name + " complete");
                }
                std::cerr << "[reassembler] Out of order chunk " << position(frame.index, frame.total)
                          << " for " << name << ", no upload in progress" << std::endl;
                return reject(RejectReason::OrderingViolation, 0,
                              "Expected chunk 0 to start " + name + ", got " + std::to_string(frame.index));
            }
            startSession(name, entry, frame.total);
        } else if (frame.index == 0 && session->total != frame.total) {
            // Chunk 0 of a differently sized file: the sender started over
            std::cout << "[reassembler] Restarting upload of " << name << " (had "
                      << session->expectedNextIndex << "/" << session->total << ")" << std::endl;
            session.reset();
            startSession(name, entry, frame.total);
        } else if (frame.total != session->total) {
            return reject(RejectReason::Malformed, session->expectedNextIndex,
                          "Total " + std::to_string(frame.total) + " does not match upload of " +
                          std::to_string(session->total) + " chunks");
        } else if (frame.index < session->expectedNextIndex) {
            return acknowledge(ReceiveStatus::Duplicate, session->expectedNextIndex,
                               "Chunk " + position(frame.index, frame.total) + " already received");
        } else if (frame.index > session->expectedNextIndex) {
            std::cerr << "[reassembler] Out of order chunk " << position(frame.index, frame.total)
                      << " for " << name << ", expected index " << session->expectedNextIndex << std::endl;
            return reject(RejectReason::OrderingViolation, session->expectedNextIndex,
                          "Expected chunk " + std::to_string(session->expectedNextIndex) +
                          ", got " + std::to_string(frame.index));
        }

        store_.append(name, frame.payload);
        session->bytesWritten += frame.payload.size();
        ++session->expectedNextIndex;

        if (!frame.isFinal) {
            return acknowledge(ReceiveStatus::Accepted, session->expectedNextIndex,
                               "Chunk " + position(frame.index, frame.total) + " received");
        }

        store_.finalize(name);
        session->complete = true;
        std::cout << "[reassembler] Completed " << name << " (" << session->bytesWritten
                  << " bytes)" << std::endl;
        recordCompleted(name, session->total);
        session.reset();
        return acknowledge(ReceiveStatus::Completed, frame.total,
                           "Chunk " + position(frame.index, frame.total) + " received, " + name + " complete");
    } catch (const std::invalid_argument& e) {
        session.reset();
        return reject(RejectReason::Malformed, 0, e.what());
    } catch (const StorageError& e) {
        std::cerr << "[reassembler] Storage failure for " << name << ": " << e.what() << std::endl;
        session.reset();
        try {
            store_.discard(name);
        } catch (const StorageError& cleanup) {
            std::cerr << "[reassembler] Could not remove partial " << name << ": " << cleanup.what() << std::endl;
        }
        return reject(RejectReason::Storage, 0, e.what());
    }
}

void Reassembler::abandon(const std::string& filename) {
    std::string name = sanitizeFilename(filename);
    auto entry = findEntry(name);
    if (!entry) return;

    {
        std::lock_guard<std::mutex> writer(entry->writer);
        if (entry->session) {
            entry->session.reset();
            store_.discard(name);
            std::cout << "[reassembler] Abandoned upload of " << name << std::endl;
        }
    }
    releaseIfIdle(name, entry);
}

std::optional<UploadSession> Reassembler::snapshot(const std::string& filename) const {
    auto entry = findEntry(sanitizeFilename(filename));
    if (!entry) return std::nullopt;
    std::lock_guard<std::mutex> writer(entry->writer);
    return entry->session;
}

size_t Reassembler::activeSessions() const {
    std::vector<std::shared_ptr<Entry>> all;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (const auto& kv : entries_) all.push_back(kv.second);
    }
    size_t count = 0;
    for (const auto& entry : all) {
        std::lock_guard<std::mutex> writer(entry->writer);
        if (entry->session) ++count;
    }
    return count;
}

size_t Reassembler::trackedFilenames() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return entries_.size();
}

size_t Reassembler::completedRecords() const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    return completed_.size();
}

} // namespace chunkwire
