#include "protocol/ChunkFrame.hpp"
#include "protocol/Base64.hpp"
#include "core/Error.hpp"
#include <limits>

namespace chunkwire {

namespace {

const std::string& requireField(const url::QueryParams& params, const std::string& key) {
    const std::string* found = nullptr;
    for (const auto& kv : params) {
        if (kv.first != key) continue;
        if (found) {
            throw ProtocolError("Duplicate field: " + key);
        }
        found = &kv.second;
    }
    if (!found) {
        throw ProtocolError("Missing field: " + key);
    }
    return *found;
}

uint32_t parseIndex(const std::string& key, const std::string& value) {
    if (value.empty() || value.size() > 10) {
        throw ProtocolError("Field " + key + " is not a valid number: '" + value + "'");
    }
    uint64_t n = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            throw ProtocolError("Field " + key + " is not a valid number: '" + value + "'");
        }
        n = n * 10 + static_cast<uint64_t>(c - '0');
    }
    if (n > std::numeric_limits<uint32_t>::max()) {
        throw ProtocolError("Field " + key + " is out of range: " + value);
    }
    return static_cast<uint32_t>(n);
}

} // namespace

std::string ChunkFrame::violation() const {
    if (filename.empty()) {
        return "filename is empty";
    }
    if (total == 0) {
        return "total must be at least 1";
    }
    if (index >= total) {
        return "chunk index " + std::to_string(index) + " is not below total " + std::to_string(total);
    }
    if (isFinal != (index == total - 1)) {
        return "final flag does not match chunk " + std::to_string(index) + " of " + std::to_string(total);
    }
    return "";
}

url::QueryParams ChunkFrame::toQuery(const WireProfile& profile) const {
    return {
        {profile.filenameKey, filename},
        {profile.dataKey, base64::encode(payload)},
        {profile.chunkKey, std::to_string(index)},
        {profile.totalKey, std::to_string(total)},
        {profile.finalKey, isFinal ? profile.finalTrue : profile.finalFalse},
    };
}

ChunkFrame ChunkFrame::fromQuery(const url::QueryParams& params, const WireProfile& profile) {
    ChunkFrame frame;
    frame.filename = requireField(params, profile.filenameKey);
    frame.payload = base64::decode(requireField(params, profile.dataKey));
    frame.index = parseIndex(profile.chunkKey, requireField(params, profile.chunkKey));
    frame.total = parseIndex(profile.totalKey, requireField(params, profile.totalKey));

    const std::string& flag = requireField(params, profile.finalKey);
    if (flag == profile.finalTrue) {
        frame.isFinal = true;
    } else if (flag == profile.finalFalse) {
        frame.isFinal = false;
    } else {
        throw ProtocolError("Field " + profile.finalKey + " must be '" + profile.finalTrue +
                            "' or '" + profile.finalFalse + "', got '" + flag + "'");
    }

    std::string problem = frame.violation();
    if (!problem.empty()) {
        throw ProtocolError(problem);
    }
    return frame;
}

} // namespace chunkwire
