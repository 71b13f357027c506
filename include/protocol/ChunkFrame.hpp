#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "protocol/UrlCodec.hpp"
#include "protocol/WireProfile.hpp"

namespace chunkwire {

/**
 * One fragment of a file together with its position in the upload.
 * Invariants: index < total, isFinal == (index == total - 1).
 */
struct ChunkFrame {
    std::string filename;
    uint32_t index = 0;
    uint32_t total = 0;
    std::vector<uint8_t> payload;
    bool isFinal = false;

    // Empty string when the invariants hold, otherwise a description of the first violation
    std::string violation() const;
    bool valid() const { return violation().empty(); }

    // Ordered query parameters with base64 payload, using the profile's field names
    url::QueryParams toQuery(const WireProfile& profile) const;

    /**
     * Rebuild a frame from decoded query parameters
     * @throws ProtocolError if a field is missing or duplicated, a number or the final
     *         flag is malformed, the payload is not base64, or the invariants fail
     */
    static ChunkFrame fromQuery(const url::QueryParams& params, const WireProfile& profile);
};

} // namespace chunkwire
