#pragma once

#include <string>
#include "protocol/UrlCodec.hpp"

namespace chunkwire {

/**
 * Field names and final-flag spelling used to put a chunk frame on the wire.
 * The set in use is declared by configuration on both ends, never guessed from
 * a single field.
 */
struct WireProfile {
    std::string name;
    std::string filenameKey;
    std::string dataKey;
    std::string chunkKey;
    std::string totalKey;
    std::string finalKey;
    std::string finalTrue;
    std::string finalFalse;

    // filename, data, chunk, total, final = "true"/"false"
    static const WireProfile& standard();
    // f, d, c, t, end = "1"/"0"
    static const WireProfile& compact();

    // Throws ProtocolError for an unknown name
    static const WireProfile& byName(const std::string& name);

    // True when every field of this profile is present in params
    bool matches(const url::QueryParams& params) const;
};

} // namespace chunkwire
