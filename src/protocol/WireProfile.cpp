#include "protocol/WireProfile.hpp"
#include "core/Error.hpp"
#include <algorithm>

namespace chunkwire {

const WireProfile& WireProfile::standard() {
    static const WireProfile profile{
        "standard", "filename", "data", "chunk", "total", "final", "true", "false"};
    return profile;
}

const WireProfile& WireProfile::compact() {
    static const WireProfile profile{
        "compact", "f", "d", "c", "t", "end", "1", "0"};
    return profile;
}

const WireProfile& WireProfile::byName(const std::string& name) {
    if (name == standard().name) return standard();
    if (name == compact().name) return compact();
    throw ProtocolError("Unknown wire profile: " + name);
}

bool WireProfile::matches(const url::QueryParams& params) const {
    auto has = [&params](const std::string& key) {
        return std::any_of(params.begin(), params.end(),
                           [&key](const auto& kv) { return kv.first == key; });
    };
    return has(filenameKey) && has(dataKey) && has(chunkKey) && has(totalKey) && has(finalKey);
}

} // namespace chunkwire
