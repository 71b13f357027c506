#pragma once

#include <string>
#include <utility>
#include <vector>

namespace chunkwire {
namespace url {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Percent-encodes every byte outside the RFC 3986 unreserved set
std::string percentEncode(const std::string& value);

// Decodes %XX escapes; '+' becomes a space. Throws ProtocolError on a broken escape.
std::string percentDecode(const std::string& value);

// "k1=v1&k2=v2" with both sides percent-encoded, in the given order
std::string encodeQuery(const QueryParams& params);

// Splits a query string (without the leading '?'); a key without '=' maps to ""
QueryParams parseQuery(const std::string& query);

// Splits "/path?query" into its two halves; query is empty when there is no '?'
std::pair<std::string, std::string> splitTarget(const std::string& target);

} // namespace url
} // namespace chunkwire
