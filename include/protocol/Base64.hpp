#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkwire {
namespace base64 {

// RFC 4648 standard alphabet, padded
std::string encode(const std::vector<uint8_t>& bytes);
std::string encode(const uint8_t* data, size_t size);

/**
 * Decode padded base64 text
 * @throws ProtocolError on a length that is not a multiple of 4, a character outside
 *         the alphabet, or padding anywhere but the tail
 */
std::vector<uint8_t> decode(const std::string& text);

// Length of encode() output for a payload of the given size
inline size_t encodedLength(size_t size) { return ((size + 2) / 3) * 4; }

} // namespace base64
} // namespace chunkwire
