#include "protocol/Base64.hpp"
#include "core/Error.hpp"

namespace chunkwire {
namespace base64 {

namespace {

const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int valueOf(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string encode(const std::vector<uint8_t>& bytes) {
    return encode(bytes.data(), bytes.size());
}

std::string encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(encodedLength(size));

    size_t i = 0;
    for (; i + 3 <= size; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    size_t rest = size - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::vector<uint8_t> decode(const std::string& text) {
    std::vector<uint8_t> out;
    if (text.empty()) {
        return out;
    }
    if (text.size() % 4 != 0) {
        throw ProtocolError("base64 length " + std::to_string(text.size()) + " is not a multiple of 4");
    }

    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        bool last = (i + 4 == text.size());
        uint32_t n = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = text[i + k];
            int v;
            if (c == '=' && last && k >= 4 - padding) {
                v = 0;
            } else {
                v = valueOf(c);
                if (v < 0) {
                    throw ProtocolError("Invalid base64 character at offset " + std::to_string(i + k));
                }
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (!last || padding < 2) out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (!last || padding < 1) out.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return out;
}

} // namespace base64
} // namespace chunkwire
