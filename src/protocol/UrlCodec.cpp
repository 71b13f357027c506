#include "protocol/UrlCodec.hpp"
#include "core/Error.hpp"
#include <cctype>

namespace chunkwire {
namespace url {

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string percentEncode(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (isUnreserved(c)) {
            out += ch;
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

std::string percentDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= value.size()) {
                throw ProtocolError("Truncated percent escape in query");
            }
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) {
                throw ProtocolError("Invalid percent escape in query");
            }
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string encodeQuery(const QueryParams& params) {
    std::string out;
    for (const auto& kv : params) {
        if (!out.empty()) out += '&';
        out += percentEncode(kv.first);
        out += '=';
        out += percentEncode(kv.second);
    }
    return out;
}

QueryParams parseQuery(const std::string& query) {
    QueryParams params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        std::string token = query.substr(pos, (amp == std::string::npos ? query.size() : amp) - pos);
        pos = (amp == std::string::npos) ? query.size() + 1 : amp + 1;

        if (token.empty()) continue;

        auto eq = token.find('=');
        if (eq == std::string::npos) {
            params.emplace_back(percentDecode(token), "");
        } else {
            params.emplace_back(percentDecode(token.substr(0, eq)), percentDecode(token.substr(eq + 1)));
        }
    }
    return params;
}

std::pair<std::string, std::string> splitTarget(const std::string& target) {
    auto qm = target.find('?');
    if (qm == std::string::npos) {
        return {target, ""};
    }
    return {target.substr(0, qm), target.substr(qm + 1)};
}

} // namespace url
} // namespace chunkwire
