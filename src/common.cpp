#include "serverscore/common.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace serverscore {

namespace {

const char BASE64_STD[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

const char BASE64_URL[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789-_";

std::string encode_with(const byte* data, size_t len, const char* alphabet, bool pad) {
    std::string result;
    result.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        result += alphabet[(triple >> 18) & 0x3f];
        result += alphabet[(triple >> 12) & 0x3f];
        result += alphabet[(triple >> 6) & 0x3f];
        result += alphabet[triple & 0x3f];
    }

    size_t rest = len - i;
    if (rest > 0) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        if (rest == 2) {
            triple |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        result += alphabet[(triple >> 18) & 0x3f];
        result += alphabet[(triple >> 12) & 0x3f];
        if (rest == 2) {
            result += alphabet[(triple >> 6) & 0x3f];
        }
        if (pad) {
            result.append(3 - rest, '=');
        }
    }

    return result;
}

// Padding is only accepted as a trailing run of at most two '='
std::optional<bytes> decode_with(const std::string& encoded, const char* alphabet) {
    int lookup[256];
    for (int& v : lookup) v = -1;
    for (int k = 0; k < 64; ++k) {
        lookup[static_cast<unsigned char>(alphabet[k])] = k;
    }

    size_t end = encoded.find('=');
    if (end == std::string::npos) {
        end = encoded.size();
    } else if (encoded.size() - end > 2 ||
               encoded.find_first_not_of('=', end) != std::string::npos) {
        return std::nullopt;
    }
    // A single leftover symbol cannot carry a whole byte
    if (end % 4 == 1) {
        return std::nullopt;
    }

    bytes result;
    result.reserve(end * 3 / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < end; ++i) {
        int value = lookup[static_cast<unsigned char>(encoded[i])];
        if (value < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<byte>((buffer >> bits) & 0xff));
        }
    }

    return result;
}

} // namespace

std::string bytes_to_hex(const byte* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::optional<bytes> hex_to_bytes(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    bytes out;
    out.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<byte>((hi << 4) | lo));
    }
    return out;
}

std::string hash_to_hex(const Hash256& hash) {
    return bytes_to_hex(hash.data(), hash.size());
}

std::string base64_encode(const void* data, size_t len) {
    return encode_with(static_cast<const byte*>(data), len, BASE64_STD, true);
}

std::string base64_encode(const bytes& data) {
    return base64_encode(data.data(), data.size());
}

std::string base64url_encode(const bytes& data) {
    return encode_with(data.data(), data.size(), BASE64_URL, false);
}

std::optional<bytes> base64url_decode(const std::string& encoded) {
    return decode_with(encoded, BASE64_URL);
}

} // namespace serverscore
