#include "base64.hpp"
#include <stdexcept>

static const char kTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::vector<uint8_t>& data) {
    const size_t len = data.size();
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t b = (uint32_t)data[i] << 16;
        if (i + 1 < len) b |= (uint32_t)data[i + 1] << 8;
        if (i + 2 < len) b |= (uint32_t)data[i + 2];

        out += kTable[(b >> 18) & 0x3F];
        out += kTable[(b >> 12) & 0x3F];
        out += (i + 1 < len) ? kTable[(b >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? kTable[(b >> 0) & 0x3F] : '=';
    }
    return out;
}

std::string base64_encode_wrapped(const std::vector<uint8_t>& data, size_t width) {
    std::string b64 = base64_encode(data);
    if (width == 0 || b64.size() <= width)
        return b64;

    std::string out;
    out.reserve(b64.size() + b64.size() / width);
    for (size_t i = 0; i < b64.size(); i += width) {
        if (i > 0) out += '\n';
        out += b64.substr(i, width);
    }
    return out;
}

static int decode_char(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    std::vector<uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t buf = 0;
    int bits = 0;

    for (unsigned char c : encoded) {
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ') continue;
        int val = decode_char(c);
        if (val < 0)
            throw std::invalid_argument("Invalid base64 character");
        buf = (buf << 6) | (uint32_t)val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((uint8_t)((buf >> bits) & 0xFF));
        }
    }
    return out;
}
