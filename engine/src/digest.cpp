#include "digest.hpp"
#include "hybrid_error.hpp"
#include <openssl/evp.h>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Sha256Digest sha256(const std::vector<std::vector<uint8_t>>& parts) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw HybridError(ErrorKind::CryptoFailure, "EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx);
        throw HybridError(ErrorKind::CryptoFailure, "SHA-256 init failed");
    }
    for (const auto& part : parts) {
        if (EVP_DigestUpdate(ctx, part.data(), part.size()) != 1) {
            EVP_MD_CTX_free(ctx);
            throw HybridError(ErrorKind::CryptoFailure, "SHA-256 update failed");
        }
    }

    Sha256Digest out{};
    unsigned int out_len = 0;
    int rc = EVP_DigestFinal_ex(ctx, out.data(), &out_len);
    EVP_MD_CTX_free(ctx);
    if (rc != 1 || out_len != out.size())
        throw HybridError(ErrorKind::CryptoFailure, "SHA-256 final failed");
    return out;
}

std::vector<uint8_t> label_bytes(const char* label) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(label);
    return std::vector<uint8_t>(p, p + std::strlen(label));
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i)
        oss << std::setw(2) << static_cast<int>(data[i]);
    return oss.str();
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::vector<uint8_t> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0)
        throw std::invalid_argument("hex string has odd length");

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_nibble(hex[i]);
        int lo = hex_nibble(hex[i + 1]);
        if (hi < 0 || lo < 0)
            throw std::invalid_argument("Invalid hex character");
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}
