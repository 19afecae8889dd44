#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using Sha256Digest = std::array<uint8_t, 32>;

// SHA-256 over the concatenation of parts (OpenSSL EVP).
Sha256Digest sha256(const std::vector<std::vector<uint8_t>>& parts);

std::vector<uint8_t> label_bytes(const char* label);

// Lowercase hex of data[0..len).
std::string hex_encode(const uint8_t* data, size_t len);

// Throws std::invalid_argument on odd length or non-hex characters.
std::vector<uint8_t> hex_decode(const std::string& hex);
