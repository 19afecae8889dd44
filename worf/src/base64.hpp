#pragma once
#include <string>
#include <vector>
#include <cstdint>

std::string base64_encode(const std::vector<uint8_t>& data);

// Encoded form split into lines of `width` chars joined by '\n', with no
// trailing newline.
std::string base64_encode_wrapped(const std::vector<uint8_t>& data, size_t width);

// Skips embedded whitespace. Throws std::invalid_argument on other
// characters outside the standard alphabet.
std::vector<uint8_t> base64_decode(const std::string& encoded);
