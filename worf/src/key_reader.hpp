#pragma once
#include "hybrid_key.hpp"
#include <string>

enum class FileFormat { Yaml, Msgpack };

FileFormat parse_file_format(const std::string& name);

void save_public_key(const PublicKey& pk, const std::string& path, FileFormat fmt);
void save_signature(const Signature& sig, const std::string& path, FileFormat fmt);

// Auto-detects YAML (first byte '-') or msgpack. A stored fingerprint that
// does not match the key bytes is rejected.
PublicKey load_public_key(const std::string& path);
Signature load_signature(const std::string& path);
