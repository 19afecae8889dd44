#include "key_reader.hpp"
#include "key_identity.hpp"
#include "key_pack.hpp"
#include "yaml_io.hpp"
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

FileFormat parse_file_format(const std::string& name) {
    if (name == "yaml" || name == "yml") return FileFormat::Yaml;
    if (name == "msgpack" || name == "mp") return FileFormat::Msgpack;
    throw std::invalid_argument("unknown format '" + name + "' (must be yaml or msgpack)");
}

static void write_text(const std::string& text, const std::string& path) {
    std::ofstream f(path);
    if (!f) throw std::runtime_error("Cannot open file for writing: " + path);
    f << text;
    if (!f) throw std::runtime_error("Write error: " + path);
}

void save_public_key(const PublicKey& pk, const std::string& path, FileFormat fmt) {
    if (fmt == FileFormat::Yaml)
        write_text(emit_public_key_yaml(pk), path);
    else
        key_mp::write_file(key_mp::pack(pk), path);
}

void save_signature(const Signature& sig, const std::string& path, FileFormat fmt) {
    if (fmt == FileFormat::Yaml)
        write_text(emit_signature_yaml(sig), path);
    else
        key_mp::write_file(key_mp::pack(sig), path);
}

// ── Loading ───────────────────────────────────────────────────────────────────

static bool looks_like_yaml(const std::vector<uint8_t>& bytes, const std::string& path) {
    if (bytes.empty())
        throw std::runtime_error("File is empty: " + path);
    return bytes[0] == 0x2D;   // '-' of the "---" document marker
}

static void verify_fingerprint(const PublicKey& pk, const std::string& stored) {
    std::string derived = public_key_fingerprint(pk);
    if (stored != derived)
        throw std::runtime_error(
            "public key fingerprint mismatch: stored " + stored +
            " but derived " + derived + " from key bytes");
}

PublicKey load_public_key(const std::string& path) {
    std::vector<uint8_t> bytes = key_mp::read_file(path);

    std::string fingerprint;
    PublicKey pk = looks_like_yaml(bytes, path)
        ? parse_public_key_yaml(std::string(bytes.begin(), bytes.end()), &fingerprint)
        : key_mp::unpack_public_key(bytes, &fingerprint);

    verify_fingerprint(pk, fingerprint);
    return pk;
}

Signature load_signature(const std::string& path) {
    std::vector<uint8_t> bytes = key_mp::read_file(path);
    return looks_like_yaml(bytes, path)
        ? parse_signature_yaml(std::string(bytes.begin(), bytes.end()))
        : key_mp::unpack_signature(bytes);
}
