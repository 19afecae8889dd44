#include "yaml_io.hpp"
#include "algorithm_policy.hpp"
#include "base64.hpp"
#include "key_identity.hpp"
#include <yaml-cpp/yaml.h>
#include <stdexcept>
#include <string>

static constexpr int kFormatVersion = 1;

// ── Emission ──────────────────────────────────────────────────────────────────

// Base64 wrapped at 64 chars. Multi-line values carry no trailing '\n', which
// makes yaml-cpp emit '|-' (strip) instead of '|' (clip).
static void emit_b64_key(YAML::Emitter& out, const char* key,
                         const std::vector<uint8_t>& data)
{
    std::string val = base64_encode_wrapped(data, 64);
    out << YAML::Key << key << YAML::Value;
    if (val.find('\n') != std::string::npos)
        out << YAML::Literal;
    out << val;
}

static void emit_header(YAML::Emitter& out, const char* type, AlgorithmVersion alg) {
    out << YAML::Key << "version"   << YAML::Value << kFormatVersion;
    out << YAML::Key << "type"      << YAML::Value << type;
    out << YAML::Key << "algorithm" << YAML::Value << algorithm_name(alg);
}

static void emit_provenance(YAML::Emitter& out, uint64_t created_at, uint64_t operation_id) {
    out << YAML::Key << "created"      << YAML::Value << static_cast<unsigned long long>(created_at);
    out << YAML::Key << "operation-id" << YAML::Value << static_cast<unsigned long long>(operation_id);
}

std::string emit_public_key_yaml(const PublicKey& pk) {
    YAML::Emitter out;
    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    emit_header(out, "public-key", pk.algorithm);
    out << YAML::Key << "fingerprint" << YAML::Value << public_key_fingerprint(pk);
    emit_provenance(out, pk.created_at, pk.operation_id);
    emit_b64_key(out, "bytes", pk.bytes);

    out << YAML::EndMap;
    out << YAML::EndDoc;
    return std::string(out.c_str()) + "\n";
}

std::string emit_signature_yaml(const Signature& sig) {
    YAML::Emitter out;
    out << YAML::BeginDoc;
    out << YAML::BeginMap;

    emit_header(out, "signature", sig.algorithm);
    out << YAML::Key << "signer" << YAML::Value << sig.signer_key_id;
    emit_provenance(out, sig.created_at, sig.operation_id);
    emit_b64_key(out, "bytes", sig.bytes);

    out << YAML::EndMap;
    out << YAML::EndDoc;
    return std::string(out.c_str()) + "\n";
}

// ── Parsing ───────────────────────────────────────────────────────────────────

static YAML::Node load_typed(const std::string& text, const char* expected_type) {
    YAML::Node doc = YAML::Load(text);
    if (!doc.IsMap())
        throw std::runtime_error("YAML: document must be a map");

    std::string doc_type = doc["type"].as<std::string>("");
    if (doc_type != expected_type)
        throw std::runtime_error(std::string("YAML: 'type' field must be '") + expected_type +
                                 "' (got '" + doc_type + "')");

    int version = doc["version"].as<int>(0);
    if (version != kFormatVersion)
        throw std::runtime_error("YAML: unsupported version " + std::to_string(version));

    for (const char* field : {"algorithm", "created", "operation-id", "bytes"}) {
        if (!doc[field])
            throw std::runtime_error(std::string("YAML: missing '") + field + "'");
    }
    return doc;
}

PublicKey parse_public_key_yaml(const std::string& text, std::string* fingerprint_out) {
    YAML::Node doc = load_typed(text, "public-key");

    PublicKey pk;
    pk.algorithm    = parse_algorithm(doc["algorithm"].as<std::string>());
    pk.created_at   = doc["created"].as<uint64_t>();
    pk.operation_id = doc["operation-id"].as<uint64_t>();
    pk.bytes        = base64_decode(doc["bytes"].as<std::string>());
    if (fingerprint_out)
        *fingerprint_out = doc["fingerprint"].as<std::string>("");
    return pk;
}

Signature parse_signature_yaml(const std::string& text) {
    YAML::Node doc = load_typed(text, "signature");

    Signature sig;
    sig.algorithm     = parse_algorithm(doc["algorithm"].as<std::string>());
    sig.created_at    = doc["created"].as<uint64_t>();
    sig.operation_id  = doc["operation-id"].as<uint64_t>();
    sig.bytes         = base64_decode(doc["bytes"].as<std::string>());
    sig.signer_key_id = doc["signer"].as<std::string>("");
    return sig;
}
