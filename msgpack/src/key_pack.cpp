#include "key_pack.hpp"
#include "algorithm_policy.hpp"
#include "key_identity.hpp"
#include <msgpack.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace key_mp {

static constexpr uint32_t kFormatVersion = 1;

// ── helpers ───────────────────────────────────────────────────────────────────

static std::string require_str(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::STR)
        throw std::runtime_error(std::string(ctx) + ": expected string");
    return {obj.via.str.ptr, obj.via.str.size};
}

static std::vector<uint8_t> require_bin(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::BIN)
        throw std::runtime_error(std::string(ctx) + ": expected binary");
    return {reinterpret_cast<const uint8_t*>(obj.via.bin.ptr),
            reinterpret_cast<const uint8_t*>(obj.via.bin.ptr) + obj.via.bin.size};
}

static uint64_t require_u64(const msgpack::object& obj, const char* ctx) {
    if (obj.type != msgpack::type::POSITIVE_INTEGER)
        throw std::runtime_error(std::string(ctx) + ": expected unsigned int");
    return obj.via.u64;
}

static void pack_common(msgpack::packer<msgpack::sbuffer>& pk,
                        const char* kind,
                        AlgorithmVersion alg,
                        const std::vector<uint8_t>& bytes,
                        uint64_t created_at,
                        uint64_t operation_id)
{
    pk.pack(std::string("k"));
    pk.pack(std::string(kind));

    pk.pack(std::string("v"));
    pk.pack_uint32(kFormatVersion);

    pk.pack(std::string("alg"));
    pk.pack(algorithm_name(alg));

    pk.pack(std::string("b"));
    pk.pack_bin(static_cast<uint32_t>(bytes.size()));
    pk.pack_bin_body(reinterpret_cast<const char*>(bytes.data()), bytes.size());

    pk.pack(std::string("cr"));
    pk.pack_uint64(created_at);

    pk.pack(std::string("op"));
    pk.pack_uint64(operation_id);
}

static std::vector<uint8_t> to_bytes(const msgpack::sbuffer& buf) {
    return {reinterpret_cast<const uint8_t*>(buf.data()),
            reinterpret_cast<const uint8_t*>(buf.data()) + buf.size()};
}

// Fields shared by both documents. `extra` receives the kind-specific
// string field ("fp" or "sg").
struct Common {
    std::string          kind;
    uint32_t             version = 0;
    AlgorithmVersion     alg     = AlgorithmVersion::MandatoryHybrid;
    std::vector<uint8_t> bytes;
    uint64_t             created_at   = 0;
    uint64_t             operation_id = 0;
    std::string          extra;
};

static Common unpack_common(const std::vector<uint8_t>& data, const char* extra_key) {
    msgpack::object_handle oh = msgpack::unpack(
        reinterpret_cast<const char*>(data.data()), data.size());
    const msgpack::object& obj = oh.get();

    if (obj.type != msgpack::type::MAP)
        throw std::runtime_error("unpack: top-level object must be a map");

    Common c;
    bool got_k = false, got_v = false, got_alg = false, got_b = false,
         got_cr = false, got_op = false, got_extra = false;

    const auto& map = obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        const auto& kv = map.ptr[i];
        std::string key = require_str(kv.key, "map key");
        const msgpack::object& val = kv.val;

        if (key == "k") {
            c.kind = require_str(val, "'k'");
            got_k = true;
        } else if (key == "v") {
            c.version = static_cast<uint32_t>(require_u64(val, "'v'"));
            got_v = true;
        } else if (key == "alg") {
            c.alg = parse_algorithm(require_str(val, "'alg'"));
            got_alg = true;
        } else if (key == "b") {
            c.bytes = require_bin(val, "'b'");
            got_b = true;
        } else if (key == "cr") {
            c.created_at = require_u64(val, "'cr'");
            got_cr = true;
        } else if (key == "op") {
            c.operation_id = require_u64(val, "'op'");
            got_op = true;
        } else if (key == extra_key) {
            c.extra = require_str(val, extra_key);
            got_extra = true;
        }
    }

    if (!got_k || !got_v || !got_alg || !got_b || !got_cr || !got_op || !got_extra)
        throw std::runtime_error("unpack: missing required fields in msgpack document");
    if (c.version != kFormatVersion)
        throw std::runtime_error("unpack: unsupported format version " + std::to_string(c.version));
    return c;
}

// ── pack ──────────────────────────────────────────────────────────────────────

std::vector<uint8_t> pack(const PublicKey& pub) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    pk.pack_map(7);
    pack_common(pk, "pk", pub.algorithm, pub.bytes, pub.created_at, pub.operation_id);

    pk.pack(std::string("fp"));
    pk.pack(public_key_fingerprint(pub));

    return to_bytes(buf);
}

std::vector<uint8_t> pack(const Signature& sig) {
    msgpack::sbuffer buf;
    msgpack::packer<msgpack::sbuffer> pk(buf);

    pk.pack_map(7);
    pack_common(pk, "sig", sig.algorithm, sig.bytes, sig.created_at, sig.operation_id);

    pk.pack(std::string("sg"));
    pk.pack(sig.signer_key_id);

    return to_bytes(buf);
}

// ── unpack ────────────────────────────────────────────────────────────────────

PublicKey unpack_public_key(const std::vector<uint8_t>& data, std::string* fingerprint_out) {
    Common c = unpack_common(data, "fp");
    if (c.kind != "pk")
        throw std::runtime_error("unpack: expected public key document, got '" + c.kind + "'");

    PublicKey pub;
    pub.algorithm    = c.alg;
    pub.bytes        = std::move(c.bytes);
    pub.created_at   = c.created_at;
    pub.operation_id = c.operation_id;
    if (fingerprint_out)
        *fingerprint_out = c.extra;
    return pub;
}

Signature unpack_signature(const std::vector<uint8_t>& data) {
    Common c = unpack_common(data, "sg");
    if (c.kind != "sig")
        throw std::runtime_error("unpack: expected signature document, got '" + c.kind + "'");

    Signature sig;
    sig.algorithm     = c.alg;
    sig.bytes         = std::move(c.bytes);
    sig.created_at    = c.created_at;
    sig.operation_id  = c.operation_id;
    sig.signer_key_id = std::move(c.extra);
    return sig;
}

// ── file I/O ──────────────────────────────────────────────────────────────────

void write_file(const std::vector<uint8_t>& bytes, const std::string& path) {
    std::ofstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("write_file: cannot open " + path);
    f.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
    if (!f) throw std::runtime_error("write_file: write error");
}

std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("read_file: cannot open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (!f && !f.eof())
        throw std::runtime_error("read_file: read error");
    return bytes;
}

} // namespace key_mp
