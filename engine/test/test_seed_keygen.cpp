#include "hybrid.hpp"
#include "hybrid_error.hpp"
#include "secret_cache.hpp"
#include "secret_store.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static std::vector<uint8_t> classical_half(const PublicKey& pk) {
    return std::vector<uint8_t>(pk.bytes.begin() + kPqPublicKeyBytes, pk.bytes.end());
}

class FixedClock : public Witness {
public:
    explicit FixedClock(uint64_t t) : t_(t) {}
    WitnessProof attest(const PolicyHash&) override { return WitnessProof{}; }
    uint64_t current_time() override { return t_; }
private:
    uint64_t t_;
};

// Reads find nothing; every write fails the way a full disk would.
class RefusingStore : public SecretStore {
public:
    int writes = 0;

    std::optional<std::vector<uint8_t>> read(const std::string&) override { return std::nullopt; }
    void write(const std::string&, const std::vector<uint8_t>&) override {
        ++writes;
        throw HybridError(ErrorKind::CacheWrite, "no space left on device");
    }
    bool erase(const std::string&) override { return false; }
};

int main() {
    bool ok = true;

    // ── All-zero seed: sign "hello", verify against "hellp" ───────────────────
    {
        MemorySecretStore store;
        SecretCache cache(store);
        Seed zero{};

        KeyPair pair = hybrid::generate_from_seed(zero, cache);
        ok &= check(store.size() == 1, "miss writes one cache entry");
        ok &= check(pair.private_key.operation_id() == 0, "zero seed gives operation id 0");
        ok &= check(pair.private_key.key_id() == "deterministic-hybrid-0000000000000000",
                    "zero seed key id");

        Signature sig = hybrid::sign(pair.private_key, bytes_of("hello"));
        ok &= check(hybrid::verify_ok(pair.public_key, bytes_of("hello"), sig), "hello verifies");
        try {
            hybrid::verify(pair.public_key, bytes_of("hellp"), sig);
            ok &= fail("hellp must not verify");
        } catch (const HybridError& e) {
            ok &= check(is_verification_failure(e.kind()), "hellp fails verification");
        }
    }

    // ── Determinism ───────────────────────────────────────────────────────────
    Seed seed;
    for (size_t i = 0; i < seed.size(); ++i) seed[i] = static_cast<uint8_t>(i + 1);

    {
        MemorySecretStore store;
        SecretCache cache(store);

        KeyPair a = hybrid::generate_from_seed(seed, cache);
        KeyPair b = hybrid::generate_from_seed(seed, cache);
        ok &= check(a.public_key.bytes == b.public_key.bytes, "same seed, same public key");
        ok &= check(store.size() == 1, "hit does not add entries");
        ok &= check(a.private_key.operation_id() == 0x0102030405060708ULL,
                    "operation id is big-endian seed[0..8]");
        ok &= check(a.public_key.operation_id == a.private_key.operation_id(),
                    "public key carries the operation id");
        ok &= check(a.private_key.key_id() == "deterministic-hybrid-0102030405060708",
                    "seed key id");

        // A signature from one derivation verifies under the other.
        Signature sig = hybrid::sign(a.private_key, bytes_of("cross"));
        ok &= check(hybrid::verify_ok(b.public_key, bytes_of("cross"), sig),
                    "rederived key verifies earlier signature");

        // Dropping the cache regenerates Dilithium3 but not Ed25519.
        ok &= check(cache.evict(seed), "evict removes the entry");
        ok &= check(!cache.evict(seed), "second evict finds nothing");
        KeyPair c = hybrid::generate_from_seed(seed, cache);
        ok &= check(classical_half(c.public_key) == classical_half(a.public_key),
                    "Ed25519 half depends on the seed alone");
        ok &= check(c.public_key.bytes != a.public_key.bytes,
                    "Dilithium3 half is regenerated after eviction");

        Seed other = seed;
        other[31] ^= 0xFF;
        KeyPair d = hybrid::generate_from_seed(other, cache);
        ok &= check(classical_half(d.public_key) != classical_half(a.public_key),
                    "different seed, different Ed25519 key");
        ok &= check(store.size() == 2, "one entry per seed");
    }

    // ── Witness clock stamps created_at ───────────────────────────────────────
    {
        MemorySecretStore store;
        SecretCache cache(store);
        FixedClock clock(1700000000);
        KeyPair pair = hybrid::generate_from_seed(seed, cache, &clock);
        ok &= check(pair.public_key.created_at == 1700000000, "created_at from witness");
        ok &= check(pair.private_key.operation_id() == 0x0102030405060708ULL,
                    "witness does not change seed operation id");
        Signature sig = hybrid::sign(pair.private_key, bytes_of("t"), &clock);
        ok &= check(sig.created_at == 1700000000 && sig.operation_id == 1700000000,
                    "signature stamped from witness");
    }

    // ── File-backed cache ─────────────────────────────────────────────────────
    fs::path dir = fs::temp_directory_path() /
                   ("worf-seed-test-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    {
        FileSecretStore store((dir / "cache").string());
        SecretCache cache(store);

        KeyPair a = hybrid::generate_from_seed(seed, cache);
        fs::path entry = dir / "cache" / secret_cache::cache_file_name(seed);
        ok &= check(fs::exists(entry), "cache file written");

        fs::perms p = fs::status(entry).permissions();
        ok &= check((p & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none,
                    "cache file is private to the owner");
        fs::perms dp = fs::status(dir / "cache").permissions();
        ok &= check((dp & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none,
                    "cache directory is private to the owner");

        ok &= check(fs::file_size(entry) == 12 + kPqPublicKeyBytes + kPqSecretKeyBytes + 16,
                    "blob is nonce || ciphertext || tag");

        // A fresh store over the same directory sees the same key.
        FileSecretStore reopened((dir / "cache").string());
        SecretCache cache2(reopened);
        KeyPair b = hybrid::generate_from_seed(seed, cache2);
        ok &= check(a.public_key.bytes == b.public_key.bytes, "key survives process restart");

        // A damaged entry is reported, never silently replaced.
        {
            std::fstream f(entry, std::ios::in | std::ios::out | std::ios::binary);
            char c = 0;
            f.seekg(40);
            f.get(c);
            f.seekp(40);
            f.put(static_cast<char>(c ^ 0x01));
        }
        auto size_before = fs::file_size(entry);
        try {
            hybrid::generate_from_seed(seed, cache2);
            ok &= fail("corrupted cache entry accepted");
        } catch (const HybridError& e) {
            ok &= check(e.kind() == ErrorKind::DecryptionFailed, "corruption kind");
        }
        ok &= check(fs::exists(entry) && fs::file_size(entry) == size_before,
                    "corrupted entry left in place");
    }

    // ── Cache write failure yields no key ─────────────────────────────────────
    {
        RefusingStore store;
        SecretCache cache(store);
        bool returned = false;
        try {
            KeyPair pair = hybrid::generate_from_seed(seed, cache);
            returned = true;
        } catch (const HybridError& e) {
            ok &= check(e.kind() == ErrorKind::CacheWrite, "store failure kind");
            ok &= check(std::string(e.what()).find("no space left") != std::string::npos,
                        "store reason is kept");
        }
        ok &= check(!returned, "key returned although the cache could not be written");
        ok &= check(store.writes == 1, "one write attempted");
    }
    {
        // Cache directory underneath a regular file cannot be created.
        fs::create_directories(dir);
        fs::path blocker = dir / "blocker";
        std::ofstream(blocker) << "not a directory";

        FileSecretStore store((blocker / "cache").string());
        SecretCache cache(store);
        bool returned = false;
        try {
            KeyPair pair = hybrid::generate_from_seed(seed, cache);
            returned = true;
        } catch (const HybridError& e) {
            ok &= check(e.kind() == ErrorKind::CacheWrite, "unwritable directory kind");
        }
        ok &= check(!returned, "key returned although the cache directory is unusable");
        ok &= check(fs::is_regular_file(blocker), "blocking file untouched");
    }
    fs::remove_all(dir);

    if (ok) std::cout << "PASS\n";
    return ok ? 0 : 1;
}
