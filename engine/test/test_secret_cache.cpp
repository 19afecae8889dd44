#include "secret_cache.hpp"
#include "secret_store.hpp"
#include "dilithium_sig.hpp"
#include "hybrid_error.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
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

template <typename F>
static bool throws_kind(ErrorKind kind, F&& fn) {
    try {
        fn();
    } catch (const HybridError& e) {
        return e.kind() == kind;
    }
    return false;
}

static Seed make_seed(uint8_t fill) {
    Seed s;
    s.fill(fill);
    return s;
}

int main() {
    bool ok = true;

    Seed seed_a = make_seed(0x11);
    Seed seed_b = make_seed(0x22);
    PqKeyPair kp = dilithium_sig::keygen();

    // ── Derived names and keys ────────────────────────────────────────────────
    {
        std::string name = secret_cache::cache_file_name(seed_a);
        ok &= check(name.rfind(".af_dilithium_", 0) == 0, "name prefix");
        ok &= check(name.size() == std::string(".af_dilithium_").size() + 32,
                    "name carries 16 hashed bytes as hex");
        ok &= check(name.find(std::string(32, '1')) == std::string::npos,
                    "name does not expose the seed");
        ok &= check(name == secret_cache::cache_file_name(seed_a), "name is deterministic");
        ok &= check(name != secret_cache::cache_file_name(seed_b), "names differ per seed");

        AesKey ka = secret_cache::derive_encryption_key(seed_a);
        ok &= check(ka == secret_cache::derive_encryption_key(seed_a), "key is deterministic");
        ok &= check(ka != secret_cache::derive_encryption_key(seed_b), "keys differ per seed");
        ok &= check(!std::equal(ka.begin(), ka.end(), seed_a.begin()),
                    "seed is not used directly as the cipher key");
    }

    // ── Encrypt / decrypt ─────────────────────────────────────────────────────
    {
        std::vector<uint8_t> blob = secret_cache::encrypt_keypair(seed_a, kp);
        ok &= check(blob.size() == 12 + kPqPublicKeyBytes + kPqSecretKeyBytes + 16, "blob size");

        std::vector<uint8_t> blob2 = secret_cache::encrypt_keypair(seed_a, kp);
        ok &= check(!std::equal(blob.begin(), blob.begin() + 12, blob2.begin()),
                    "fresh nonce per encryption");

        PqKeyPair back = secret_cache::decrypt_keypair(seed_a, blob);
        ok &= check(back.pk == kp.pk && back.sk == kp.sk, "decrypt restores the keypair");

        ok &= check(throws_kind(ErrorKind::DecryptionFailed,
                                [&] { secret_cache::decrypt_keypair(seed_b, blob); }),
                    "wrong seed must fail decryption");

        std::vector<uint8_t> tampered = blob;
        tampered[tampered.size() / 2] ^= 0x01;
        ok &= check(throws_kind(ErrorKind::DecryptionFailed,
                                [&] { secret_cache::decrypt_keypair(seed_a, tampered); }),
                    "tampered ciphertext must fail");

        std::vector<uint8_t> bad_tag = blob;
        bad_tag.back() ^= 0x80;
        ok &= check(throws_kind(ErrorKind::DecryptionFailed,
                                [&] { secret_cache::decrypt_keypair(seed_a, bad_tag); }),
                    "tampered tag must fail");

        std::vector<uint8_t> stub(blob.begin(), blob.begin() + 20);
        ok &= check(throws_kind(ErrorKind::DecryptionFailed,
                                [&] { secret_cache::decrypt_keypair(seed_a, stub); }),
                    "blob shorter than nonce + tag must fail");

        // Authentic ciphertext of the wrong length.
        std::vector<uint8_t> short_pt =
            aes256gcm_encrypt(secret_cache::derive_encryption_key(seed_a),
                              std::vector<uint8_t>(100, 0x42));
        ok &= check(throws_kind(ErrorKind::CacheFormat,
                                [&] { secret_cache::decrypt_keypair(seed_a, short_pt); }),
                    "wrong plaintext length is a format error");

        PqKeyPair truncated = kp;
        truncated.sk.resize(100);
        ok &= check(throws_kind(ErrorKind::CacheFormat,
                                [&] { secret_cache::encrypt_keypair(seed_a, truncated); }),
                    "refuses to store a malformed keypair");
    }

    // ── SecretCache over memory ───────────────────────────────────────────────
    {
        MemorySecretStore store;
        SecretCache cache(store);

        ok &= check(!cache.load(seed_a).has_value(), "empty cache misses");
        cache.save(seed_a, kp);
        ok &= check(store.size() == 1, "one entry stored");

        std::optional<PqKeyPair> hit = cache.load(seed_a);
        ok &= check(hit && hit->pk == kp.pk && hit->sk == kp.sk, "load returns saved pair");
        ok &= check(!cache.load(seed_b).has_value(), "other seed misses");

        // An entry under seed_b's name that was written with seed_a's key.
        store.write(secret_cache::cache_file_name(seed_b),
                    secret_cache::encrypt_keypair(seed_a, kp));
        ok &= check(throws_kind(ErrorKind::DecryptionFailed, [&] { cache.load(seed_b); }),
                    "undecryptable entry is an error, not a miss");

        ok &= check(cache.evict(seed_a), "evict existing");
        ok &= check(!cache.load(seed_a).has_value(), "evicted entry misses");
    }

    // ── FileSecretStore path safety ───────────────────────────────────────────
    fs::path dir = fs::temp_directory_path() /
                   ("worf-cache-test-" + std::to_string(::getpid()));
    fs::remove_all(dir);
    {
        FileSecretStore store((dir / "store").string());

        for (const char* bad : {"../x", "/abs", "a/b", "", ".", ".."}) {
            std::string name = bad;
            bool rejected = throws_kind(ErrorKind::CachePath,
                                        [&] { store.write(name, {1, 2, 3}); });
            if (!rejected) {
                std::cerr << "FAIL: name '" << name << "' accepted\n";
                ok = false;
            }
            ok &= check(throws_kind(ErrorKind::CachePath, [&] { store.read(name); }),
                        "read validates names");
            ok &= check(throws_kind(ErrorKind::CachePath, [&] { store.erase(name); }),
                        "erase validates names");
        }
        ok &= check(!fs::exists(dir / "x") && !fs::exists(dir / "store" / "a"),
                    "rejected names touch nothing");

        ok &= check(!store.read("missing").has_value(), "missing file is a miss");
        ok &= check(!store.erase("missing"), "erase of missing file");

        store.write("entry", {9, 8, 7});
        std::optional<std::vector<uint8_t>> back = store.read("entry");
        ok &= check(back && *back == std::vector<uint8_t>({9, 8, 7}), "file round trip");
        store.write("entry", {1});
        back = store.read("entry");
        ok &= check(back && back->size() == 1, "write replaces the entry");

        // Replacement goes through a sibling file that is renamed away.
        size_t files = 0;
        bool leftovers = false;
        for (const auto& e : fs::directory_iterator(dir / "store")) {
            ++files;
            if (e.path().filename().string().find(".tmp") != std::string::npos)
                leftovers = true;
        }
        ok &= check(files == 1 && !leftovers, "no temporary file left after write");
        fs::perms ep = fs::status(dir / "store" / "entry").permissions();
        ok &= check((ep & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none,
                    "renamed entry is private to the owner");

        // A stale temporary from an interrupted write does not shadow the entry.
        {
            std::ofstream stale((dir / "store" / "entry.tmp-deadbeef").string(), std::ios::binary);
            stale << "partial";
        }
        back = store.read("entry");
        ok &= check(back && *back == std::vector<uint8_t>({1}), "entry intact beside a stale temporary");
        fs::remove(dir / "store" / "entry.tmp-deadbeef");

        ok &= check(store.erase("entry"), "erase existing file");

        SecretCache cache(store);
        cache.save(seed_a, kp);
        ok &= check(fs::exists(dir / "store" / secret_cache::cache_file_name(seed_a)),
                    "cache entry lands directly in the store directory");
        std::optional<PqKeyPair> hit = cache.load(seed_a);
        ok &= check(hit && hit->sk == kp.sk, "file-backed cache round trip");
    }
    fs::remove_all(dir);

    if (ok) std::cout << "PASS\n";
    return ok ? 0 : 1;
}
