#include "hybrid.hpp"
#include "hybrid_error.hpp"
#include "algorithm_policy.hpp"
#include "base64.hpp"
#include "digest.hpp"
#include "entropy.hpp"
#include "key_identity.hpp"
#include "key_reader.hpp"
#include "secret_cache.hpp"
#include "secret_store.hpp"

#include <algorithm>
#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>
#include <string>
#include <cstring>
#include <cstdlib>
#include <stdexcept>
#include <openssl/crypto.h>

// ── Usage ─────────────────────────────────────────────────────────────────────

static void print_usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " generate-seed [--format hex|base64]\n"
        "  " << prog << " keygen  --seed <hex> --public-key <file> [--format yaml|msgpack] [--cache-dir <dir>]\n"
        "  " << prog << " sign    --seed <hex> --out <file> [--input <file> | --message <text>]\n"
        "               [--format yaml|msgpack] [--cache-dir <dir>]\n"
        "  " << prog << " verify  --public-key <file> --signature <file> [--input <file> | --message <text>]\n"
        "  " << prog << " address --public-key <file> [--format hex|base64]\n"
        "\n"
        "  --seed       32-byte seed as 64 hex characters (see generate-seed)\n"
        "  --cache-dir  Directory for the encrypted Dilithium3 cache\n"
        "               (default: $WORF_CACHE_DIR, else $HOME/.worf/cache)\n"
        "  --format     Output format; key and signature files are auto-detected on read\n"
        "  --verbose    Debug output on stderr\n"
        "\n"
        "  sign and verify read the message from stdin when neither --input nor\n"
        "  --message is given.\n"
        "\n"
        "Exit codes: 0=ok, 1=usage, 2=crypto/policy, 3=I/O\n";
}

// ── Logging ───────────────────────────────────────────────────────────────────

static bool g_verbose = false;

static void debug(const std::string& msg) {
    if (g_verbose)
        std::cerr << "[debug] " << msg << "\n";
}

// ── Configuration ─────────────────────────────────────────────────────────────

static std::string default_cache_dir() {
    if (const char* dir = std::getenv("WORF_CACHE_DIR"))
        if (*dir) return dir;
    if (const char* home = std::getenv("HOME"))
        if (*home) return std::string(home) + "/.worf/cache";
    return "./.worf-cache";
}

struct Options {
    std::string seed_hex;
    std::string public_key_path;
    std::string signature_path;
    std::string out_path;
    std::string input_path;
    std::string message;
    bool        has_message = false;
    std::string format;
    std::string cache_dir;
};

// ── Helpers ───────────────────────────────────────────────────────────────────

static Seed parse_seed(const std::string& hex) {
    if (hex.size() != 64)
        throw std::invalid_argument("seed must be exactly 64 hex characters (32 bytes)");
    std::vector<uint8_t> bytes = hex_decode(hex);
    Seed seed;
    std::copy(bytes.begin(), bytes.end(), seed.begin());
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return seed;
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw std::runtime_error("Cannot open file: " + path);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(f)),
                                 std::istreambuf_iterator<char>());
}

static std::vector<uint8_t> read_message(const Options& opt) {
    if (opt.has_message) {
        debug("using direct message of " + std::to_string(opt.message.size()) + " bytes");
        return std::vector<uint8_t>(opt.message.begin(), opt.message.end());
    }
    if (!opt.input_path.empty()) {
        debug("reading input file: " + opt.input_path);
        return read_file(opt.input_path);
    }
    debug("reading message from stdin");
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(std::cin)),
                                 std::istreambuf_iterator<char>());
}

static int exit_code_for(const HybridError& e) {
    switch (e.kind()) {
        case ErrorKind::CacheRead:
        case ErrorKind::CacheWrite:
        case ErrorKind::CachePath:
            return 3;
        default:
            return 2;
    }
}

// ── generate-seed ─────────────────────────────────────────────────────────────

static int cmd_generate_seed(const Options& opt) {
    std::string fmt = opt.format.empty() ? "hex" : opt.format;
    if (fmt != "hex" && fmt != "base64") {
        std::cerr << "Error: invalid format '" << fmt << "' (must be hex or base64)\n";
        return 1;
    }

    Seed seed;
    try {
        secure_random_bytes(seed.data(), seed.size());
    } catch (const HybridError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    std::vector<uint8_t> bytes(seed.begin(), seed.end());
    std::cout << (fmt == "hex" ? hex_encode(seed.data(), seed.size()) : base64_encode(bytes)) << "\n";
    OPENSSL_cleanse(bytes.data(), bytes.size());
    OPENSSL_cleanse(seed.data(), seed.size());

    std::cerr << "Store this seed securely: anyone holding it can regenerate the private key.\n";
    return 0;
}

// ── keygen / sign ─────────────────────────────────────────────────────────────

static int cmd_keygen(const Options& opt) {
    if (opt.seed_hex.empty() || opt.public_key_path.empty()) {
        std::cerr << "Error: keygen requires --seed and --public-key\n";
        return 1;
    }

    Seed seed;
    FileFormat fmt;
    try {
        seed = parse_seed(opt.seed_hex);
        fmt  = parse_file_format(opt.format.empty() ? "yaml" : opt.format);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::string cache_dir = opt.cache_dir.empty() ? default_cache_dir() : opt.cache_dir;
    debug("cache directory: " + cache_dir);

    FileSecretStore store(cache_dir);
    SecretCache     cache(store);

    try {
        KeyPair pair = hybrid::generate_from_seed(seed, cache);
        OPENSSL_cleanse(seed.data(), seed.size());

        try {
            save_public_key(pair.public_key, opt.public_key_path, fmt);
        } catch (const std::exception& e) {
            std::cerr << "Error: cannot write public key: " << e.what() << "\n";
            return 3;
        }

        std::cout << "Keypair derived:\n"
                  << "  key id:      " << pair.private_key.key_id() << "\n"
                  << "  algorithm:   " << algorithm_name(pair.public_key.algorithm) << "\n"
                  << "  fingerprint: " << public_key_fingerprint(pair.public_key) << "\n"
                  << "  public key:  " << opt.public_key_path
                  << " (" << pair.public_key.bytes.size() << "B)\n";
        debug("private key not written; the same seed regenerates it");
    } catch (const HybridError& e) {
        OPENSSL_cleanse(seed.data(), seed.size());
        std::cerr << "Error: key derivation failed: " << e.what() << "\n";
        return exit_code_for(e);
    }
    return 0;
}

static int cmd_sign(const Options& opt) {
    if (opt.seed_hex.empty() || opt.out_path.empty()) {
        std::cerr << "Error: sign requires --seed and --out\n";
        return 1;
    }

    Seed seed;
    FileFormat fmt;
    try {
        seed = parse_seed(opt.seed_hex);
        fmt  = parse_file_format(opt.format.empty() ? "yaml" : opt.format);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::vector<uint8_t> message;
    try {
        message = read_message(opt);
    } catch (const std::exception& e) {
        OPENSSL_cleanse(seed.data(), seed.size());
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    std::string cache_dir = opt.cache_dir.empty() ? default_cache_dir() : opt.cache_dir;
    debug("cache directory: " + cache_dir);

    FileSecretStore store(cache_dir);
    SecretCache     cache(store);

    Signature sig;
    try {
        KeyPair pair = hybrid::generate_from_seed(seed, cache);
        OPENSSL_cleanse(seed.data(), seed.size());
        debug("signing " + std::to_string(message.size()) + " bytes with " + pair.private_key.key_id());
        sig = hybrid::sign(pair.private_key, message);
    } catch (const HybridError& e) {
        OPENSSL_cleanse(seed.data(), seed.size());
        std::cerr << "Error: signing failed: " << e.what() << "\n";
        return exit_code_for(e);
    }

    try {
        save_signature(sig, opt.out_path, fmt);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot write signature: " << e.what() << "\n";
        return 3;
    }

    std::cout << "Signature written:\n"
              << "  file:   " << opt.out_path << "\n"
              << "  signer: " << sig.signer_key_id << "\n"
              << "  size:   " << sig.bytes.size() << "B\n";
    return 0;
}

// ── verify / address ──────────────────────────────────────────────────────────

static int cmd_verify(const Options& opt) {
    if (opt.public_key_path.empty() || opt.signature_path.empty()) {
        std::cerr << "Error: verify requires --public-key and --signature\n";
        return 1;
    }

    PublicKey pk;
    Signature sig;
    std::vector<uint8_t> message;
    try {
        debug("loading public key: " + opt.public_key_path);
        pk = load_public_key(opt.public_key_path);
        debug("loading signature: " + opt.signature_path);
        sig = load_signature(opt.signature_path);
        message = read_message(opt);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    try {
        hybrid::verify(pk, message, sig);
    } catch (const HybridError& e) {
        std::cerr << "Error: signature verification FAILED: " << e.what() << "\n";
        return 2;
    }

    std::cout << "Signature OK (Dilithium3 and Ed25519 both verified)\n"
              << "  signer:    " << sig.signer_key_id << "\n"
              << "  signed at: " << sig.created_at << "\n";
    return 0;
}

static int cmd_address(const Options& opt) {
    if (opt.public_key_path.empty()) {
        std::cerr << "Error: address requires --public-key\n";
        return 1;
    }
    std::string fmt = opt.format.empty() ? "hex" : opt.format;
    if (fmt != "hex" && fmt != "base64") {
        std::cerr << "Error: invalid format '" << fmt << "' (must be hex or base64)\n";
        return 1;
    }

    PublicKey pk;
    try {
        pk = load_public_key(opt.public_key_path);
    } catch (const std::exception& e) {
        std::cerr << "Error: cannot load public key: " << e.what() << "\n";
        return 3;
    }

    std::vector<uint8_t> addr;
    try {
        addr = public_key_address(pk);
    } catch (const HybridError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }

    std::cout << (fmt == "hex" ? hex_encode(addr.data(), addr.size()) : base64_encode(addr)) << "\n";
    debug("address derived from key created at " + std::to_string(pk.created_at));
    return 0;
}

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    if (cmd != "generate-seed" && cmd != "keygen" && cmd != "sign" &&
        cmd != "verify" && cmd != "address") {
        std::cerr << "Error: unknown command '" << cmd << "'\n";
        print_usage(argv[0]);
        return 1;
    }

    Options opt;
    for (int i = 2; i < argc; ++i) {
        auto value = [&](const char* flag) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return nullptr;
            }
            return argv[i];
        };

        const char* v = nullptr;
        if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "--seed") == 0) {
            if (!(v = value("--seed"))) return 1;
            opt.seed_hex = v;
        } else if (std::strcmp(argv[i], "--public-key") == 0) {
            if (!(v = value("--public-key"))) return 1;
            opt.public_key_path = v;
        } else if (std::strcmp(argv[i], "--signature") == 0) {
            if (!(v = value("--signature"))) return 1;
            opt.signature_path = v;
        } else if (std::strcmp(argv[i], "--out") == 0) {
            if (!(v = value("--out"))) return 1;
            opt.out_path = v;
        } else if (std::strcmp(argv[i], "--input") == 0) {
            if (!(v = value("--input"))) return 1;
            opt.input_path = v;
        } else if (std::strcmp(argv[i], "--message") == 0) {
            if (!(v = value("--message"))) return 1;
            opt.message = v;
            opt.has_message = true;
        } else if (std::strcmp(argv[i], "--format") == 0) {
            if (!(v = value("--format"))) return 1;
            opt.format = v;
        } else if (std::strcmp(argv[i], "--cache-dir") == 0) {
            if (!(v = value("--cache-dir"))) return 1;
            opt.cache_dir = v;
        } else {
            std::cerr << "Error: unknown option '" << argv[i] << "'\n";
            return 1;
        }
    }

    if (opt.has_message && !opt.input_path.empty()) {
        std::cerr << "Error: --input and --message are mutually exclusive\n";
        return 1;
    }

    debug("worf: Dilithium3 + Ed25519 mandatory hybrid signatures");

    if (cmd == "generate-seed") return cmd_generate_seed(opt);
    if (cmd == "keygen")        return cmd_keygen(opt);
    if (cmd == "sign")          return cmd_sign(opt);
    if (cmd == "verify")        return cmd_verify(opt);
    return cmd_address(opt);
}
