#include "hybrid.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

static bool fail(const char* msg) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
}

static bool check(bool cond, const char* msg) {
    if (!cond) return fail(msg);
    return true;
}

template <typename C>
static bool all_zero(const C& c) {
    return std::all_of(c.begin(), c.end(), [](uint8_t b) { return b == 0; });
}

// Mock material with recognisable secret bytes; no crypto involved.
static HybridKeyMaterial mock_material(uint8_t fill) {
    HybridKeyMaterial m;
    m.dilithium.pk = std::vector<uint8_t>(kPqPublicKeyBytes, 0x11);
    m.dilithium.sk = std::vector<uint8_t>(kPqSecretKeyBytes, fill);
    m.ed25519_sk.fill(fill);
    m.ed25519_pk.fill(0x22);
    return m;
}

int main() {
    bool ok = true;

    // ── Move construction leaves no secret behind ─────────────────────────────
    {
        HybridKeyMaterial src = mock_material(0xAB);
        HybridKeyMaterial dst(std::move(src));

        ok &= check(all_zero(src.ed25519_sk), "moved-from Ed25519 secret zeroed");
        ok &= check(all_zero(src.dilithium.sk), "moved-from Dilithium secret empty or zeroed");
        ok &= check(dst.ed25519_sk[0] == 0xAB && dst.ed25519_sk[31] == 0xAB, "destination keeps Ed25519 secret");
        ok &= check(dst.dilithium.sk.size() == kPqSecretKeyBytes && dst.dilithium.sk[0] == 0xAB,
                    "destination keeps Dilithium secret");
        ok &= check(dst.ed25519_pk[0] == 0x22, "public half travels with the move");
    }

    // ── Move assignment ───────────────────────────────────────────────────────
    {
        HybridKeyMaterial src = mock_material(0xCD);
        HybridKeyMaterial dst = mock_material(0x01);
        dst = std::move(src);

        ok &= check(all_zero(src.ed25519_sk), "move-assigned source Ed25519 secret zeroed");
        ok &= check(all_zero(src.dilithium.sk), "move-assigned source Dilithium secret empty or zeroed");
        ok &= check(dst.ed25519_sk[0] == 0xCD, "move-assigned destination holds new secret");
    }

    // ── Explicit cleanse ──────────────────────────────────────────────────────
    {
        HybridKeyMaterial m = mock_material(0xEF);
        m.cleanse();
        ok &= check(all_zero(m.ed25519_sk), "cleanse zeroes Ed25519 secret");
        ok &= check(m.dilithium.sk.size() == kPqSecretKeyBytes && all_zero(m.dilithium.sk),
                    "cleanse zeroes Dilithium secret in place");
        ok &= check(m.dilithium.pk[0] == 0x11, "cleanse leaves public key alone");
    }

    // ── Handing material to a PrivateKey, then moving the key ─────────────────
    {
        HybridKeyMaterial m = mock_material(0x5A);
        PrivateKey a(AlgorithmVersion::MandatoryHybrid, std::move(m), 1, 1, "k");
        ok &= check(all_zero(m.ed25519_sk), "material handed to key is zeroed");
        ok &= check(all_zero(m.dilithium.sk), "material handed to key has no Dilithium secret");
        ok &= check(a.material() && a.material()->ed25519_sk[0] == 0x5A, "key owns the secret");

        PrivateKey b(std::move(a));
        ok &= check(!a.material(), "moved-from key holds no material");
        ok &= check(b.material() && b.material()->ed25519_sk[0] == 0x5A, "moved-to key owns the secret");
        ok &= check(b.key_id() == "k", "key id moves");
        ok &= check(b.public_key().bytes.size() == kHybridPublicKeyBytes, "moved-to key still yields a public key");
    }

    if (ok) std::cout << "PASS\n";
    return ok ? 0 : 1;
}
