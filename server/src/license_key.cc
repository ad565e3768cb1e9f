#include "license_key.h"
#include "gwauth_util.h"

#include <array>
#include <cstring>

#include <openssl/sha.h>
#include <sodium.h>

namespace gwauth {

// Hex encode bytes (lowercase).
static std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

std::string hash_license_key(const std::string& license_key) {
    // Surrounding whitespace is not part of the key (copy/paste from admin UI).
    const std::string k = trim_ws(license_key);

    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(k.data()), k.size(), h);
    return std::string(kLicenseHashPrefix) + to_hex(h, sizeof(h));
}

bool is_hashed_key(const std::string& stored_key) {
    const size_t n = std::strlen(kLicenseHashPrefix);
    return stored_key.size() >= n && stored_key.compare(0, n, kLicenseHashPrefix) == 0;
}

bool ct_equal(const std::string& a, const std::string& b) {
    // sodium_memcmp needs equal lengths. On a length mismatch compare a with
    // itself so the work done still scales with the presented input only.
    if (a.size() != b.size()) {
        if (!a.empty()) (void)sodium_memcmp(a.data(), a.data(), a.size());
        return false;
    }
    if (a.empty()) return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool verify_license_key(const std::string& provided_key, const std::string& stored_key) {
    if (is_hashed_key(stored_key)) {
        return ct_equal(hash_license_key(provided_key), stored_key);
    }
    // Legacy row: plaintext key still stored.
    return ct_equal(provided_key, stored_key);
}

LicenseLookupKeys license_lookup_keys(const std::string& license_key) {
    LicenseLookupKeys k;
    k.plaintext = license_key;
    k.digest = hash_license_key(license_key);
    return k;
}

std::string generate_license_key() {
    // 24 random bytes encode to exactly 32 base64url characters (192 bits).
    static_assert(kLicenseKeyRandomChars == 32, "random part is 24 bytes of base64url");
    std::array<unsigned char, 24> rnd{};
    randombytes_buf(rnd.data(), rnd.size());

    std::string body = b64url_enc(rnd.data(), rnd.size());
    sodium_memzero(rnd.data(), rnd.size());

    return std::string(kLicenseKeyPrefix) + body;
}

// Masks never leave fewer than this many characters hidden.
static constexpr size_t kMinHiddenChars = 8;

std::string mask_license_key(const std::string& license_key, size_t visible_chars) {
    if (license_key.size() < visible_chars + 4 + kMinHiddenChars)
        return std::string(license_key.size(), '*');

    const std::string prefix = license_key.substr(0, visible_chars);
    const std::string suffix = license_key.substr(license_key.size() - 4);
    return prefix + "..." + suffix;
}

std::string mask_secret(const std::string& value, size_t visible_chars) {
    if (value.size() < visible_chars + kMinHiddenChars) return std::string(value.size(), '*');
    return std::string(4, '*') + value.substr(value.size() - visible_chars);
}

} // namespace gwauth
