#pragma once
#include <cstddef>
#include <string>

namespace gwauth {

/*
License keys
============

Format of issued keys:   lic_<32 chars URL-safe base64>   (192 random bits)
Format of stored digests: sha256:<64 lowercase hex>

Storage migration
-----------------
Rows may hold either a digest (new and rotated keys) or the legacy plaintext
key. verify_license_key() accepts both forms, so existing plaintext rows keep
working while every newly written row is a digest. A digest cannot be turned
back into a key; migration is one-way.

Hard requirement:
- libsodium must be initialized (sodium_init()) before generate_license_key().
*/

inline constexpr char kLicenseKeyPrefix[] = "lic_";
inline constexpr size_t kLicenseKeyRandomChars = 32;
inline constexpr char kLicenseHashPrefix[] = "sha256:";

// SHA-256 of the trimmed key, hex, with kLicenseHashPrefix.
std::string hash_license_key(const std::string& license_key);

bool is_hashed_key(const std::string& stored_key);

// Constant-time over the compared bytes. Unequal lengths return false after
// doing a comparison of the same cost as an equal-length one.
bool ct_equal(const std::string& a, const std::string& b);

// Digest path when stored_key is a digest, legacy plaintext path otherwise.
bool verify_license_key(const std::string& provided_key, const std::string& stored_key);

// Both storage forms of a presented key, so a store lookup does not need to
// know which form a row uses.
struct LicenseLookupKeys {
    std::string plaintext;
    std::string digest;
};
LicenseLookupKeys license_lookup_keys(const std::string& license_key);

// Value a plaintext row should be rewritten to.
inline std::string migrate_key_to_hash(const std::string& plaintext_key) {
    return hash_license_key(plaintext_key);
}

std::string generate_license_key();

// Admin/UI form: first visible_chars, "...", last 4. Keys too short to keep at
// least 8 characters hidden are fully starred (mask_secret likewise).
std::string mask_license_key(const std::string& license_key, size_t visible_chars = 8);

// Log form: "****" + last visible_chars. Short values are fully starred.
std::string mask_secret(const std::string& value, size_t visible_chars = 4);

} // namespace gwauth
