// Regression test: license key hashing, dual-path verification, generation and
// masking must stay compatible with rows already stored in credentials.json.

#include <sodium.h>

#include <cstdio>
#include <set>
#include <string>

#include "license_key.h"

static int failures = 0;

static void check(bool cond, const char* what) {
    if (!cond) {
        std::fprintf(stderr, "FAIL: %s\n", what);
        failures++;
    }
}

static bool url_safe(const std::string& s) {
    for (char c : s) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) return false;
    }
    return true;
}

static void test_hash() {
    // SHA-256("abc"), surrounding whitespace is not part of the key.
    const std::string want = "sha256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    check(gwauth::hash_license_key("abc") == want, "hash of abc");
    check(gwauth::hash_license_key("  abc \n") == want, "hash trims whitespace");
    check(gwauth::hash_license_key("abd") != want, "different key, different digest");

    check(gwauth::is_hashed_key(want), "digest is recognised");
    check(!gwauth::is_hashed_key("lic_abc"), "plaintext is not a digest");
    check(!gwauth::is_hashed_key("sha256"), "prefix without colon");
    check(!gwauth::is_hashed_key(""), "empty is not a digest");
    std::printf("[hash] OK\n");
}

static void test_verify() {
    const std::string key = "lic_0123456789abcdefghijABCDEFGHIJ-_";
    const std::string other = "lic_0123456789abcdefghijABCDEFGHIJ-X";

    check(gwauth::verify_license_key(key, gwauth::hash_license_key(key)), "digest path accepts key");
    check(!gwauth::verify_license_key(key, gwauth::hash_license_key(other)), "digest path rejects other key");
    check(gwauth::verify_license_key(key, key), "legacy plaintext path accepts key");
    check(!gwauth::verify_license_key(key, other), "legacy plaintext path rejects other key");
    check(!gwauth::verify_license_key("", gwauth::hash_license_key(key)), "blank key rejected");
    check(!gwauth::verify_license_key(key, ""), "blank stored value rejected");

    // A digest cannot be presented as the key itself.
    const std::string digest = gwauth::hash_license_key(key);
    check(!gwauth::verify_license_key(digest, digest), "digest as key rejected");

    const gwauth::LicenseLookupKeys lk = gwauth::license_lookup_keys(key);
    check(lk.plaintext == key, "lookup plaintext form");
    check(lk.digest == digest, "lookup digest form");
    check(gwauth::migrate_key_to_hash(key) == digest, "migration writes the digest");

    check(gwauth::ct_equal("abc", "abc"), "ct_equal equal");
    check(!gwauth::ct_equal("abc", "abd"), "ct_equal differs");
    check(!gwauth::ct_equal("abc", "abcd"), "ct_equal length mismatch");
    check(gwauth::ct_equal("", ""), "ct_equal both empty");
    std::printf("[verify] OK\n");
}

static void test_generate() {
    std::set<std::string> seen;
    for (int i = 0; i < 200; i++) {
        const std::string k = gwauth::generate_license_key();
        check(k.size() == 4 + gwauth::kLicenseKeyRandomChars, "key length");
        check(k.compare(0, 4, gwauth::kLicenseKeyPrefix) == 0, "key prefix");
        check(url_safe(k.substr(4)), "key body is URL-safe");
        seen.insert(k);
    }
    check(seen.size() == 200, "keys are unique");
    std::printf("[generate] OK\n");
}

static void test_mask() {
    const std::string key = "lic_AbCdEfGhIjKlMnOpQrStUvWxYz012345";
    const std::string m = gwauth::mask_license_key(key);
    check(m == "lic_AbCd...2345", "license mask shape");
    check(m.find("EfGh") == std::string::npos, "license mask hides the middle");

    check(gwauth::mask_license_key("lic_short") == "*********", "short key fully starred");
    check(gwauth::mask_license_key("") == "", "empty key");

    check(gwauth::mask_secret("supersecretvalue1234") == "****1234", "secret mask shape");
    check(gwauth::mask_secret("abc123") == "******", "short secret fully starred");

    // At least 8 characters stay hidden: 8 + 4 shown needs 20, 4 shown needs 12.
    check(gwauth::mask_license_key("lic_0123456789abcde") == std::string(19, '*'), "19-char key fully starred");
    check(gwauth::mask_license_key("lic_0123456789abcdef") == "lic_0123...cdef", "20-char key masked");
    check(gwauth::mask_secret("0123456789a") == std::string(11, '*'), "11-char secret fully starred");
    check(gwauth::mask_secret("0123456789ab") == "****89ab", "12-char secret masked");
    std::printf("[mask] OK\n");
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 2;
    }

    test_hash();
    test_verify();
    test_generate();
    test_mask();

    if (failures) {
        std::fprintf(stderr, "[license_key] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[license_key] ALL OK\n");
    return 0;
}
