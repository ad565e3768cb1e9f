/*
gwauth_keygen
=============

Issues license keys and admin keys for gwauth.

  gwauth_keygen                 new license key: key, digest, masked form
  gwauth_keygen --hash <key>    digest of an existing key (plaintext row migration)
  gwauth_keygen --admin         new admin key plus a GWAUTH_ADMIN_KEY_HASH line

Only the digest belongs in credentials.json / gateway.json. The key itself is
shown once and must be handed to its owner out of band.
*/

#include <cstring>
#include <iostream>
#include <string>

#include <sodium.h>

#include "license_key.h"

static void usage() {
    std::cerr << "usage: gwauth_keygen [--hash <key> | --admin]" << std::endl;
}

int main(int argc, char** argv) {
    if (sodium_init() < 0) {
        std::cerr << "FATAL: sodium_init failed" << std::endl;
        return 1;
    }

    if (argc == 3 && std::strcmp(argv[1], "--hash") == 0) {
        const std::string key = argv[2];
        if (gwauth::is_hashed_key(key)) {
            std::cerr << "already a digest" << std::endl;
            return 2;
        }
        std::cout << gwauth::migrate_key_to_hash(key) << std::endl;
        return 0;
    }

    if (argc == 2 && std::strcmp(argv[1], "--admin") == 0) {
        const std::string key = gwauth::generate_license_key();
        std::cout << "# admin key (give to the operator, do not store):" << std::endl;
        std::cout << "# " << key << std::endl;
        std::cout << "export GWAUTH_ADMIN_KEY_HASH=" << gwauth::hash_license_key(key) << std::endl;
        return 0;
    }

    if (argc != 1) {
        usage();
        return 2;
    }

    const std::string key = gwauth::generate_license_key();
    std::cout << "license_key=" << key << std::endl;
    std::cout << "stored_digest=" << gwauth::hash_license_key(key) << std::endl;
    std::cout << "masked=" << gwauth::mask_license_key(key) << std::endl;
    return 0;
}
