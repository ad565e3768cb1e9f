#pragma once
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "license_key.h"

namespace gwauth {

// Failure classes raised by stores. Everything except `transient` is a
// verdict about the credential and ends up as the generic denial.
enum class StoreErrc {
    insufficient_balance,
    invalid_credential,
    inactive,
    expired,
    transient,
};

const char* store_errc_str(StoreErrc c);

class StoreError : public std::runtime_error {
public:
    StoreError(StoreErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    StoreErrc code() const { return code_; }

private:
    StoreErrc code_;
};

struct LicenseRecord {
    std::string id;
    std::string tenant_id;
    std::string app_id;

    // Digest ("sha256:...") or legacy plaintext key.
    std::string stored_key;

    bool is_active = false;
    std::optional<long> expires_at;   // epoch seconds; nullopt = never
    long credits_remaining = 0;
};

/*
Credential store interface
==========================

fetch():
- looks a presented key up under both storage forms (plaintext, digest)
- returns nullopt when no row matches
- throws StoreError(transient) when the backend cannot answer

deduct():
- atomically subtracts `amount` from the matching row's allowance and returns
  what remains
- throws StoreError with invalid_credential / inactive / expired /
  insufficient_balance / transient

Implementations never retry; one call, one answer.
*/
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    virtual std::optional<LicenseRecord> fetch(const LicenseLookupKeys& keys) = 0;
    virtual long deduct(const LicenseLookupKeys& keys, long amount) = 0;
};

/*
JSON-file credential store.

Expected format:
{
  "licenses": [
    { "id": "<string>", "tenant_id": "<string>", "app_id": "<string>",
      "license_key": "sha256:<hex>" | "<legacy plaintext>",
      "is_active": true, "expires_at": "2027-01-01T00:00:00Z" | null,
      "credits_remaining": 100 }
  ]
}

Rows without id, tenant_id or license_key are skipped with a warning. A row
whose expires_at cannot be parsed is loaded as already expired.
*/
class JsonCredentialStore : public CredentialStore {
public:
    JsonCredentialStore() = default;

    // Returns false on I/O or format errors; the previous contents stay active.
    bool load(const std::string& path);

    // Persist current rows (tmp + rename). Uses the path given to load().
    bool save() const;

    // Insert or replace by stored_key (keygen tooling, tests).
    void put(const LicenseRecord& r);

    // While unavailable every call throws StoreError(transient).
    void set_available(bool on);

    size_t size() const;

    std::optional<LicenseRecord> fetch(const LicenseLookupKeys& keys) override;
    long deduct(const LicenseLookupKeys& keys, long amount) override;

private:
    const LicenseRecord* find_locked_(const LicenseLookupKeys& keys) const;
    bool save_locked_() const;

    mutable std::mutex mu_;
    std::string path_;
    bool available_ = true;

    // stored_key -> record
    std::unordered_map<std::string, LicenseRecord> rows_;
};

} // namespace gwauth
