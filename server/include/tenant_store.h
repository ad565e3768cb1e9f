#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "ip_policy.h"

namespace gwauth {

struct TenantRecord {
    std::string id;
    bool is_active = true;
    AccessPolicy allowed_ips;   // nullopt = allow all
};

// Per-tenant access policy lookup.
// fetch() returns nullopt for unknown tenants and throws
// StoreError(transient) when the backend cannot answer.
class TenantPolicyStore {
public:
    virtual ~TenantPolicyStore() = default;

    virtual std::optional<TenantRecord> fetch(const std::string& tenant_id) = 0;
};

/*
JSON-file tenant store.

Expected format:
{
  "tenants": [
    { "id": "<string>", "is_active": true,
      "allowed_ips": null | [] | ["203.0.113.0/24", "2001:db8::1"] }
  ]
}

Snapshot model
--------------
Each load() builds a complete, immutable table and publishes it with an atomic
shared_ptr store. fetch() takes an atomic load and never locks, so readers on
every IO thread run concurrently with a reload; a reader keeps the snapshot it
started with.

allowed_ips that is neither null nor an array is loaded as [] (deny all) with
a warning. Non-string entries inside the array are dropped with a warning.
*/
class JsonTenantPolicyStore : public TenantPolicyStore {
public:
    using Table = std::unordered_map<std::string, TenantRecord>;

    JsonTenantPolicyStore();

    // Returns false on I/O or format errors; the current snapshot stays active.
    bool load(const std::string& path);

    // Re-read the path given to the last successful load().
    bool reload();

    // Publish a prepared table (tests, programmatic setups).
    void publish(Table table);

    // While unavailable every fetch throws StoreError(transient).
    void set_available(bool on) { available_.store(on); }

    size_t size() const;

    std::optional<TenantRecord> fetch(const std::string& tenant_id) override;

private:
    std::shared_ptr<const Table> snapshot_;
    std::string path_;
    std::atomic<bool> available_{true};
};

} // namespace gwauth
