#include "credential_store.h"
#include "gwauth_util.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace gwauth {

const char* store_errc_str(StoreErrc c) {
    switch (c) {
        case StoreErrc::insufficient_balance: return "insufficient_balance";
        case StoreErrc::invalid_credential:   return "invalid_credential";
        case StoreErrc::inactive:             return "inactive";
        case StoreErrc::expired:              return "expired";
        case StoreErrc::transient:            return "transient";
    }
    return "unknown";
}

/*
Load the license table.

Operational notes:
- The table is built in a temporary map and swapped in on success, so a failed
  reload never leaves a half-loaded table behind.
- Duplicate license_key values: last row wins (logged).
*/
bool JsonCredentialStore::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) {
        std::cerr << "[credentials] file not found: " << path << std::endl;
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[credentials] parse error: " << e.what() << std::endl;
        return false;
    }

    if (!j.is_object() || !j.contains("licenses") || !j["licenses"].is_array()) {
        std::cerr << "[credentials] invalid format (expected {\"licenses\": [...]})" << std::endl;
        return false;
    }

    std::unordered_map<std::string, LicenseRecord> tmp;

    for (const auto& row : j["licenses"]) {
        if (!row.is_object()) continue;

        LicenseRecord r;
        try {
            r.id = row.value("id", "");
            r.tenant_id = row.value("tenant_id", "");
            r.app_id = row.value("app_id", "");
            r.stored_key = trim_ws(row.value("license_key", ""));
            r.is_active = row.value("is_active", false);
            r.credits_remaining = row.value("credits_remaining", 0L);
        } catch (const json::exception& e) {
            std::cerr << "[credentials] WARNING: skipping malformed row: " << e.what() << std::endl;
            continue;
        }

        if (r.id.empty() || r.tenant_id.empty() || r.stored_key.empty()) {
            std::cerr << "[credentials] WARNING: skipping row without id/tenant_id/license_key" << std::endl;
            continue;
        }

        auto it = row.find("expires_at");
        if (it != row.end() && !it->is_null()) {
            std::optional<long> exp;
            if (it->is_string()) exp = parse_iso8601_utc(it->get<std::string>());
            else if (it->is_number_integer()) exp = it->get<long>();

            if (!exp) {
                std::cerr << "[credentials] WARNING: unparseable expires_at for license "
                          << r.id << "; treating as expired" << std::endl;
                exp = 0;
            }
            r.expires_at = exp;
        }

        if (tmp.count(r.stored_key))
            std::cerr << "[credentials] WARNING: duplicate key for license " << r.id << "; last row wins" << std::endl;
        tmp[r.stored_key] = r;
    }

    std::lock_guard<std::mutex> lk(mu_);
    rows_.swap(tmp);
    path_ = path;
    std::cerr << "[credentials] loaded " << rows_.size() << " licenses from " << path << std::endl;
    return true;
}

void JsonCredentialStore::put(const LicenseRecord& r) {
    std::lock_guard<std::mutex> lk(mu_);
    rows_[r.stored_key] = r;
}

void JsonCredentialStore::set_available(bool on) {
    std::lock_guard<std::mutex> lk(mu_);
    available_ = on;
}

size_t JsonCredentialStore::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return rows_.size();
}

const LicenseRecord* JsonCredentialStore::find_locked_(const LicenseLookupKeys& keys) const {
    // Legacy plaintext rows first, then digests.
    auto it = rows_.find(keys.plaintext);
    if (it != rows_.end()) return &it->second;

    it = rows_.find(keys.digest);
    if (it != rows_.end()) return &it->second;

    return nullptr;
}

std::optional<LicenseRecord> JsonCredentialStore::fetch(const LicenseLookupKeys& keys) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!available_) throw StoreError(StoreErrc::transient, "credential store unavailable");

    const LicenseRecord* r = find_locked_(keys);
    if (!r) return std::nullopt;
    return *r;
}

long JsonCredentialStore::deduct(const LicenseLookupKeys& keys, long amount) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!available_) throw StoreError(StoreErrc::transient, "credential store unavailable");

    const LicenseRecord* found = find_locked_(keys);
    if (!found) throw StoreError(StoreErrc::invalid_credential, "INVALID_LICENSE");

    LicenseRecord& r = rows_[found->stored_key];
    if (!r.is_active) throw StoreError(StoreErrc::inactive, "INACTIVE_LICENSE");
    if (r.expires_at && *r.expires_at < now_epoch()) throw StoreError(StoreErrc::expired, "EXPIRED_LICENSE");
    if (amount < 0 || r.credits_remaining < amount)
        throw StoreError(StoreErrc::insufficient_balance, "INSUFFICIENT_CREDITS");

    r.credits_remaining -= amount;
    const long remaining = r.credits_remaining;

    if (!path_.empty() && !save_locked_()) {
        // In-memory counter is authoritative for this process; the file catches up on the next save.
        std::cerr << "[credentials] WARNING: failed to persist balance for license " << r.id << std::endl;
    }
    return remaining;
}

bool JsonCredentialStore::save() const {
    std::lock_guard<std::mutex> lk(mu_);
    return save_locked_();
}

bool JsonCredentialStore::save_locked_() const {
    if (path_.empty()) return false;

    // Stable output ordering
    std::vector<const LicenseRecord*> rows;
    rows.reserve(rows_.size());
    for (const auto& kv : rows_) rows.push_back(&kv.second);
    std::sort(rows.begin(), rows.end(),
              [](const LicenseRecord* a, const LicenseRecord* b) { return a->id < b->id; });

    json j;
    j["licenses"] = json::array();
    for (const auto* r : rows) {
        json row{
            {"id", r->id},
            {"tenant_id", r->tenant_id},
            {"app_id", r->app_id},
            {"license_key", r->stored_key},
            {"is_active", r->is_active},
            {"credits_remaining", r->credits_remaining},
        };
        row["expires_at"] = r->expires_at ? json(*r->expires_at) : json(nullptr);
        j["licenses"].push_back(row);
    }

    std::filesystem::path p(path_);
    auto tmp = p;
    tmp += ".tmp";

    {
        std::ofstream out(tmp.string(), std::ios::trunc);
        if (!out.good()) return false;
        out << j.dump(2) << "\n";
        out.flush();
        if (!out.good()) return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    return !ec;
}

} // namespace gwauth
