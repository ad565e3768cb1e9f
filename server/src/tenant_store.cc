#include "tenant_store.h"
#include "credential_store.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace gwauth {

JsonTenantPolicyStore::JsonTenantPolicyStore()
    : snapshot_(std::make_shared<Table>()) {}

static void parse_allowed_ips(const json& row, const std::string& tenant_id, AccessPolicy& out) {
    auto it = row.find("allowed_ips");
    if (it == row.end() || it->is_null()) {
        out = std::nullopt;
        return;
    }

    if (!it->is_array()) {
        std::cerr << "[tenants] WARNING: allowed_ips for " << tenant_id
                  << " is not a list; denying all addresses" << std::endl;
        out = std::vector<std::string>{};
        return;
    }

    std::vector<std::string> entries;
    for (const auto& e : *it) {
        if (!e.is_string()) {
            std::cerr << "[tenants] WARNING: non-string allowed_ips entry for " << tenant_id << " dropped" << std::endl;
            continue;
        }
        entries.push_back(e.get<std::string>());
    }
    out = std::move(entries);
}

bool JsonTenantPolicyStore::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) {
        std::cerr << "[tenants] file not found: " << path << std::endl;
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[tenants] parse error: " << e.what() << std::endl;
        return false;
    }

    if (!j.is_object() || !j.contains("tenants") || !j["tenants"].is_array()) {
        std::cerr << "[tenants] invalid format (expected {\"tenants\": [...]})" << std::endl;
        return false;
    }

    Table tmp;
    for (const auto& row : j["tenants"]) {
        if (!row.is_object()) continue;

        TenantRecord t;
        auto id = row.find("id");
        if (id == row.end() || !id->is_string() || id->get<std::string>().empty()) {
            std::cerr << "[tenants] WARNING: skipping tenant without id" << std::endl;
            continue;
        }
        t.id = id->get<std::string>();

        auto active = row.find("is_active");
        t.is_active = (active == row.end() || !active->is_boolean()) ? true : active->get<bool>();

        parse_allowed_ips(row, t.id, t.allowed_ips);
        tmp[t.id] = std::move(t);
    }

    const size_t n = tmp.size();
    publish(std::move(tmp));
    path_ = path;
    std::cerr << "[tenants] loaded " << n << " tenants from " << path << std::endl;
    return true;
}

bool JsonTenantPolicyStore::reload() {
    if (path_.empty()) return false;
    return load(path_);
}

void JsonTenantPolicyStore::publish(Table table) {
    std::atomic_store(&snapshot_, std::shared_ptr<const Table>(std::make_shared<Table>(std::move(table))));
}

size_t JsonTenantPolicyStore::size() const {
    return std::atomic_load(&snapshot_)->size();
}

std::optional<TenantRecord> JsonTenantPolicyStore::fetch(const std::string& tenant_id) {
    if (!available_.load()) throw StoreError(StoreErrc::transient, "tenant store unavailable");

    const auto snap = std::atomic_load(&snapshot_);
    auto it = snap->find(tenant_id);
    if (it == snap->end()) return std::nullopt;
    return it->second;
}

} // namespace gwauth
