#include "gateway_config.h"
#include "gwauth_util.h"
#include "license_key.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace gwauth {

static std::optional<long> parse_long(const std::string& s) {
    const std::string t = trim_ws(s);
    if (t.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end == t.c_str() || *end != '\0') return std::nullopt;
    return v;
}

static void set_int(const char* name, const std::optional<long>& v, long lo, long hi, int& out) {
    if (!v || *v < lo || *v > hi) {
        std::cerr << "[config] WARNING: invalid " << name << ", keeping " << out << std::endl;
        return;
    }
    out = static_cast<int>(*v);
}

static void set_ms(const char* name, const std::optional<long>& v, std::chrono::milliseconds& out) {
    if (!v || *v < 0 || *v > 60000) {
        std::cerr << "[config] WARNING: invalid " << name << ", keeping " << out.count() << std::endl;
        return;
    }
    out = std::chrono::milliseconds(*v);
}

static bool valid_level(const std::string& s) {
    const std::string v = lower_ascii(trim_ws(s));
    return v == "debug" || v == "info" || v == "admin" || v == "security";
}

static std::optional<long> json_long(const json& j) {
    if (j.is_number_integer()) return j.get<long>();
    if (j.is_string()) return parse_long(j.get<std::string>());
    return std::nullopt;
}

bool apply_config_file(const std::string& path, GatewayConfig& cfg) {
    std::ifstream f(path);
    if (!f.good()) {
        std::cerr << "[config] cannot open " << path << std::endl;
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        std::cerr << "[config] parse error in " << path << ": " << e.what() << std::endl;
        return false;
    }
    if (!j.is_object()) {
        std::cerr << "[config] invalid format in " << path << " (expected object)" << std::endl;
        return false;
    }

    auto str = [&](const char* key, std::string& out) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        if (!it->is_string()) {
            std::cerr << "[config] WARNING: " << key << " must be a string" << std::endl;
            return;
        }
        out = it->get<std::string>();
    };

    if (j.contains("listen_port")) set_int("listen_port", json_long(j["listen_port"]), 1, 65535, cfg.listen_port);
    if (j.contains("threads")) set_int("threads", json_long(j["threads"]), 1, 256, cfg.threads);

    if (j.contains("trusted_proxies")) {
        const json& tp = j["trusted_proxies"];
        if (tp.is_array()) {
            std::string joined;
            for (const auto& e : tp) {
                if (!e.is_string()) {
                    std::cerr << "[config] WARNING: non-string trusted_proxies entry dropped" << std::endl;
                    continue;
                }
                if (!joined.empty()) joined += ",";
                joined += e.get<std::string>();
            }
            cfg.trusted_proxies = joined;
        } else {
            str("trusted_proxies", cfg.trusted_proxies);
        }
    }

    str("credentials_path", cfg.credentials_path);
    str("tenants_path", cfg.tenants_path);
    str("audit_dir", cfg.audit_dir);
    str("admin_key_hash", cfg.admin_key_hash);

    std::string lvl;
    str("audit_min_level", lvl);
    if (!lvl.empty()) {
        if (valid_level(lvl)) cfg.audit_min_level = lvl;
        else std::cerr << "[config] WARNING: invalid audit_min_level " << lvl << std::endl;
    }

    if (j.contains("license_min_ms"))
        set_ms("license_min_ms", json_long(j["license_min_ms"]), cfg.license_contract.min_delay);
    if (j.contains("license_jitter_ms"))
        set_ms("license_jitter_ms", json_long(j["license_jitter_ms"]), cfg.license_contract.max_jitter);

    return true;
}

void apply_config_env(GatewayConfig& cfg) {
    if (const char* v = std::getenv("GWAUTH_LISTEN_PORT")) set_int("GWAUTH_LISTEN_PORT", parse_long(v), 1, 65535, cfg.listen_port);
    if (const char* v = std::getenv("GWAUTH_THREADS")) set_int("GWAUTH_THREADS", parse_long(v), 1, 256, cfg.threads);
    if (const char* v = std::getenv("GWAUTH_TRUSTED_PROXIES")) cfg.trusted_proxies = v;
    if (const char* v = std::getenv("GWAUTH_CREDENTIALS_PATH")) cfg.credentials_path = v;
    if (const char* v = std::getenv("GWAUTH_TENANTS_PATH")) cfg.tenants_path = v;
    if (const char* v = std::getenv("GWAUTH_AUDIT_DIR")) cfg.audit_dir = v;
    if (const char* v = std::getenv("GWAUTH_ADMIN_KEY_HASH")) cfg.admin_key_hash = trim_ws(v);

    if (const char* v = std::getenv("GWAUTH_AUDIT_MIN_LEVEL")) {
        if (valid_level(v)) cfg.audit_min_level = v;
        else std::cerr << "[config] WARNING: invalid GWAUTH_AUDIT_MIN_LEVEL " << v << std::endl;
    }

    if (const char* v = std::getenv("GWAUTH_LICENSE_MIN_MS"))
        set_ms("GWAUTH_LICENSE_MIN_MS", parse_long(v), cfg.license_contract.min_delay);
    if (const char* v = std::getenv("GWAUTH_LICENSE_JITTER_MS"))
        set_ms("GWAUTH_LICENSE_JITTER_MS", parse_long(v), cfg.license_contract.max_jitter);
}

GatewayConfig load_gateway_config(const std::string& path) {
    GatewayConfig cfg;

    if (!path.empty()) {
        std::ifstream exists(path);
        if (exists.good()) {
            exists.close();
            if (!apply_config_file(path, cfg))
                std::cerr << "[config] WARNING: using defaults for unread settings" << std::endl;
        } else {
            std::cerr << "[config] no " << path << ", using defaults" << std::endl;
        }
    }

    apply_config_env(cfg);

    if (!cfg.admin_key_hash.empty() && !is_hashed_key(cfg.admin_key_hash)) {
        std::cerr << "[config] WARNING: admin_key_hash is not a sha256: digest; /admin/reload disabled" << std::endl;
        cfg.admin_key_hash.clear();
    }
    return cfg;
}

} // namespace gwauth
