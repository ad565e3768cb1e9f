#pragma once
#include <string>

#include "timing_envelope.h"

namespace gwauth {

/*
Gateway configuration
=====================

Sources, later wins:
  1. built-in defaults
  2. JSON file (GWAUTH_CONFIG_PATH, default config/gateway.json next to the repo)
  3. environment variables

{
  "listen_port": 8090,
  "threads": 4,
  "trusted_proxies": "10.0.0.0/8, 2001:db8::/32",
  "credentials_path": "config/credentials.json",
  "tenants_path": "config/tenants.json",
  "audit_dir": "audit",
  "audit_min_level": "ADMIN",
  "license_min_ms": 300,
  "license_jitter_ms": 50,
  "admin_key_hash": "sha256:..."
}

trusted_proxies may also be a JSON array of strings.

Environment overrides:
  GWAUTH_LISTEN_PORT, GWAUTH_THREADS, GWAUTH_TRUSTED_PROXIES,
  GWAUTH_CREDENTIALS_PATH, GWAUTH_TENANTS_PATH, GWAUTH_AUDIT_DIR,
  GWAUTH_AUDIT_MIN_LEVEL, GWAUTH_LICENSE_MIN_MS, GWAUTH_LICENSE_JITTER_MS,
  GWAUTH_ADMIN_KEY_HASH

Invalid values never abort startup: they are logged under [config] and the
previous value is kept.
*/
struct GatewayConfig {
    int listen_port = 8090;
    int threads = 4;

    // Raw comma-separated list; parsed by TrustedNetworkSet::parse().
    std::string trusted_proxies;

    std::string credentials_path = "config/credentials.json";
    std::string tenants_path = "config/tenants.json";
    std::string audit_dir = "audit";
    std::string audit_min_level = "ADMIN";

    TimingContract license_contract = timing::license_validation();

    // Digest of the admin key ("sha256:..."). Empty disables /admin/reload.
    std::string admin_key_hash;
};

// Returns false on a present but unreadable/invalid file; cfg keeps whatever
// was applied before the error.
bool apply_config_file(const std::string& path, GatewayConfig& cfg);

// Applies GWAUTH_* overrides from the process environment.
void apply_config_env(GatewayConfig& cfg);

// Defaults, then the file (if it exists), then the environment.
GatewayConfig load_gateway_config(const std::string& path);

} // namespace gwauth
