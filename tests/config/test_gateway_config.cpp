// Gateway config regression test: defaults, JSON file, environment overrides
// and rejection of invalid values (previous value kept).

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "gateway_config.h"

static int failures = 0;

static void check(bool cond, const std::string& what) {
    if (!cond) {
        std::fprintf(stderr, "FAIL: %s\n", what.c_str());
        failures++;
    }
}

static const char* kEnvVars[] = {
    "GWAUTH_LISTEN_PORT", "GWAUTH_THREADS", "GWAUTH_TRUSTED_PROXIES",
    "GWAUTH_CREDENTIALS_PATH", "GWAUTH_TENANTS_PATH", "GWAUTH_AUDIT_DIR",
    "GWAUTH_AUDIT_MIN_LEVEL", "GWAUTH_LICENSE_MIN_MS", "GWAUTH_LICENSE_JITTER_MS",
    "GWAUTH_ADMIN_KEY_HASH",
};

static void clear_env() {
    for (const char* v : kEnvVars) ::unsetenv(v);
}

static void write_file(const std::string& path, const std::string& body) {
    std::ofstream f(path, std::ios::trunc);
    f << body;
}

int main() {
    clear_env();

    const auto dir = std::filesystem::temp_directory_path() /
                     ("gwauth_config_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    const std::string path = (dir / "gateway.json").string();

    // Defaults when the file is absent.
    {
        const gwauth::GatewayConfig c = gwauth::load_gateway_config((dir / "missing.json").string());
        check(c.listen_port == 8090, "default port");
        check(c.threads == 4, "default threads");
        check(c.trusted_proxies.empty(), "default trusts nobody");
        check(c.license_contract.min_delay.count() == 300, "default license floor");
        check(c.license_contract.max_jitter.count() == 50, "default license jitter");
        check(c.audit_min_level == "ADMIN", "default audit level");
        check(c.admin_key_hash.empty(), "default admin key");
        std::printf("[defaults] OK\n");
    }

    const std::string admin_hash = "sha256:" + std::string(64, 'a');
    write_file(path, R"({
        "listen_port": 9000,
        "threads": "8",
        "trusted_proxies": ["10.0.0.0/8", "2001:db8::/32", 7],
        "credentials_path": "/srv/creds.json",
        "tenants_path": "/srv/tenants.json",
        "audit_dir": "/var/log/gwauth",
        "audit_min_level": "security",
        "license_min_ms": 400,
        "license_jitter_ms": 80,
        "admin_key_hash": ")" + admin_hash + R"("
    })");

    {
        const gwauth::GatewayConfig c = gwauth::load_gateway_config(path);
        check(c.listen_port == 9000, "file port");
        check(c.threads == 8, "numeric string accepted");
        check(c.trusted_proxies == "10.0.0.0/8,2001:db8::/32", "array joined, non-string dropped");
        check(c.credentials_path == "/srv/creds.json", "file credentials path");
        check(c.tenants_path == "/srv/tenants.json", "file tenants path");
        check(c.audit_dir == "/var/log/gwauth", "file audit dir");
        check(c.audit_min_level == "security", "file audit level");
        check(c.license_contract.min_delay.count() == 400, "file license floor");
        check(c.license_contract.max_jitter.count() == 80, "file license jitter");
        check(c.admin_key_hash == admin_hash, "file admin hash");
        std::printf("[file] OK\n");
    }

    {
        ::setenv("GWAUTH_LISTEN_PORT", "9443", 1);
        ::setenv("GWAUTH_TRUSTED_PROXIES", "172.16.0.0/12", 1);
        ::setenv("GWAUTH_LICENSE_MIN_MS", "250", 1);
        ::setenv("GWAUTH_AUDIT_MIN_LEVEL", "DEBUG", 1);

        const gwauth::GatewayConfig c = gwauth::load_gateway_config(path);
        check(c.listen_port == 9443, "env port wins");
        check(c.trusted_proxies == "172.16.0.0/12", "env proxies win");
        check(c.license_contract.min_delay.count() == 250, "env floor wins");
        check(c.license_contract.max_jitter.count() == 80, "file jitter kept");
        check(c.audit_min_level == "DEBUG", "env level wins");
        clear_env();
        std::printf("[env] OK\n");
    }

    {
        ::setenv("GWAUTH_LISTEN_PORT", "99999", 1);
        ::setenv("GWAUTH_THREADS", "four", 1);
        ::setenv("GWAUTH_LICENSE_JITTER_MS", "-5", 1);
        ::setenv("GWAUTH_AUDIT_MIN_LEVEL", "loud", 1);
        ::setenv("GWAUTH_ADMIN_KEY_HASH", "plaintext-admin-key", 1);

        const gwauth::GatewayConfig c = gwauth::load_gateway_config(path);
        check(c.listen_port == 9000, "out-of-range port ignored");
        check(c.threads == 8, "non-numeric threads ignored");
        check(c.license_contract.max_jitter.count() == 80, "negative jitter ignored");
        check(c.audit_min_level == "security", "unknown level ignored");
        check(c.admin_key_hash.empty(), "non-digest admin key disables reload");
        clear_env();
        std::printf("[invalid] OK\n");
    }

    {
        write_file(path, "{ not json");
        gwauth::GatewayConfig c;
        check(!gwauth::apply_config_file(path, c), "broken file reported");
        check(c.listen_port == 8090, "broken file leaves defaults");

        const gwauth::GatewayConfig d = gwauth::load_gateway_config(path);
        check(d.listen_port == 8090, "load survives broken file");
        std::printf("[broken] OK\n");
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    if (failures) {
        std::fprintf(stderr, "[config] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[config] ALL OK\n");
    return 0;
}
