/*
gwauth gateway server
=====================

Front gate of a multi-tenant API gateway. For every inbound call it decides:
- which client address to believe, given a possibly spoofed X-Forwarded-For
  chain and the configured trusted proxy networks;
- whether the tenant's IP allow-list admits that address;
- whether the presented license key exists, is active, unexpired and funded.

Security goals
--------------
1) No trust in forwarded headers from untrusted peers.
2) No oracle: every denial cause produces the same status and body bytes.
3) No timing oracle: credential-bearing calls complete on a fixed floor plus
   random jitter, implemented with event-loop timers (no sleeping workers).
4) Keys at rest are SHA-256 digests; legacy plaintext rows still verify.
5) Auditable: every verdict goes to a hash-chained JSONL log with the specific
   cause, which clients never see.

Reload
------
SIGHUP or POST /admin/reload re-reads the trusted proxy list and the tenant
file and swaps both snapshots. Credential balances are not reloaded; the
credential file is written by the server itself.
*/

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <limits.h>
#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>
#include <vector>

#include <sodium.h>
#include <drogon/drogon.h>

#include "audit_log.h"
#include "credential_store.h"
#include "gate_filter.h"
#include "gatekeeper.h"
#include "gateway_config.h"
#include "gwauth_util.h"
#include "routes_gateway.h"
#include "tenant_store.h"
#include "timing_envelope.h"
#include "trusted_proxy.h"

static std::string exe_dir() {
    char buf[PATH_MAX] = {0};
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    std::string p(buf, (size_t)n);
    return std::filesystem::path(p).parent_path().string();
}

// REPO_ROOT is derived from the running binary location:
// build/bin/gwauth_server -> REPO_ROOT = build/bin/../../ = repo root
static const std::string REPO_ROOT = std::filesystem::weakly_canonical(
    std::filesystem::path(exe_dir()) / ".." / ".."
).string();

// Relative config paths are taken from the repo root, not the cwd.
static std::string repo_path(const std::string& p) {
    if (p.empty() || std::filesystem::path(p).is_absolute()) return p;
    return (std::filesystem::path(REPO_ROOT) / p).string();
}

static std::atomic<bool> g_reload_requested{false};

static void on_sighup(int) {
    g_reload_requested.store(true);
}

// Parse the trusted proxy list and record every rejected entry.
static gwauth::TrustedNetworkSetPtr build_trusted(const std::string& csv, gwauth::AuditLog& audit) {
    std::vector<std::string> rejected;
    auto set = std::make_shared<const gwauth::TrustedNetworkSet>(
        gwauth::TrustedNetworkSet::parse(csv, &rejected));

    for (const auto& bad : rejected) {
        gwauth::AuditEvent ev;
        ev.event = "config.trusted_proxy_invalid";
        ev.outcome = "fail";
        ev.f["entry"] = bad;
        audit.append(ev, gwauth::AuditLog::MinLevel::ADMIN);
    }

    std::cerr << "[trusted_proxy] " << set->size() << " trusted networks, "
              << rejected.size() << " rejected" << std::endl;
    return set;
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "FATAL: sodium_init failed" << std::endl;
        return 1;
    }

    std::string config_path = (std::filesystem::path(REPO_ROOT) / "config" / "gateway.json").string();
    if (const char* p = std::getenv("GWAUTH_CONFIG_PATH")) config_path = p;

    const gwauth::GatewayConfig cfg = gwauth::load_gateway_config(config_path);

    // ---- Audit log (hash-chained JSONL) ----
    const std::string audit_dir = repo_path(cfg.audit_dir);
    try {
        std::filesystem::create_directories(audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    gwauth::AuditLog audit(audit_dir + "/gwauth_audit.jsonl", audit_dir + "/gwauth_audit.state");
    if (!audit.set_min_level_str(cfg.audit_min_level)) {
        std::cerr << "[settings] WARNING: invalid audit_min_level " << cfg.audit_min_level << std::endl;
    }
    std::cerr << "[settings] audit_min_level=" << audit.min_level_str() << std::endl;

    // ---- Stores ----
    const std::string credentials_path = repo_path(cfg.credentials_path);
    const std::string tenants_path = repo_path(cfg.tenants_path);

    gwauth::JsonCredentialStore credentials;
    if (!credentials.load(credentials_path)) {
        std::cerr << "FATAL: cannot load credentials from " << credentials_path << std::endl;
        return 2;
    }

    gwauth::JsonTenantPolicyStore tenants;
    if (!tenants.load(tenants_path)) {
        std::cerr << "[tenants] WARNING: no tenant policies loaded; tenant-scoped calls are denied" << std::endl;
    }

    // ---- Gate ----
    auto& app = drogon::app();
    gwauth::LoopDelayScheduler scheduler(app.getLoop());
    gwauth::TimingEnvelope envelope(scheduler);

    gwauth::Gatekeeper gate(build_trusted(cfg.trusted_proxies, audit),
                            credentials, tenants, envelope, &audit, cfg.license_contract);

    std::cerr << "[gate] license contract min_ms=" << cfg.license_contract.min_delay.count()
              << " jitter_ms=" << cfg.license_contract.max_jitter.count() << std::endl;

    // ---- Reload ----
    std::mutex reload_mu;
    auto reload = [&](const char* trigger, std::string* summary) -> bool {
        std::lock_guard<std::mutex> lk(reload_mu);

        const gwauth::GatewayConfig fresh = gwauth::load_gateway_config(config_path);
        gate.set_trusted(build_trusted(fresh.trusted_proxies, audit));

        bool ok = true;
        if (!std::filesystem::exists(tenants_path)) {
            // Keep the old snapshot but stop serving from it.
            tenants.set_available(false);
            ok = false;
        } else if (tenants.load(tenants_path)) {
            tenants.set_available(true);
        } else {
            ok = false;
        }

        const std::string s = "trusted=" + std::to_string(gate.trusted()->size())
                            + " tenants=" + std::to_string(tenants.size())
                            + (ok ? "" : " tenants_reload_failed");
        if (summary) *summary = s;
        std::cerr << "[reload] " << trigger << ": " << s << std::endl;
        return ok;
    };

    std::signal(SIGHUP, on_sighup);
    app.getLoop()->runEvery(1.0, [&]() {
        if (!g_reload_requested.exchange(false)) return;

        std::string summary;
        const bool ok = reload("signal", &summary);

        gwauth::AuditEvent ev;
        ev.event = "config.reload";
        ev.outcome = ok ? "ok" : "fail";
        ev.f["trigger"] = "signal";
        ev.f["summary"] = summary;
        audit.append(ev, gwauth::AuditLog::MinLevel::ADMIN);
    });

    // ---- HTTP ----
    gwauth::install_client_ip_advice(gate);

    gwauth::GatewayRoutesContext ctx;
    ctx.gate = &gate;
    ctx.envelope = &envelope;
    ctx.audit = &audit;
    ctx.admin_key_hash = cfg.admin_key_hash;
    ctx.reload = [&](std::string* summary) { return reload("http", summary); };
    if (ctx.admin_key_hash.empty())
        std::cerr << "[settings] no admin_key_hash; /admin/reload always denies" << std::endl;

    gwauth::register_gateway_routes(ctx);

    std::cerr << "gwauth server listening on 0.0.0.0:" << cfg.listen_port
              << " threads=" << cfg.threads << std::endl;
    app.addListener("0.0.0.0", (uint16_t)cfg.listen_port)
       .setThreadNum((size_t)cfg.threads)
       .run();
    return 0;
}
