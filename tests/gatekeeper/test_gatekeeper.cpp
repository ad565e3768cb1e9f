// Gatekeeper regression test.
//
// What it tests:
// 1) every denial cause is reported with its own audit reason but renders to
//    the same public status and body bytes
// 2) unknown tenant and expired credential have latency means within 25%
// 3) store outages surface as Verdict::unavailable (503), once, no retry
// 4) charge() deducts inside the gate and maps store errors to denials
// 5) resolution follows the trusted proxy snapshot swapped with set_trusted()
// 6) the audit log chain verifies and never contains a raw key
//
// Stores are the JSON-backed ones fed in memory; delays run on a trantor loop.

#include <sodium.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <string>
#include <unistd.h>

#include <trantor/net/EventLoopThread.h>

#include "audit_log.h"
#include "credential_store.h"
#include "gatekeeper.h"
#include "gwauth_util.h"
#include "license_key.h"
#include "tenant_store.h"
#include "timing_envelope.h"
#include "trusted_proxy.h"

using namespace std::chrono;

static int failures = 0;

static void check(bool cond, const std::string& what) {
    if (!cond) {
        std::fprintf(stderr, "FAIL: %s\n", what.c_str());
        failures++;
    }
}

static const gwauth::TimingContract kContract{milliseconds(100), milliseconds(20), true};

// Keys issued for the fixture. Rows store digests except the legacy one.
static const std::string K_ACME     = "lic_acme-active-key-0000000000000000";
static const std::string K_LEGACY   = "lic_globex-legacy-plain-000000000000";
static const std::string K_INACTIVE = "lic_acme-inactive-key-00000000000000";
static const std::string K_EXPIRED  = "lic_acme-expired-key-000000000000000";
static const std::string K_EMPTY    = "lic_acme-no-credits-key-000000000000";
static const std::string K_GHOST    = "lic_ghost-tenant-key-000000000000000";
static const std::string K_BLOCKED  = "lic_globex-hashed-key-00000000000000";
static const std::string K_SLEEPY   = "lic_initech-key-0000000000000000000";

struct Fixture {
    gwauth::JsonCredentialStore creds;
    gwauth::JsonTenantPolicyStore tenants;

    Fixture() {
        add("L1", "acme", K_ACME, true, std::nullopt, 100, true);
        add("L2", "globex", K_LEGACY, true, std::nullopt, 10, false);
        add("L3", "acme", K_INACTIVE, false, std::nullopt, 10, true);
        add("L4", "acme", K_EXPIRED, true, gwauth::now_epoch() - 3600, 10, true);
        add("L5", "acme", K_EMPTY, true, std::nullopt, 0, true);
        add("L6", "ghost", K_GHOST, true, std::nullopt, 10, true);
        add("L7", "globex", K_BLOCKED, true, gwauth::now_epoch() + 86400, 10, true);
        add("L8", "initech", K_SLEEPY, true, std::nullopt, 10, true);

        gwauth::JsonTenantPolicyStore::Table t;
        t["acme"] = gwauth::TenantRecord{"acme", true, std::nullopt};
        t["globex"] = gwauth::TenantRecord{"globex", true, std::vector<std::string>{"203.0.113.0/24"}};
        t["initech"] = gwauth::TenantRecord{"initech", false, std::nullopt};
        tenants.publish(std::move(t));
    }

    void add(const std::string& id, const std::string& tenant, const std::string& key,
             bool active, std::optional<long> exp, long credits, bool hashed) {
        gwauth::LicenseRecord r;
        r.id = id;
        r.tenant_id = tenant;
        r.app_id = "app";
        r.stored_key = hashed ? gwauth::hash_license_key(key) : key;
        r.is_active = active;
        r.expires_at = exp;
        r.credits_remaining = credits;
        creds.put(r);
    }
};

struct Timed {
    gwauth::GateDecision d;
    long long elapsed_ms = 0;
};

static Timed run_check(gwauth::Gatekeeper& gate, const gwauth::GateRequest& req) {
    std::promise<Timed> p;
    auto fut = p.get_future();
    const auto t0 = steady_clock::now();
    gate.check(req, [&p, t0](const gwauth::GateDecision& d) {
        p.set_value(Timed{d, duration_cast<milliseconds>(steady_clock::now() - t0).count()});
    });
    return fut.get();
}

static Timed run_charge(gwauth::Gatekeeper& gate, const gwauth::GateRequest& req, long amount) {
    std::promise<Timed> p;
    auto fut = p.get_future();
    const auto t0 = steady_clock::now();
    gate.charge(req, amount, [&p, t0](const gwauth::GateDecision& d) {
        p.set_value(Timed{d, duration_cast<milliseconds>(steady_clock::now() - t0).count()});
    });
    return fut.get();
}

static gwauth::GateRequest req_with(const std::string& key, const std::string& tenant = "",
                                    const std::string& direct = "198.51.100.1",
                                    const std::string& xff = "") {
    gwauth::GateRequest r;
    r.direct_addr = direct;
    r.forwarded_for = xff;
    r.license_key = key;
    r.tenant_id = tenant;
    r.user_agent = "gwauth-test";
    return r;
}

static void test_allow(gwauth::Gatekeeper& gate) {
    const Timed t = run_check(gate, req_with(K_ACME));
    check(t.d.verdict == gwauth::Verdict::allowed, "acme key allowed");
    check(t.d.tenant_id == "acme", "tenant taken from credential");
    check(t.d.license && t.d.license->license_id == "L1", "license id exposed");
    check(t.d.license && t.d.license->key_masked == gwauth::mask_license_key(K_ACME), "masked key");
    check(t.d.client_ip == "198.51.100.1", "direct peer used");
    check(t.elapsed_ms >= 100, "allow waits for the floor");

    // Padding and whitespace around the header value.
    check(run_check(gate, req_with("  " + K_ACME + " ")).d.allowed(), "trimmed key allowed");

    // Legacy plaintext row, globex allow-list, client behind a trusted proxy.
    const Timed legacy = run_check(gate, req_with(K_LEGACY, "globex", "10.0.0.5", "203.0.113.44, 10.0.0.9"));
    check(legacy.d.allowed(), "legacy plaintext row allowed");
    check(legacy.d.client_ip == "203.0.113.44", "client ip from forwarded chain");

    // Tenant-scoped call without a credential: IP policy only.
    gwauth::GateRequest tenant_only = req_with("", "globex", "10.0.0.5", "203.0.113.7");
    tenant_only.require_credential = false;
    check(run_check(gate, tenant_only).d.allowed(), "tenant-only call allowed from allow-listed ip");

    std::printf("[allow] OK (%lldms)\n", t.elapsed_ms);
}

static void test_uniform_denials(gwauth::Gatekeeper& gate) {
    struct Case {
        const char* name;
        gwauth::GateRequest req;
        gwauth::DenyReason want;
    };

    gwauth::GateRequest spoofed = req_with(K_BLOCKED, "globex", "198.51.100.1", "203.0.113.44");
    gwauth::GateRequest tenant_only_blocked = req_with("", "globex");
    tenant_only_blocked.require_credential = false;

    const Case cases[] = {
        {"missing_credential",   req_with(""),                         gwauth::DenyReason::missing_credential},
        {"unknown_key",          req_with("lic_nobody-0000000000000000000000"), gwauth::DenyReason::credential_invalid},
        {"digest_as_key",        req_with(gwauth::hash_license_key(K_ACME)), gwauth::DenyReason::credential_invalid},
        {"inactive",             req_with(K_INACTIVE),                 gwauth::DenyReason::credential_inactive},
        {"expired",              req_with(K_EXPIRED),                  gwauth::DenyReason::credential_expired},
        {"no_credits",           req_with(K_EMPTY),                    gwauth::DenyReason::insufficient_balance},
        {"tenant_mismatch",      req_with(K_ACME, "globex"),           gwauth::DenyReason::tenant_mismatch},
        {"tenant_unknown",       req_with(K_GHOST),                    gwauth::DenyReason::tenant_unknown},
        {"tenant_inactive",      req_with(K_SLEEPY),                   gwauth::DenyReason::tenant_inactive},
        {"ip_blocked",           req_with(K_BLOCKED),                  gwauth::DenyReason::ip_blocked},
        {"spoofed_xff_ignored",  spoofed,                              gwauth::DenyReason::ip_blocked},
        {"tenant_only_blocked",  tenant_only_blocked,                  gwauth::DenyReason::ip_blocked},
    };

    const gwauth::PublicError ref = gwauth::public_error(gwauth::Verdict::denied);
    check(ref.status == 403, "denial status");
    check(ref.body == R"({"ok":false,"error":"access_denied","message":"Access denied"})", "denial body");

    for (const auto& c : cases) {
        const Timed t = run_check(gate, c.req);
        const gwauth::PublicError e = gwauth::public_error(t.d.verdict);
        bool good = true;

        if (t.d.verdict != gwauth::Verdict::denied) { check(false, std::string(c.name) + ": not denied"); good = false; }
        if (t.d.reason != c.want) {
            check(false, std::string(c.name) + ": reason " + gwauth::deny_reason_str(t.d.reason));
            good = false;
        }
        if (e.status != ref.status || e.body != ref.body) { check(false, std::string(c.name) + ": public error differs"); good = false; }
        if (t.d.license) { check(false, std::string(c.name) + ": license info leaked"); good = false; }
        if (t.elapsed_ms < 100) { check(false, std::string(c.name) + ": answered before the floor"); good = false; }

        if (good) std::printf("[%s] OK (%lldms)\n", c.name, t.elapsed_ms);
    }
}

static double mean_latency(gwauth::Gatekeeper& gate, const gwauth::GateRequest& req, int n) {
    double sum = 0;
    for (int i = 0; i < n; i++) sum += (double)run_check(gate, req).elapsed_ms;
    return sum / n;
}

static void test_latency_parity(gwauth::Gatekeeper& gate) {
    const double unknown_tenant = mean_latency(gate, req_with(K_GHOST), 15);
    const double expired = mean_latency(gate, req_with(K_EXPIRED), 15);

    const double diff = std::fabs(unknown_tenant - expired) / std::max(unknown_tenant, expired);
    check(diff < 0.25, "latency means within 25%");
    std::printf("[latency] OK (unknown_tenant=%.1fms expired=%.1fms)\n", unknown_tenant, expired);
}

static void test_unavailable(Fixture& fx, gwauth::Gatekeeper& gate) {
    fx.creds.set_available(false);
    const Timed t = run_check(gate, req_with(K_ACME));
    fx.creds.set_available(true);

    check(t.d.verdict == gwauth::Verdict::unavailable, "credential outage is unavailable");
    check(t.elapsed_ms >= 100, "outage waits for the floor");

    const gwauth::PublicError e = gwauth::public_error(t.d.verdict);
    check(e.status == 503, "outage status");
    check(e.body == R"({"ok":false,"error":"unavailable","message":"Service temporarily unavailable"})", "outage body");

    fx.tenants.set_available(false);
    const Timed t2 = run_check(gate, req_with(K_ACME));
    fx.tenants.set_available(true);
    check(t2.d.verdict == gwauth::Verdict::unavailable, "tenant outage is unavailable");

    check(run_check(gate, req_with(K_ACME)).d.allowed(), "recovers after outage");
    std::printf("[unavailable] OK\n");
}

static void test_charge(Fixture& fx, gwauth::Gatekeeper& gate) {
    const Timed t = run_charge(gate, req_with(K_ACME), 5);
    check(t.d.allowed(), "charge allowed");
    check(t.d.charged == 5, "charged amount");
    check(t.d.license && t.d.license->credits_remaining == 95, "balance after charge");

    const Timed over = run_charge(gate, req_with(K_ACME), 1000);
    check(over.d.verdict == gwauth::Verdict::denied, "overdraft denied");
    check(over.d.reason == gwauth::DenyReason::insufficient_balance, "overdraft reason");

    const Timed bad = run_charge(gate, req_with(K_EXPIRED), 1);
    check(bad.d.reason == gwauth::DenyReason::credential_expired, "expired charge denied");

    gwauth::GateRequest no_key = req_with("");
    no_key.require_credential = false;
    check(run_charge(gate, no_key, 1).d.reason == gwauth::DenyReason::missing_credential,
          "charge always needs a credential");

    fx.creds.set_available(false);
    const Timed down = run_charge(gate, req_with(K_ACME), 1);
    fx.creds.set_available(true);
    check(down.d.verdict == gwauth::Verdict::unavailable, "charge during outage unavailable");

    const Timed after = run_check(gate, req_with(K_ACME));
    check(after.d.license && after.d.license->credits_remaining == 95, "failed charges took nothing");
    std::printf("[charge] OK\n");
}

static void test_trusted_swap(gwauth::Gatekeeper& gate) {
    gwauth::GateRequest r = req_with(K_ACME, "", "10.0.0.5", "203.0.113.44");
    check(gate.resolve(r).client_ip == "203.0.113.44", "trusted proxy honoured");

    gate.set_trusted(std::make_shared<const gwauth::TrustedNetworkSet>());
    check(gate.resolve(r).client_ip == "10.0.0.5", "empty set ignores forwarded header");

    gate.set_trusted(std::make_shared<const gwauth::TrustedNetworkSet>(
        gwauth::TrustedNetworkSet::parse("10.0.0.0/8")));
    check(gate.resolve(r).client_ip == "203.0.113.44", "swap back");
    std::printf("[trusted_swap] OK\n");
}

static void test_audit_file(const std::string& jsonl) {
    std::string err;
    const long n = gwauth::AuditLog::verify_file(jsonl, &err);
    check(n > 0, "audit chain verifies: " + err);

    std::ifstream f(jsonl);
    std::ostringstream ss;
    ss << f.rdbuf();
    const std::string text = ss.str();

    const std::string keys[] = {K_ACME, K_LEGACY, K_INACTIVE, K_EXPIRED, K_EMPTY, K_GHOST, K_BLOCKED};
    for (const auto& k : keys) check(text.find(k) == std::string::npos, "raw key absent from audit log");

    check(text.find("\"gate.deny\"") != std::string::npos, "deny events recorded");
    check(text.find("\"tenant_unknown\"") != std::string::npos, "specific reason recorded");
    check(text.find("\"gate.charge\"") != std::string::npos, "charge events recorded");
    check(text.find("\"gate.unavailable\"") != std::string::npos, "outage events recorded");
    std::printf("[audit] OK (lines=%ld)\n", n);
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "sodium_init failed\n");
        return 2;
    }

    const auto dir = std::filesystem::temp_directory_path() /
                     ("gwauth_gate_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    const std::string jsonl = (dir / "audit.jsonl").string();

    gwauth::AuditLog audit(jsonl, (dir / "audit.state").string());
    audit.set_min_level_str("DEBUG");

    trantor::EventLoopThread loop_thread;
    loop_thread.run();
    gwauth::LoopDelayScheduler sched(loop_thread.getLoop());
    gwauth::TimingEnvelope env(sched);

    Fixture fx;
    gwauth::Gatekeeper gate(std::make_shared<const gwauth::TrustedNetworkSet>(
                                gwauth::TrustedNetworkSet::parse("10.0.0.0/8")),
                            fx.creds, fx.tenants, env, &audit, kContract);

    test_allow(gate);
    test_uniform_denials(gate);
    test_latency_parity(gate);
    test_unavailable(fx, gate);
    test_charge(fx, gate);
    test_trusted_swap(gate);
    test_audit_file(jsonl);

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    if (failures) {
        std::fprintf(stderr, "[gatekeeper] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[gatekeeper] ALL OK\n");
    return 0;
}
