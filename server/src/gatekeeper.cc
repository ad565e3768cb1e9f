#include "gatekeeper.h"
#include "audit_fields.h"
#include "audit_log.h"
#include "gwauth_util.h"
#include "ip_policy.h"
#include "license_key.h"

#include <iostream>
#include <map>

#include <nlohmann/json.hpp>

namespace gwauth {

const char* verdict_str(Verdict v) {
    switch (v) {
        case Verdict::allowed:     return "allowed";
        case Verdict::denied:      return "denied";
        case Verdict::unavailable: return "unavailable";
    }
    return "denied";
}

const char* deny_reason_str(DenyReason r) {
    switch (r) {
        case DenyReason::none:                 return "none";
        case DenyReason::missing_credential:   return "missing_credential";
        case DenyReason::credential_invalid:   return "credential_invalid";
        case DenyReason::credential_inactive:  return "credential_inactive";
        case DenyReason::credential_expired:   return "credential_expired";
        case DenyReason::insufficient_balance: return "insufficient_balance";
        case DenyReason::tenant_unknown:       return "tenant_unknown";
        case DenyReason::tenant_inactive:      return "tenant_inactive";
        case DenyReason::tenant_mismatch:      return "tenant_mismatch";
        case DenyReason::ip_blocked:           return "ip_blocked";
    }
    return "unknown";
}

static std::string error_body(const char* code, const char* message) {
    nlohmann::ordered_json j;
    j["ok"] = false;
    j["error"] = code;
    j["message"] = message;
    return j.dump();
}

// Bodies are built once; every denial shares the same bytes.
PublicError public_error(Verdict v) {
    static const std::string kDenied = error_body("access_denied", "Access denied");
    static const std::string kUnavailable = error_body("unavailable", "Service temporarily unavailable");

    if (v == Verdict::unavailable) return PublicError{503, kUnavailable};
    return PublicError{403, kDenied};
}

// Verified against when no row matches, so a miss hashes like a hit.
static const std::string& decoy_digest() {
    static const std::string d = hash_license_key("lic_decoy-digest-never-issued-0000000");
    return d;
}

static DenyReason reason_from(StoreErrc c) {
    switch (c) {
        case StoreErrc::insufficient_balance: return DenyReason::insufficient_balance;
        case StoreErrc::inactive:             return DenyReason::credential_inactive;
        case StoreErrc::expired:              return DenyReason::credential_expired;
        case StoreErrc::invalid_credential:
        case StoreErrc::transient:            break;
    }
    return DenyReason::credential_invalid;
}

static GateDecision deny(GateDecision d, DenyReason why) {
    d.verdict = Verdict::denied;
    d.reason = why;
    d.license.reset();
    return d;
}

Gatekeeper::Gatekeeper(TrustedNetworkSetPtr trusted,
                       CredentialStore& credentials,
                       TenantPolicyStore& tenants,
                       TimingEnvelope& envelope,
                       AuditLog* audit,
                       TimingContract contract)
    : trusted_(trusted ? std::move(trusted) : std::make_shared<const TrustedNetworkSet>()),
      credentials_(credentials),
      tenants_(tenants),
      envelope_(envelope),
      audit_log_(audit),
      contract_(contract) {}

void Gatekeeper::set_trusted(TrustedNetworkSetPtr trusted) {
    if (!trusted) trusted = std::make_shared<const TrustedNetworkSet>();
    std::atomic_store(&trusted_, std::move(trusted));
}

TrustedNetworkSetPtr Gatekeeper::trusted() const {
    return std::atomic_load(&trusted_);
}

ClientIpResolution Gatekeeper::resolve(const GateRequest& req) const {
    const TrustedNetworkSetPtr t = trusted();
    return resolve_client_ip_detailed(req.direct_addr, req.forwarded_for, *t);
}

/*
Decision pipeline. Runs inside the envelope.

Credential checks come first (existence, key match, active, expiry, balance),
then tenant scope (explicit X-Tenant-ID, else the credential's tenant), then the
tenant's IP allow-list against the resolved client address.

Store outages propagate as StoreError(transient).
*/
GateDecision Gatekeeper::evaluate_(const GateRequest& req, const ClientIpResolution& res) {
    GateDecision d;
    d.client_ip = res.client_ip;

    const std::string key = trim_ws(req.license_key);
    std::optional<LicenseRecord> rec;

    if (key.empty()) {
        if (req.require_credential) {
            (void)verify_license_key(req.license_key, decoy_digest());
            return deny(d, DenyReason::missing_credential);
        }
    } else {
        try {
            rec = credentials_.fetch(license_lookup_keys(key));
        } catch (const StoreError& e) {
            if (e.code() == StoreErrc::transient) throw;
            return deny(d, reason_from(e.code()));
        }

        if (!rec) {
            (void)verify_license_key(key, decoy_digest());
            return deny(d, DenyReason::credential_invalid);
        }
        if (!verify_license_key(key, rec->stored_key)) return deny(d, DenyReason::credential_invalid);
        if (!rec->is_active) return deny(d, DenyReason::credential_inactive);
        if (rec->expires_at && *rec->expires_at < now_epoch()) return deny(d, DenyReason::credential_expired);
        if (rec->credits_remaining <= 0) return deny(d, DenyReason::insufficient_balance);
    }

    std::string tenant = trim_ws(req.tenant_id);
    if (rec) {
        if (tenant.empty()) tenant = rec->tenant_id;
        else if (tenant != rec->tenant_id) return deny(d, DenyReason::tenant_mismatch);
    }
    d.tenant_id = tenant;

    if (!tenant.empty()) {
        const std::optional<TenantRecord> t = tenants_.fetch(tenant);
        if (!t) return deny(d, DenyReason::tenant_unknown);
        if (!t->is_active) return deny(d, DenyReason::tenant_inactive);
        if (!is_ip_allowed(d.client_ip, t->allowed_ips)) return deny(d, DenyReason::ip_blocked);
    }

    if (rec) {
        LicenseInfo info;
        info.license_id = rec->id;
        info.tenant_id = rec->tenant_id;
        info.app_id = rec->app_id;
        info.credits_remaining = rec->credits_remaining;
        info.expires_at = rec->expires_at;
        info.key_masked = mask_license_key(key);
        d.license = std::move(info);
    }

    d.verdict = Verdict::allowed;
    return d;
}

GateDecision Gatekeeper::deduct_(const GateRequest& req, GateDecision d, long amount) {
    long remaining = 0;
    try {
        remaining = credentials_.deduct(license_lookup_keys(trim_ws(req.license_key)), amount);
    } catch (const StoreError& e) {
        if (e.code() == StoreErrc::transient) throw;
        return deny(std::move(d), reason_from(e.code()));
    }

    d.charged = amount;
    if (d.license) d.license->credits_remaining = remaining;
    return d;
}

void Gatekeeper::check(const GateRequest& req, Done done) {
    run_(req, "check",
         [this, req](const ClientIpResolution& res) { return evaluate_(req, res); },
         std::move(done));
}

void Gatekeeper::charge(const GateRequest& req, long amount, Done done) {
    GateRequest r = req;
    r.require_credential = true;

    run_(r, "charge",
         [this, r, amount](const ClientIpResolution& res) {
             GateDecision d = evaluate_(r, res);
             if (!d.allowed()) return d;
             return deduct_(r, std::move(d), amount);
         },
         std::move(done));
}

void Gatekeeper::run_(const GateRequest& req, const char* action,
                      std::function<GateDecision(const ClientIpResolution&)> op, Done done) {
    const ClientIpResolution res = resolve(req);

    if (debug_enabled()) {
        std::cerr << "[gate] " << action << " ip=" << res.client_ip
                  << " direct=" << req.direct_addr
                  << " forwarded=" << (res.used_forwarded ? "1" : "0") << std::endl;
    }

    envelope_.wrap(
        [op = std::move(op), res]() { return op(res); },
        contract_,
        [this, req, res, action, done = std::move(done)](Outcome<GateDecision> out) {
            GateDecision d;
            try {
                d = out.get();
            } catch (const StoreError& e) {
                std::cerr << "[gate] WARNING: store " << store_errc_str(e.code())
                          << ": " << e.what() << std::endl;
                d.verdict = Verdict::unavailable;
                d.client_ip = res.client_ip;
            } catch (const std::exception& e) {
                std::cerr << "[gate] ERROR: unexpected failure: " << e.what() << std::endl;
                d.verdict = Verdict::unavailable;
                d.client_ip = res.client_ip;
            }

            audit_(req, res, d, action);
            done(d);
        });
}

void Gatekeeper::audit_(const GateRequest& req, const ClientIpResolution& res,
                        const GateDecision& d, const char* action) const {
    if (!audit_log_) return;

    AuditEvent ev;
    AuditLog::MinLevel level = AuditLog::MinLevel::SECURITY;

    switch (d.verdict) {
        case Verdict::allowed:
            ev.event = (std::string(action) == "charge") ? "gate.charge" : "gate.allow";
            ev.outcome = "ok";
            level = AuditLog::MinLevel::INFO;
            break;
        case Verdict::denied:
            ev.event = "gate.deny";
            ev.outcome = "deny";
            ev.f["reason"] = deny_reason_str(d.reason);
            break;
        case Verdict::unavailable:
            ev.event = "gate.unavailable";
            ev.outcome = "fail";
            break;
    }

    ev.f["action"] = action;
    ev.f["ip"] = res.client_ip;
    ev.f["direct_ip"] = req.direct_addr;
    if (!req.forwarded_for.empty()) ev.f["xff"] = shorten(req.forwarded_for, 200);
    if (res.all_hops_trusted) ev.f["all_hops_trusted"] = "1";
    if (!d.tenant_id.empty()) ev.f["tenant_id"] = d.tenant_id;
    else if (!req.tenant_id.empty()) ev.f["tenant_id"] = shorten(req.tenant_id);

    const std::string key = trim_ws(req.license_key);
    if (!key.empty()) ev.f["key_masked"] = mask_license_key(key);
    if (d.license) {
        ev.f["license_id"] = d.license->license_id;
        ev.f["credits_remaining"] = std::to_string(d.license->credits_remaining);
    }
    if (d.charged > 0) ev.f["amount"] = std::to_string(d.charged);
    if (!req.user_agent.empty()) ev.f["ua"] = shorten(req.user_agent, 120);

    audit_log_->append(ev, level);
}

} // namespace gwauth
