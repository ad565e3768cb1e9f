#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "client_ip.h"
#include "credential_store.h"
#include "tenant_store.h"
#include "timing_envelope.h"
#include "trusted_proxy.h"

namespace gwauth {

class AuditLog;

enum class Verdict {
    allowed,
    denied,
    unavailable,
};

// Operator-facing cause of a denial. Recorded in the audit log, never sent to
// the client.
enum class DenyReason {
    none,
    missing_credential,
    credential_invalid,
    credential_inactive,
    credential_expired,
    insufficient_balance,
    tenant_unknown,
    tenant_inactive,
    tenant_mismatch,
    ip_blocked,
};

const char* verdict_str(Verdict v);
const char* deny_reason_str(DenyReason r);

struct GateRequest {
    std::string direct_addr;     // TCP peer
    std::string forwarded_for;   // raw X-Forwarded-For, may be empty
    std::string license_key;     // X-License-Key, may be empty
    std::string tenant_id;       // X-Tenant-ID, may be empty

    bool require_credential = true;

    std::string user_agent;      // audit only
};

// What downstream handlers learn about an accepted credential.
struct LicenseInfo {
    std::string license_id;
    std::string tenant_id;
    std::string app_id;
    long credits_remaining = 0;
    std::optional<long> expires_at;
    std::string key_masked;
};

struct GateDecision {
    Verdict verdict = Verdict::denied;
    DenyReason reason = DenyReason::none;

    std::string client_ip;
    std::string tenant_id;               // effective tenant scope, may be empty
    std::optional<LicenseInfo> license;

    long charged = 0;                    // charge(): amount taken

    bool allowed() const { return verdict == Verdict::allowed; }
};

// Boundary rendering of a non-allowed verdict. Every denial cause maps to the
// same status and the same body bytes.
struct PublicError {
    int status = 403;
    std::string body;
};
PublicError public_error(Verdict v);

/*
Gatekeeper
==========

Per-request composition of client-address resolution, tenant IP policy and
credential verification:

  Received -> Resolving(IP) -> PolicyCheck -> CredentialCheck -> {Allowed, Denied}

Everything after address resolution runs inside one TimingEnvelope, so the
decision reaches the caller no earlier than the contract's floor whichever
stage decided it. Store outages surface once as Verdict::unavailable; there
are no retries here.

Threading
---------
check() and charge() are safe from any IO thread. The trusted network set is
an immutable snapshot swapped with set_trusted(); in-flight requests keep the
snapshot they resolved with.
*/
class Gatekeeper {
public:
    using Done = std::function<void(const GateDecision&)>;

    Gatekeeper(TrustedNetworkSetPtr trusted,
               CredentialStore& credentials,
               TenantPolicyStore& tenants,
               TimingEnvelope& envelope,
               AuditLog* audit,
               TimingContract contract = timing::license_validation());

    // Address resolution only; runs inline, no envelope.
    ClientIpResolution resolve(const GateRequest& req) const;

    // Full gate. done runs exactly once, from an event-loop timer.
    void check(const GateRequest& req, Done done);

    // Gate, then atomically take `amount` from the credential's allowance
    // inside the same envelope. On success license->credits_remaining is the
    // balance after the deduction.
    void charge(const GateRequest& req, long amount, Done done);

    void set_trusted(TrustedNetworkSetPtr trusted);
    TrustedNetworkSetPtr trusted() const;

    const TimingContract& contract() const { return contract_; }

private:
    GateDecision evaluate_(const GateRequest& req, const ClientIpResolution& res);
    GateDecision deduct_(const GateRequest& req, GateDecision d, long amount);

    void run_(const GateRequest& req, const char* action,
              std::function<GateDecision(const ClientIpResolution&)> op, Done done);

    void audit_(const GateRequest& req, const ClientIpResolution& res,
                const GateDecision& d, const char* action) const;

    TrustedNetworkSetPtr trusted_;
    CredentialStore& credentials_;
    TenantPolicyStore& tenants_;
    TimingEnvelope& envelope_;
    AuditLog* audit_log_;
    TimingContract contract_;
};

} // namespace gwauth
