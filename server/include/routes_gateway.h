#pragma once
#include <functional>
#include <string>

#include "gate_filter.h"

namespace gwauth {

class AuditLog;
class TimingEnvelope;

// Everything the HTTP routes need, owned by main.cpp.
struct GatewayRoutesContext {
    Gatekeeper* gate = nullptr;
    TimingEnvelope* envelope = nullptr;
    AuditLog* audit = nullptr;

    // sha256: digest of the admin key; empty disables /admin/reload.
    std::string admin_key_hash;

    // Re-reads trusted proxies and tenants; *summary gets a short status line.
    std::function<bool(std::string* summary)> reload;
};

/*
Routes
  GET  /health                    ungated
  POST /api/v1/license/validate   gated; returns the license summary
  POST /api/v1/credits/consume    gated + charge; body {"amount": n}
  POST /admin/reload              X-Admin-Key; timing-protected
*/
void register_gateway_routes(const GatewayRoutesContext& ctx);

// Largest single charge accepted by /api/v1/credits/consume.
inline constexpr long kMaxChargeAmount = 1000000;

// Body {"amount": n} with 1 <= n <= kMaxChargeAmount.
bool parse_charge_amount(const drogon::HttpRequestPtr& req, long* amount, std::string* err);

// Handlers behind the routes above.
HttpHandler license_validate_handler(Gatekeeper& gate);
HttpHandler credits_consume_handler(Gatekeeper& gate);
HttpHandler admin_reload_handler(const GatewayRoutesContext& ctx);

} // namespace gwauth
