#include "routes_gateway.h"
#include "audit_fields.h"
#include "audit_log.h"
#include "gate_filter.h"
#include "gatekeeper.h"
#include "gwauth_util.h"
#include "license_key.h"

#include <drogon/HttpAppFramework.h>
#include <nlohmann/json.hpp>

#include <iostream>

using json = nlohmann::json;

namespace gwauth {

static json license_json(const LicenseInfo& l) {
    json j;
    j["id"] = l.license_id;
    j["tenant_id"] = l.tenant_id;
    j["app_id"] = l.app_id;
    j["credits_remaining"] = l.credits_remaining;
    j["expires_at"] = l.expires_at ? json(*l.expires_at) : json(nullptr);
    j["key_masked"] = l.key_masked;
    return j;
}

bool parse_charge_amount(const drogon::HttpRequestPtr& req, long* amount, std::string* err) {
    json body;
    try {
        body = json::parse(std::string(req->body()));
    } catch (const std::exception&) {
        *err = "body must be JSON";
        return false;
    }

    auto it = body.find("amount");
    if (!body.is_object() || it == body.end() || !it->is_number_integer()) {
        *err = "amount must be an integer";
        return false;
    }

    const long n = it->get<long>();
    if (n < 1 || n > kMaxChargeAmount) {
        *err = "amount out of range";
        return false;
    }
    *amount = n;
    return true;
}

// -----------------------------------------------------------------------------
// POST /admin/reload
//
// The admin key is compared against a stored digest inside the login timing
// contract, so a wrong key and a right one cost the same wall time. A wrong or
// missing key gets the same 403 body as any gate denial.
// -----------------------------------------------------------------------------
static void route_admin_reload(const GatewayRoutesContext& ctx,
                               const drogon::HttpRequestPtr& req,
                               HttpCallback&& cb) {
    const std::string presented = req->getHeader("x-admin-key");
    const std::string ip = ctx.gate->resolve(gate_request_from(req, false)).client_ip;
    const std::string stored = ctx.admin_key_hash;

    auto shared_cb = std::make_shared<HttpCallback>(std::move(cb));

    ctx.envelope->wrap(
        [presented, stored]() {
            if (stored.empty()) return false;
            return verify_license_key(presented, stored);
        },
        timing::login(),
        [ctx, ip, shared_cb](Outcome<bool> out) {
            if (!out.get()) {
                if (ctx.audit) {
                    AuditEvent ev;
                    ev.event = "config.reload";
                    ev.outcome = "deny";
                    ev.f["ip"] = ip;
                    ev.f["reason"] = "admin_key_invalid";
                    ctx.audit->append(ev, AuditLog::MinLevel::SECURITY);
                }
                (*shared_cb)(gate_error_response(Verdict::denied));
                return;
            }

            std::string summary;
            const bool ok = ctx.reload && ctx.reload(&summary);

            if (ctx.audit) {
                AuditEvent ev;
                ev.event = "config.reload";
                ev.outcome = ok ? "ok" : "fail";
                ev.f["ip"] = ip;
                ev.f["trigger"] = "http";
                ev.f["summary"] = shorten(summary, 200);
                ctx.audit->append(ev, AuditLog::MinLevel::ADMIN);
            }

            json j;
            j["ok"] = ok;
            j["summary"] = summary;
            (*shared_cb)(json_response(ok ? 200 : 500, j.dump()));
        });
}

HttpHandler admin_reload_handler(const GatewayRoutesContext& ctx) {
    return [ctx](const drogon::HttpRequestPtr& req, HttpCallback&& cb) {
        route_admin_reload(ctx, req, std::move(cb));
    };
}

HttpHandler license_validate_handler(Gatekeeper& gate) {
    return gated(gate,
        [](const drogon::HttpRequestPtr&, const GateDecision& d, HttpCallback&& cb) {
            json j;
            j["ok"] = true;
            j["valid"] = true;
            j["client_ip"] = d.client_ip;
            if (d.license) j["license"] = license_json(*d.license);
            cb(json_response(200, j.dump()));
        });
}

HttpHandler credits_consume_handler(Gatekeeper& gate) {
    return gated_charge(gate, parse_charge_amount,
        [](const drogon::HttpRequestPtr&, const GateDecision& d, HttpCallback&& cb) {
            json j;
            j["ok"] = true;
            j["consumed"] = d.charged;
            j["credits_remaining"] = d.license ? d.license->credits_remaining : 0;
            cb(json_response(200, j.dump()));
        });
}

void register_gateway_routes(const GatewayRoutesContext& ctx) {
    using drogon::Get;
    using drogon::Post;
    auto& app = drogon::app();

    app.registerHandler("/health",
        [](const drogon::HttpRequestPtr& req, HttpCallback&& cb) {
            json j;
            j["ok"] = true;
            j["status"] = "healthy";
            j["time"] = now_iso_utc();
            j["client_ip"] = req->getAttributes()->get<std::string>(kAttrClientIp);
            cb(json_response(200, j.dump()));
        },
        {Get});

    const HttpHandler validate = license_validate_handler(*ctx.gate);
    app.registerHandler("/api/v1/license/validate",
        [validate](const drogon::HttpRequestPtr& req, HttpCallback&& cb) {
            validate(req, std::move(cb));
        },
        {Post});

    const HttpHandler consume = credits_consume_handler(*ctx.gate);
    app.registerHandler("/api/v1/credits/consume",
        [consume](const drogon::HttpRequestPtr& req, HttpCallback&& cb) {
            consume(req, std::move(cb));
        },
        {Post});

    const HttpHandler reload = admin_reload_handler(ctx);
    app.registerHandler("/admin/reload",
        [reload](const drogon::HttpRequestPtr& req, HttpCallback&& cb) {
            reload(req, std::move(cb));
        },
        {Post});

    std::cerr << "[routes] registered /health, /api/v1/license/validate, "
                 "/api/v1/credits/consume, /admin/reload" << std::endl;
}

} // namespace gwauth
