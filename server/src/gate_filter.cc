#include "gate_filter.h"

#include <drogon/HttpAppFramework.h>

#include <memory>

#include <nlohmann/json.hpp>

namespace gwauth {

GateRequest gate_request_from(const drogon::HttpRequestPtr& req, bool require_credential) {
    GateRequest g;
    g.direct_addr = req->peerAddr().toIp();
    g.forwarded_for = req->getHeader(kHdrForwardedFor);
    g.license_key = req->getHeader(kHdrLicenseKey);
    g.tenant_id = req->getHeader(kHdrTenantId);
    g.require_credential = require_credential;
    g.user_agent = req->getHeader("user-agent");
    return g;
}

drogon::HttpResponsePtr json_response(int status, const std::string& body) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode((drogon::HttpStatusCode)status);
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(body);
    return resp;
}

drogon::HttpResponsePtr gate_error_response(Verdict v) {
    const PublicError e = public_error(v);
    return json_response(e.status, e.body);
}

void set_gate_attributes(const drogon::HttpRequestPtr& req, const GateDecision& d) {
    auto attrs = req->getAttributes();
    attrs->insert(kAttrClientIp, d.client_ip);
    if (!d.tenant_id.empty()) attrs->insert(kAttrTenantId, d.tenant_id);
    if (d.license) attrs->insert(kAttrLicenseId, d.license->license_id);
}

static std::string bad_request_body(const std::string& message) {
    nlohmann::ordered_json j;
    j["ok"] = false;
    j["error"] = "bad_request";
    j["message"] = message;
    return j.dump();
}

// Shared tail of gated() and gated_charge().
static Gatekeeper::Done finish(const drogon::HttpRequestPtr& req, GatedHandler handler, HttpCallback&& cb) {
    auto shared_cb = std::make_shared<HttpCallback>(std::move(cb));
    return [req, handler = std::move(handler), shared_cb](const GateDecision& d) {
        if (!d.allowed()) {
            (*shared_cb)(gate_error_response(d.verdict));
            return;
        }
        set_gate_attributes(req, d);
        handler(req, d, std::move(*shared_cb));
    };
}

HttpHandler gated(Gatekeeper& gate, GatedHandler handler, bool require_credential) {
    return [&gate, handler = std::move(handler), require_credential](
               const drogon::HttpRequestPtr& req, HttpCallback&& cb) {
        gate.check(gate_request_from(req, require_credential), finish(req, handler, std::move(cb)));
    };
}

HttpHandler gated_charge(Gatekeeper& gate, AmountParser amount, GatedHandler handler) {
    return [&gate, amount = std::move(amount), handler = std::move(handler)](
               const drogon::HttpRequestPtr& req, HttpCallback&& cb) {
        long n = 0;
        std::string err;
        if (!amount(req, &n, &err)) {
            cb(json_response(400, bad_request_body(err)));
            return;
        }
        gate.charge(gate_request_from(req, true), n, finish(req, handler, std::move(cb)));
    };
}

void annotate_client_ip(const Gatekeeper& gate, const drogon::HttpRequestPtr& req) {
    const GateRequest g = gate_request_from(req, false);
    req->getAttributes()->insert(kAttrClientIp, gate.resolve(g).client_ip);
}

void install_client_ip_advice(Gatekeeper& gate) {
    drogon::app().registerPreRoutingAdvice([&gate](const drogon::HttpRequestPtr& req) {
        annotate_client_ip(gate, req);
    });
}

} // namespace gwauth
