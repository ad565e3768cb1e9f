#pragma once
#include <functional>
#include <string>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

#include "gatekeeper.h"

namespace gwauth {

// Request attributes set for downstream handlers.
inline constexpr char kAttrClientIp[]  = "client_ip";
inline constexpr char kAttrTenantId[]  = "tenant_id";
inline constexpr char kAttrLicenseId[] = "license_id";

inline constexpr char kHdrLicenseKey[]   = "x-license-key";
inline constexpr char kHdrTenantId[]     = "x-tenant-id";
inline constexpr char kHdrForwardedFor[] = "x-forwarded-for";

using HttpCallback = std::function<void(const drogon::HttpResponsePtr&)>;
using HttpHandler = std::function<void(const drogon::HttpRequestPtr&, HttpCallback&&)>;

// Handler behind the gate. Only runs for Verdict::allowed.
using GatedHandler = std::function<void(const drogon::HttpRequestPtr&, const GateDecision&, HttpCallback&&)>;

// Body of a gated charge call. Returning false with *err set answers 400
// before the gate runs (malformed input says nothing about credentials).
using AmountParser = std::function<bool(const drogon::HttpRequestPtr&, long* amount, std::string* err)>;

GateRequest gate_request_from(const drogon::HttpRequestPtr& req, bool require_credential = true);

drogon::HttpResponsePtr json_response(int status, const std::string& body);

// 403/503 with the fixed public body for the verdict.
drogon::HttpResponsePtr gate_error_response(Verdict v);

void set_gate_attributes(const drogon::HttpRequestPtr& req, const GateDecision& d);

/*
Higher-order gate: returns a drogon handler that runs Gatekeeper::check() and
either answers with the generic error or sets the request attributes and calls
the inner handler.

The callback is always completed from the envelope's timer, never inline.
*/
HttpHandler gated(Gatekeeper& gate, GatedHandler handler, bool require_credential = true);

// Same, but the credential's allowance is charged inside the gate.
HttpHandler gated_charge(Gatekeeper& gate, AmountParser amount, GatedHandler handler);

// Sets the client_ip attribute from the gate's current trusted proxy snapshot.
void annotate_client_ip(const Gatekeeper& gate, const drogon::HttpRequestPtr& req);

// Pre-routing advice: every request gets the client_ip attribute, gated or not.
void install_client_ip_advice(Gatekeeper& gate);

} // namespace gwauth
