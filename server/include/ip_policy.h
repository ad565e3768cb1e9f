#pragma once
#include <optional>
#include <string>
#include <vector>

namespace gwauth {

/*
Tenant IP access policy
=======================

AccessPolicy mirrors the tenant's allowed_ips column:
- std::nullopt        : not set, every address is allowed
- empty vector        : every address is denied
- list of strings     : allow-list of exact addresses and CIDR networks

This layer answers authorization only. The address passed in must already be
the resolved client address (see resolve_client_ip), never a raw header value.
*/
using AccessPolicy = std::optional<std::vector<std::string>>;

/*
Check a resolved client address against a tenant policy.

Matching:
- entries containing '/' are non-strict CIDR networks, others exact addresses
- address family of entry and client must agree
- first match wins

Fail-closed:
- an unparseable client address is denied (unless the policy is unset)
- unparseable entries are skipped with a warning and never match
*/
bool is_ip_allowed(const std::string& client_ip, const AccessPolicy& policy);

} // namespace gwauth
