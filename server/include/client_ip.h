#pragma once
#include <string>

#include "trusted_proxy.h"

namespace gwauth {

// Outcome of a trust-chain walk, kept for audit fields.
struct ClientIpResolution {
    std::string client_ip;

    bool direct_trusted = false;    // direct peer is a trusted proxy
    bool used_forwarded = false;    // client_ip came from X-Forwarded-For
    bool all_hops_trusted = false;  // every hop trusted; leftmost returned
};

/*
Derive the client address used for access control.

- Direct peer not trusted: X-Forwarded-For is ignored completely and the direct
  address is returned (a client cannot spoof its way past an untrusted edge).
- Direct peer trusted, header absent or blank: the direct address.
- Direct peer trusted, header present: walk the chain right to left and return
  the first hop that is not trusted. Malformed hops count as untrusted, so a
  garbage hop is returned as-is and later fails address parsing downstream.
- Every hop trusted: the leftmost entry, with a warning. This assumes none of
  the trusted proxies is compromised.
*/
ClientIpResolution resolve_client_ip_detailed(const std::string& direct_addr,
                                              const std::string& forwarded_for,
                                              const TrustedNetworkSet& trusted);

inline std::string resolve_client_ip(const std::string& direct_addr,
                                     const std::string& forwarded_for,
                                     const TrustedNetworkSet& trusted) {
    return resolve_client_ip_detailed(direct_addr, forwarded_for, trusted).client_ip;
}

} // namespace gwauth
