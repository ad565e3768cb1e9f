#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ip_address.h"

namespace gwauth {

/*
Trusted network set
===================

The set of proxy networks (load balancers, CDNs, ingress) allowed to speak for
a client through X-Forwarded-For.

Lifecycle
---------
- Built once from the configured comma-separated list.
- Immutable after construction. Reload builds a new set and the owner swaps a
  shared_ptr; readers keep whatever snapshot they loaded.

Security rules
--------------
- An empty set means forwarded headers are never trusted.
- Invalid configuration entries are dropped with a warning; they never abort
  startup and never widen trust.
- Malformed addresses passed to contains() are untrusted.
*/
class TrustedNetworkSet {
public:
    TrustedNetworkSet() = default;

    // Canonicalizes and de-duplicates the given networks (first occurrence wins).
    explicit TrustedNetworkSet(const std::vector<IpNetwork>& nets);

    /*
    Parse a comma-separated configuration value, e.g.
      "10.0.0.0/8, 172.16.0.0/12, 2001:db8::/32, 203.0.113.7"

    Blank items are ignored. Each invalid item is logged under [trusted_proxy]
    and, if out_rejected is non-null, appended to it verbatim.
    */
    static TrustedNetworkSet parse(const std::string& csv,
                                   std::vector<std::string>* out_rejected = nullptr);

    bool contains(const IpAddress& a) const;

    // Malformed literals are logged (debug) and reported as untrusted.
    bool contains(const std::string& ip_literal) const;

    bool empty() const { return nets_.empty(); }
    size_t size() const { return nets_.size(); }
    const std::vector<IpNetwork>& networks() const { return nets_; }

    // Canonical "<base>/<prefix>" strings for startup logging.
    std::vector<std::string> describe() const;

private:
    std::vector<IpNetwork> nets_;
};

using TrustedNetworkSetPtr = std::shared_ptr<const TrustedNetworkSet>;

} // namespace gwauth
