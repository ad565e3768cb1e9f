#include "client_ip.h"
#include "audit_fields.h"
#include "gwauth_util.h"

#include <iostream>
#include <vector>

namespace gwauth {

ClientIpResolution resolve_client_ip_detailed(const std::string& direct_addr,
                                              const std::string& forwarded_for,
                                              const TrustedNetworkSet& trusted) {
    ClientIpResolution r;
    r.client_ip = trim_ws(direct_addr);

    if (!trusted.contains(r.client_ip)) {
        if (debug_enabled() && !forwarded_for.empty())
            std::cerr << "[client_ip] untrusted peer " << r.client_ip
                      << ", ignoring X-Forwarded-For" << std::endl;
        return r;
    }
    r.direct_trusted = true;

    if (trim_ws(forwarded_for).empty()) return r;

    // "client, proxy1, proxy2": leftmost is the claimed origin.
    const std::vector<std::string> chain = split_commas(forwarded_for, /*keep_empty=*/true);

    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        if (!trusted.contains(*it)) {
            r.client_ip = *it;
            r.used_forwarded = true;
            if (debug_enabled())
                std::cerr << "[client_ip] client " << r.client_ip << " via trusted peer "
                          << direct_addr << std::endl;
            return r;
        }
    }

    r.client_ip = chain.front();
    r.used_forwarded = true;
    r.all_hops_trusted = true;
    std::cerr << "[client_ip] WARNING: all X-Forwarded-For hops are trusted, using leftmost "
              << r.client_ip << " (chain: " << shorten(forwarded_for, 200) << ")" << std::endl;
    return r;
}

} // namespace gwauth
