#include "ip_policy.h"
#include "ip_address.h"

#include <iostream>

namespace gwauth {

/*
IP allow-list evaluation
========================

Semantics kept deliberately small:
- null policy is the backwards-compatible default (allow all)
- [] is the explicit lock-down setting (deny all)
- otherwise an address must match at least one valid entry

Invalid entries are an operator mistake, not a client problem. They are logged
every time they are seen and skipped, so a single typo never locks a tenant out
nor lets everyone in.
*/
bool is_ip_allowed(const std::string& client_ip, const AccessPolicy& policy) {
    if (!policy) return true;

    if (policy->empty()) {
        std::cerr << "[ip_policy] " << client_ip << " blocked: empty allow-list" << std::endl;
        return false;
    }

    auto addr = parse_ip_address(client_ip);
    if (!addr) {
        std::cerr << "[ip_policy] WARNING: invalid client address '" << client_ip << "'" << std::endl;
        return false;
    }

    for (const auto& entry : *policy) {
        if (entry.find('/') != std::string::npos) {
            auto net = parse_ip_network(entry);
            if (!net) {
                std::cerr << "[ip_policy] WARNING: invalid network in allow-list: '" << entry << "'" << std::endl;
                continue;
            }
            if (net->contains(*addr)) return true;
        } else {
            auto exact = parse_ip_address(entry);
            if (!exact) {
                std::cerr << "[ip_policy] WARNING: invalid address in allow-list: '" << entry << "'" << std::endl;
                continue;
            }
            if (*exact == *addr) return true;
        }
    }

    std::cerr << "[ip_policy] " << client_ip << " not in allow-list" << std::endl;
    return false;
}

} // namespace gwauth
