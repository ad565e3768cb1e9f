#include "trusted_proxy.h"
#include "gwauth_util.h"

#include <algorithm>
#include <iostream>

namespace gwauth {

TrustedNetworkSet::TrustedNetworkSet(const std::vector<IpNetwork>& nets) {
    nets_.reserve(nets.size());
    for (const auto& n : nets) {
        if (std::find(nets_.begin(), nets_.end(), n) == nets_.end()) nets_.push_back(n);
    }
}

TrustedNetworkSet TrustedNetworkSet::parse(const std::string& csv,
                                           std::vector<std::string>* out_rejected) {
    std::vector<IpNetwork> nets;

    for (const auto& item : split_commas(csv, /*keep_empty=*/false)) {
        auto n = parse_ip_network(item);
        if (!n) {
            std::cerr << "[trusted_proxy] WARNING: invalid trusted proxy entry dropped: '"
                      << item << "'" << std::endl;
            if (out_rejected) out_rejected->push_back(item);
            continue;
        }
        nets.push_back(*n);
    }

    TrustedNetworkSet set(nets);
    if (set.empty()) {
        std::cerr << "[trusted_proxy] WARNING: no trusted proxies configured; "
                     "X-Forwarded-For will be ignored" << std::endl;
    } else {
        for (const auto& d : set.describe())
            std::cerr << "[trusted_proxy] trusted network " << d << std::endl;
    }
    return set;
}

bool TrustedNetworkSet::contains(const IpAddress& a) const {
    for (const auto& n : nets_) {
        if (n.contains(a)) return true;
    }
    return false;
}

bool TrustedNetworkSet::contains(const std::string& ip_literal) const {
    if (nets_.empty()) return false;

    auto a = parse_ip_address(ip_literal);
    if (!a) {
        if (debug_enabled())
            std::cerr << "[trusted_proxy] malformed address treated as untrusted: '"
                      << ip_literal << "'" << std::endl;
        return false;
    }
    return contains(*a);
}

std::vector<std::string> TrustedNetworkSet::describe() const {
    std::vector<std::string> out;
    out.reserve(nets_.size());
    for (const auto& n : nets_) out.push_back(n.to_string());
    return out;
}

} // namespace gwauth
