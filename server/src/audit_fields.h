#pragma once
#include <cstddef>
#include <string>

namespace gwauth {

    // Gate audit lines carry non-secret metadata: resolved and direct ip,
    // X-Forwarded-For, tenant/license/app ids, masked keys, reason codes.
    // License keys, admin keys and stored digests never go into a field.

    // Caps attacker-controlled strings (headers, tenant ids) before logging.
    inline std::string shorten(const std::string& s, size_t maxlen = 64) {
        if (s.size() <= maxlen) return s;
        return s.substr(0, maxlen) + "...";
    }

} // namespace gwauth
