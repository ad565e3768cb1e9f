#include "ip_address.h"
#include "gwauth_util.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <cstring>

namespace gwauth {

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN] = {};
    const int af = (family == IpFamily::v4) ? AF_INET : AF_INET6;
    if (::inet_ntop(af, bytes.data(), buf, sizeof(buf)) == nullptr) return "?";
    return buf;
}

bool IpAddress::operator==(const IpAddress& o) const {
    if (family != o.family) return false;
    return std::memcmp(bytes.data(), o.bytes.data(), size()) == 0;
}

bool IpNetwork::contains(const IpAddress& a) const {
    if (a.family != base.family) return false;

    const int full = prefix / 8;
    if (std::memcmp(a.bytes.data(), base.bytes.data(), (size_t)full) != 0) return false;

    const int rem = prefix % 8;
    if (rem == 0) return true;

    const unsigned char mask = (unsigned char)(0xFF << (8 - rem));
    return (a.bytes[full] & mask) == (base.bytes[full] & mask);
}

std::string IpNetwork::to_string() const {
    return base.to_string() + "/" + std::to_string(prefix);
}

std::optional<IpAddress> parse_ip_address(const std::string& text) {
    const std::string s = trim_ws(text);
    if (s.empty() || s.size() > INET6_ADDRSTRLEN) return std::nullopt;

    IpAddress a;
    if (s.find(':') == std::string::npos) {
        a.family = IpFamily::v4;
        if (::inet_pton(AF_INET, s.c_str(), a.bytes.data()) != 1) return std::nullopt;
    } else {
        a.family = IpFamily::v6;
        if (::inet_pton(AF_INET6, s.c_str(), a.bytes.data()) != 1) return std::nullopt;
    }
    return a;
}

// Dotted IPv4 netmask -> prefix length. Only contiguous masks are valid.
static std::optional<int> netmask_prefix(const std::string& s) {
    unsigned char m[4];
    if (::inet_pton(AF_INET, s.c_str(), m) != 1) return std::nullopt;

    int bits = 0;
    bool seen_zero = false;
    for (unsigned char byte : m) {
        for (int i = 7; i >= 0; --i) {
            const bool one = (byte >> i) & 1;
            if (one && seen_zero) return std::nullopt;
            if (one) bits++;
            else seen_zero = true;
        }
    }
    return bits;
}

std::optional<IpNetwork> parse_ip_network(const std::string& text) {
    const std::string s = trim_ws(text);
    const auto slash = s.find('/');

    auto addr = parse_ip_address(slash == std::string::npos ? s : s.substr(0, slash));
    if (!addr) return std::nullopt;

    const int max_prefix = (addr->family == IpFamily::v4) ? 32 : 128;
    int prefix = max_prefix;

    if (slash != std::string::npos) {
        const std::string p = s.substr(slash + 1);
        if (p.empty()) return std::nullopt;

        bool all_digits = true;
        for (char c : p) {
            if (!std::isdigit((unsigned char)c)) { all_digits = false; break; }
        }

        if (all_digits) {
            if (p.size() > 3) return std::nullopt;
            prefix = std::stoi(p);
            if (prefix > max_prefix) return std::nullopt;
        } else if (addr->family == IpFamily::v4) {
            auto np = netmask_prefix(p);
            if (!np) return std::nullopt;
            prefix = *np;
        } else {
            return std::nullopt;
        }
    }

    // Non-strict: clear host bits instead of rejecting them.
    IpNetwork n;
    n.base = *addr;
    n.prefix = prefix;
    const size_t len = addr->size();
    for (size_t i = 0; i < len; ++i) {
        const int bit_start = (int)i * 8;
        if (bit_start >= prefix) {
            n.base.bytes[i] = 0;
        } else if (bit_start + 8 > prefix) {
            const int keep = prefix - bit_start;
            n.base.bytes[i] &= (unsigned char)(0xFF << (8 - keep));
        }
    }
    return n;
}

} // namespace gwauth
