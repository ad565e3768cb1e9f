#pragma once
#include <array>
#include <optional>
#include <string>

namespace gwauth {

/*
IP literals and networks
========================

Small value types used by the trust-chain resolver and the tenant IP policy.

Parsing rules
-------------
- Addresses are plain IPv4 dotted quads or IPv6 text (as accepted by inet_pton).
  Brackets, ports and zone ids are not address syntax here and fail to parse.
- Networks are "<address>/<prefix>" or a bare address (full-length prefix).
  IPv4 networks also accept a dotted netmask ("10.0.0.0/255.0.0.0").
- Network parsing is non-strict: host bits set in the base address are masked
  off, so "192.168.1.77/24" is the network 192.168.1.0/24.

Families never mix: an IPv4 address is never inside an IPv6 network, including
IPv4-mapped IPv6 forms (::ffff:a.b.c.d), which stay IPv6.
*/

enum class IpFamily { v4, v6 };

struct IpAddress {
    IpFamily family = IpFamily::v4;

    // Network byte order; only the first size() bytes are meaningful.
    std::array<unsigned char, 16> bytes{};

    size_t size() const { return family == IpFamily::v4 ? 4 : 16; }
    std::string to_string() const;

    bool operator==(const IpAddress& o) const;
    bool operator!=(const IpAddress& o) const { return !(*this == o); }
};

struct IpNetwork {
    IpAddress base;     // host bits already cleared
    int prefix = 0;     // 0..32 or 0..128

    bool contains(const IpAddress& a) const;

    // Canonical "<base>/<prefix>" form.
    std::string to_string() const;

    bool operator==(const IpNetwork& o) const { return prefix == o.prefix && base == o.base; }
};

// Returns nullopt for anything that is not an IP literal (surrounding ASCII
// whitespace is tolerated).
std::optional<IpAddress> parse_ip_address(const std::string& text);

std::optional<IpNetwork> parse_ip_network(const std::string& text);

} // namespace gwauth
