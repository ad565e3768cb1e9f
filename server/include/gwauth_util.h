#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gwauth {

    long now_epoch();
    std::string now_iso_utc();

    std::string lower_ascii(std::string s);

    // Trims ASCII whitespace (space, tab, CR, LF) from both ends.
    std::string trim_ws(std::string s);

    // Splits on ',' and trims each piece.
    // keep_empty=false drops blank pieces (config lists); forwarded chains keep them
    // so that a blank hop is still seen (and rejected) as a malformed address.
    std::vector<std::string> split_commas(const std::string& s, bool keep_empty);

    // URL-safe base64 without padding (libsodium variant).
    std::string b64url_enc(const unsigned char* data, size_t len);

    // Parses "YYYY-MM-DD[THH:MM:SS[.fff]][Z|+HH:MM|-HH:MM]" into epoch seconds (UTC).
    // A timestamp without offset is taken as UTC.
    std::optional<long> parse_iso8601_utc(const std::string& s);

    // Debug diagnostics on std::cerr. Off unless GWAUTH_DEBUG is set or enabled here.
    bool debug_enabled();
    void set_debug_enabled(bool on);

} // namespace gwauth
