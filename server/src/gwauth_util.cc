#include "gwauth_util.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <sodium.h>

namespace gwauth {

static std::atomic<int> g_debug{-1};

long now_epoch() {
    return (long)std::time(nullptr);
}

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string trim_ws(std::string s) {
    // Locale-independent: only the four ASCII whitespace bytes count.
    auto is_ws = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
    size_t b = 0;
    while (b < s.size() && is_ws((unsigned char)s[b])) b++;
    size_t e = s.size();
    while (e > b && is_ws((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> split_commas(const std::string& s, bool keep_empty) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (true) {
        const size_t comma = s.find(',', pos);
        std::string piece = trim_ws(s.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
        if (keep_empty || !piece.empty()) out.push_back(std::move(piece));
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return out;
}

std::string b64url_enc(const unsigned char* data, size_t len) {
    const size_t outLen = sodium_base64_encoded_len(len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    std::string out(outLen, '\0');

    sodium_bin2base64(out.data(), out.size(),
                      data, len,
                      sodium_base64_VARIANT_URLSAFE_NO_PADDING);

    // libsodium NUL-terminates; shrink to the C-string length.
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::optional<long> parse_iso8601_utc(const std::string& in) {
    const std::string s = trim_ws(in);
    if (s.size() < 10) return std::nullopt;

    int Y = 0, M = 0, D = 0, h = 0, m = 0, sec = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%n", &Y, &M, &D, &consumed) != 3 || consumed != 10)
        return std::nullopt;

    size_t p = 10;
    if (p < s.size() && (s[p] == 'T' || s[p] == 't' || s[p] == ' ')) {
        p++;
        consumed = 0;
        if (std::sscanf(s.c_str() + p, "%2d:%2d:%2d%n", &h, &m, &sec, &consumed) != 3 || consumed != 8)
            return std::nullopt;
        p += 8;

        // Fractional seconds are accepted and dropped.
        if (p < s.size() && s[p] == '.') {
            p++;
            const size_t digits_start = p;
            while (p < s.size() && std::isdigit((unsigned char)s[p])) p++;
            if (p == digits_start) return std::nullopt;
        }
    }

    long offset = 0;
    if (p < s.size()) {
        const char c = s[p];
        if (c == 'Z' || c == 'z') {
            p++;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            consumed = 0;
            if (std::sscanf(s.c_str() + p + 1, "%2d:%2d%n", &oh, &om, &consumed) != 2 || consumed != 5)
                return std::nullopt;
            if (oh > 23 || om > 59) return std::nullopt;
            offset = (long)(oh * 3600 + om * 60);
            if (c == '-') offset = -offset;
            p += 6;
        } else {
            return std::nullopt;
        }
    }
    if (p != s.size()) return std::nullopt;

    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60) return std::nullopt;

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min = m;
    tm.tm_sec = sec;
    const time_t t = timegm(&tm);
    if (t == (time_t)-1) return std::nullopt;

    return (long)t - offset;
}

bool debug_enabled() {
    int v = g_debug.load(std::memory_order_relaxed);
    if (v < 0) {
        const char* e = std::getenv("GWAUTH_DEBUG");
        v = (e && *e && std::strcmp(e, "0") != 0) ? 1 : 0;
        g_debug.store(v, std::memory_order_relaxed);
    }
    return v == 1;
}

void set_debug_enabled(bool on) {
    g_debug.store(on ? 1 : 0, std::memory_order_relaxed);
}

} // namespace gwauth
