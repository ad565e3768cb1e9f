#include "audit_log.h"
#include "gwauth_util.h"

#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

namespace gwauth {

/*
Hash chain layout
=================

Line i is serialized twice with a fixed key order:

  pre-image : {"ts","event","outcome","prev_hash"[,"f"]}
  stored    : {"ts","event","outcome","prev_hash","line_hash"[,"f"]}

  line_hash_i = SHA256( line_hash_{i-1} || pre-image_i )

ordered_json keeps insertion order and "f" is a std::map, so both serializations
are byte-stable and verify_file() can rebuild the pre-image from a parsed line.
*/

using ordered_json = nlohmann::ordered_json;

static const std::string kGenesisHash(64, '0');

// Hex encode bytes (lowercase).
static std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

static ordered_json preimage(const std::string& ts, const std::string& event,
                             const std::string& outcome, const std::string& prev_hash,
                             const ordered_json* f) {
    ordered_json j;
    j["ts"] = ts;
    j["event"] = event;
    j["outcome"] = outcome;
    j["prev_hash"] = prev_hash;
    if (f && !f->empty()) j["f"] = *f;
    return j;
}

static ordered_json with_line_hash(const ordered_json& pre, const std::string& line_hash) {
    ordered_json j;
    for (auto it = pre.begin(); it != pre.end(); ++it) {
        if (it.key() == "f") continue;
        j[it.key()] = it.value();
    }
    j["line_hash"] = line_hash;
    if (pre.contains("f")) j["f"] = pre["f"];
    return j;
}

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
    : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

std::string AuditLog::now_iso_utc() {
    return gwauth::now_iso_utc();
}

std::string AuditLog::sha256_hex(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
    return to_hex(h, sizeof(h));
}

bool AuditLog::set_min_level_str(const std::string& s) {
    const std::string v = lower_ascii(trim_ws(s));
    MinLevel lvl;
    if (v == "debug") lvl = MinLevel::DEBUG;
    else if (v == "info") lvl = MinLevel::INFO;
    else if (v == "admin") lvl = MinLevel::ADMIN;
    else if (v == "security") lvl = MinLevel::SECURITY;
    else return false;

    min_level_.store(static_cast<int>(lvl));
    return true;
}

std::string AuditLog::min_level_str() const {
    switch (static_cast<MinLevel>(min_level_.load())) {
        case MinLevel::DEBUG:    return "DEBUG";
        case MinLevel::INFO:     return "INFO";
        case MinLevel::ADMIN:    return "ADMIN";
        case MinLevel::SECURITY: return "SECURITY";
    }
    return "ADMIN";
}

// Missing or damaged state restarts from genesis; verify_file() will then
// flag the seam.
std::string AuditLog::load_prev_hash_() {
    std::ifstream f(state_path_);
    if (!f.good()) return kGenesisHash;
    std::string line;
    std::getline(f, line);
    if (line.size() != 64) return kGenesisHash;
    return line;
}

void AuditLog::store_prev_hash_(const std::string& h) {
    std::ofstream f(state_path_, std::ios::trunc);
    f << h << "\n";
    if (!f.good())
        std::cerr << "[audit] WARNING: failed to write state file " << state_path_ << std::endl;
}

void AuditLog::append(const AuditEvent& e, MinLevel level) {
    if (static_cast<int>(level) < min_level_.load()) return;

    std::lock_guard<std::mutex> lk(mu_);

    const std::string ts = e.ts_utc.empty() ? now_iso_utc() : e.ts_utc;
    const std::string prev = load_prev_hash_();

    ordered_json f = ordered_json::object();
    for (const auto& kv : e.f) f[kv.first] = kv.second;

    const ordered_json pre = preimage(ts, e.event, e.outcome, prev, &f);
    const std::string line_hash = sha256_hex(prev + pre.dump());

    std::ofstream out(jsonl_path_, std::ios::app);
    out << with_line_hash(pre, line_hash).dump() << "\n";
    out.flush();
    if (!out.good()) {
        std::cerr << "[audit] ERROR: append failed: " << jsonl_path_ << std::endl;
        return;
    }

    store_prev_hash_(line_hash);
}

long AuditLog::verify_file(const std::string& jsonl_path, std::string* err) {
    std::ifstream in(jsonl_path);
    if (!in.good()) {
        if (err) *err = "cannot open " + jsonl_path;
        return -1;
    }

    std::string prev = kGenesisHash;
    std::string line;
    long n = 0;

    while (std::getline(in, line)) {
        if (line.empty()) continue;
        n++;

        ordered_json j;
        try {
            j = ordered_json::parse(line);
        } catch (const std::exception& ex) {
            if (err) *err = "line " + std::to_string(n) + ": parse error: " + ex.what();
            return -1;
        }

        try {
            const std::string got_prev = j.at("prev_hash").get<std::string>();
            if (got_prev != prev) {
                if (err) *err = "line " + std::to_string(n) + ": prev_hash does not match previous line";
                return -1;
            }

            const ordered_json* f = j.contains("f") ? &j["f"] : nullptr;
            const ordered_json pre = preimage(j.at("ts").get<std::string>(),
                                              j.at("event").get<std::string>(),
                                              j.at("outcome").get<std::string>(),
                                              got_prev, f);
            const std::string want = sha256_hex(got_prev + pre.dump());
            if (want != j.at("line_hash").get<std::string>()) {
                if (err) *err = "line " + std::to_string(n) + ": line_hash mismatch";
                return -1;
            }
            prev = want;
        } catch (const nlohmann::json::exception& ex) {
            if (err) *err = "line " + std::to_string(n) + ": missing field: " + ex.what();
            return -1;
        }
    }
    return n;
}

} // namespace gwauth
