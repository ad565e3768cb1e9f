#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace gwauth {

/*
AuditEvent
==========

One gate decision or configuration event, written as one JSONL line.

This is the only place where the specific reason behind a denial is kept.
Clients always see the same generic denial; operators read the cause here.

IMPORTANT:
- Never store license keys, admin keys or stored digests.
- Use mask_license_key() for key references and reason codes for causes.
*/
struct AuditEvent {
    // ISO-8601 UTC with milliseconds, e.g. 2026-01-19T12:34:56.123Z.
    // Filled in by append() when empty.
    std::string ts_utc;

    // "<subsystem>.<action>", e.g.
    //   - "gate.allow"
    //   - "gate.deny"
    //   - "gate.unavailable"
    //   - "gate.charge"
    //   - "config.reload"
    //   - "config.trusted_proxy_invalid"
    std::string event;

    // "ok" | "deny" | "fail"
    std::string outcome;

    // Flat string -> string context: ip, direct_ip, xff, tenant_id,
    // license_id, key_masked, reason, ...
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL log.

Each line carries:
- prev_hash : line_hash of the previous line (64 zeros for the first)
- line_hash : SHA-256(prev_hash || json_without_line_hash), lowercase hex

Rewriting, inserting, deleting or reordering lines breaks the chain from that
point on; verify_file() reports the first broken line. This is tamper
evidence, not tamper prevention: whoever can rewrite both the log and the
state file can rewrite history.
*/
class AuditLog {
public:
    // Ordering: DEBUG < INFO < ADMIN < SECURITY.
    // An event is written when its level >= min level.
    enum class MinLevel : int {
        DEBUG    = 0,
        INFO     = 1,
        ADMIN    = 2,
        SECURITY = 3,
    };

    // jsonl_path: the log; state_path: holds the last committed line_hash.
    AuditLog(std::string jsonl_path, std::string state_path);

    // Thread-safe; appends are serialized to keep the chain linear.
    void append(const AuditEvent& e, MinLevel level = MinLevel::SECURITY);

    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    /*
    Re-walk a log file and recompute every line_hash.

    Returns the number of verified lines, or -1 with *err set (line number and
    cause) at the first line that fails.
    */
    static long verify_file(const std::string& jsonl_path, std::string* err);

    static std::string now_iso_utc();

    // Integrity hash only; never used for secrets.
    static std::string sha256_hex(const std::string& s);

private:
    std::string load_prev_hash_();
    void store_prev_hash_(const std::string& h);

    std::atomic<int> min_level_{static_cast<int>(MinLevel::ADMIN)};
    std::string jsonl_path_;
    std::string state_path_;
    std::mutex mu_;
};

} // namespace gwauth
