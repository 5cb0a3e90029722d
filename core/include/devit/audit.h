#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace devit {

constexpr const char* kDefaultAuditPath = ".devit/journal.jsonl";
constexpr const char* kDefaultHmacKeyPath = ".devit/hmac.key";
constexpr size_t kHmacKeyBytes = 32;

struct AuditOptions {
    bool enabled{true};
    std::filesystem::path path{kDefaultAuditPath};
    std::filesystem::path key_path{kDefaultHmacKeyPath};
    bool auto_yes{false};
};

// Append-only JSONL audit trail. Each record is serialized once, signed with
// HMAC-SHA256 over exactly those bytes, and written with the base64 signature
// spliced in as a trailing "sig" member. The key is loaded (or created) on the
// first audited event. Write failures are reported on stderr and never change
// the outcome of the audited call.
class AuditLog {
public:
    explicit AuditLog(AuditOptions opts) : opts_(std::move(opts)) {}

    // Call refused before execution; phase names why ("pre-deny", "rate-limit", ...).
    void pre(const std::string& tool, const std::string& phase, const std::string& policy);

    // Call attempted.
    void done(const std::string& tool, bool ok, int64_t duration_ms,
              const std::optional<std::string>& error, const std::string& policy);

    const AuditOptions& options() const { return opts_; }

private:
    void write(const std::string& body);

    AuditOptions opts_;
    std::string key_;
};

// Use the file as-is when it holds at least 32 bytes, otherwise write 32
// fresh random bytes there (creating parent directories, mode 0600).
bool load_or_create_key(const std::filesystem::path& path, std::string* key, std::string* err);

// body must be a serialized JSON object. Returns body with ,"sig":"<b64>"
// spliced in before the closing brace.
std::string sign_record(const std::string& key, const std::string& body);

// Recompute the signature of one signed line.
bool verify_record(const std::string& key, const std::string& line);

// Append line + '\n' under an exclusive advisory lock. Returns "" on success.
std::string append_line_locked(const std::filesystem::path& path, const std::string& line);

// 2026-01-02T03:04:05.678Z
std::string rfc3339_millis_now();

} // namespace devit
