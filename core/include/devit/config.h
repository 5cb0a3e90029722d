#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace devit {

constexpr int64_t kDefaultTimeoutSecs = 30;

// Largest accepted duration (ten years). Keeps every deadline representable
// in std::chrono::steady_clock's nanoseconds.
constexpr uint64_t kMaxDurationSecs = 10ull * 365 * 24 * 3600;
constexpr uint64_t kMaxJsonKb = 1ull << 30;

// Integer env var; unset returns defv, unparsable warns and returns defv.
int64_t getenv_i64(const char* key, int64_t defv);

// Explicit override, else DEVIT_TIMEOUT_SECS, else 30s. An env value that is
// negative or above kMaxDurationSecs warns and falls back to the default.
std::chrono::seconds resolve_timeout(std::optional<int64_t> override_secs);

// --devit-bin when given, else DEVIT_BIN, else "devit".
std::string resolve_devit_bin(const std::optional<std::string>& flag);

// Strict integer in [0, max_value] for a command-line flag value.
// Throws std::runtime_error naming the flag.
uint64_t parse_flag_u64(const std::string& flag, const std::string& value, uint64_t max_value);

} // namespace devit
