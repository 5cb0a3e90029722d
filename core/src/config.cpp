#include "devit/config.h"

#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace devit {

static bool parse_i64(const std::string& s, int64_t* out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    *out = static_cast<int64_t>(v);
    return true;
}

int64_t getenv_i64(const char* key, int64_t defv) {
    const char* v = std::getenv(key);
    if (!v) return defv;
    int64_t out = 0;
    if (!parse_i64(v, &out)) {
        std::cerr << "[WARN] ignoring " << key << "=" << v << " (not an integer)" << std::endl;
        return defv;
    }
    return out;
}

std::chrono::seconds resolve_timeout(std::optional<int64_t> override_secs) {
    if (override_secs) return std::chrono::seconds(*override_secs);
    int64_t secs = getenv_i64("DEVIT_TIMEOUT_SECS", kDefaultTimeoutSecs);
    if (secs < 0 || static_cast<uint64_t>(secs) > kMaxDurationSecs) {
        std::cerr << "[WARN] ignoring out-of-range DEVIT_TIMEOUT_SECS=" << secs << std::endl;
        secs = kDefaultTimeoutSecs;
    }
    return std::chrono::seconds(secs);
}

std::string resolve_devit_bin(const std::optional<std::string>& flag) {
    if (flag && !flag->empty()) return *flag;
    if (const char* v = std::getenv("DEVIT_BIN")) {
        if (*v) return v;
    }
    return "devit";
}

uint64_t parse_flag_u64(const std::string& flag, const std::string& value, uint64_t max_value) {
    int64_t v = 0;
    if (!parse_i64(value, &v) || v < 0) {
        throw std::runtime_error(flag + ": expected a non-negative integer, got \"" + value + "\"");
    }
    if (static_cast<uint64_t>(v) > max_value) {
        throw std::runtime_error(flag + ": " + value + " exceeds the maximum of " + std::to_string(max_value));
    }
    return static_cast<uint64_t>(v);
}

} // namespace devit
