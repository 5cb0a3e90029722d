#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace devit {

// SHA256
std::vector<uint8_t> sha256_bytes(const uint8_t* data, size_t n);

// HMAC-SHA256, raw 32-byte digest. Key and message are arbitrary bytes.
std::vector<uint8_t> hmac_sha256(const std::string& key, const uint8_t* data, size_t n);
inline std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& s) {
    return hmac_sha256(key, reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// Standard alphabet, '=' padded.
std::string base64_encode(const std::vector<uint8_t>& bytes);

// Constant-time string equality (for comparing encoded signatures)
bool constant_time_eq(const std::string& a, const std::string& b);

// Fill *out with n bytes from getrandom(2), falling back to /dev/urandom.
bool secure_random_bytes(size_t n, std::string* out, std::string* err);

} // namespace devit
