#include "devit/audit.h"
#include "devit/crypto.h"
#include "devit/json_mini.h"

#include <json-c/json.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <iterator>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace devit {

static const char kSigMarker[] = ",\"sig\":\"";

std::string rfc3339_millis_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

bool load_or_create_key(const std::filesystem::path& path, std::string* key, std::string* err) {
    if (!key) return false;
    {
        std::ifstream f(path, std::ios::binary);
        if (f) {
            std::string data((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
            if (data.size() >= kHmacKeyBytes) {
                *key = std::move(data);
                return true;
            }
        }
    }

    std::string fresh;
    if (!secure_random_bytes(kHmacKeyBytes, &fresh, err)) return false;

    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            if (err) *err = "create_directories: " + ec.message();
            return false;
        }
    }

    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        if (err) *err = std::string("open key: ") + std::strerror(errno);
        return false;
    }
    size_t off = 0;
    while (off < fresh.size()) {
        ssize_t n = ::write(fd, fresh.data() + off, fresh.size() - off);
        if (n > 0) { off += static_cast<size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (err) *err = std::string("write key: ") + std::strerror(errno);
        ::close(fd);
        return false;
    }
    ::close(fd);
    *key = std::move(fresh);
    return true;
}

std::string sign_record(const std::string& key, const std::string& body) {
    const std::string sig = base64_encode(hmac_sha256(key, body));
    std::string head = body;
    if (!head.empty() && head.back() == '}') head.pop_back();
    return head + kSigMarker + sig + "\"}";
}

bool verify_record(const std::string& key, const std::string& line) {
    size_t pos = line.rfind(kSigMarker);
    if (pos == std::string::npos) return false;
    const size_t sig_start = pos + std::strlen(kSigMarker);
    if (line.size() < sig_start + 2 || line.compare(line.size() - 2, 2, "\"}") != 0) return false;
    const std::string sig = line.substr(sig_start, line.size() - 2 - sig_start);
    const std::string body = line.substr(0, pos) + "}";
    return constant_time_eq(sig, base64_encode(hmac_sha256(key, body)));
}

std::string append_line_locked(const std::filesystem::path& path, const std::string& line) {
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }

    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) return std::string("open: ") + std::strerror(errno);

    if (::flock(fd, LOCK_EX) != 0) {
        std::string err = std::string("flock: ") + std::strerror(errno);
        ::close(fd);
        return err;
    }

    std::string err;
    const std::string rec = line + "\n";
    size_t off = 0;
    while (off < rec.size()) {
        ssize_t n = ::write(fd, rec.data() + off, rec.size() - off);
        if (n > 0) { off += static_cast<size_t>(n); continue; }
        if (n < 0 && errno == EINTR) continue;
        err = std::string("write: ") + std::strerror(errno);
        break;
    }
    (void)::flock(fd, LOCK_UN);
    ::close(fd);
    return err;
}

void AuditLog::write(const std::string& body) {
    if (key_.empty()) {
        std::string err;
        if (!load_or_create_key(opts_.key_path, &key_, &err)) {
            std::cerr << "[WARN] audit key " << opts_.key_path.string() << ": " << err << std::endl;
            key_.clear();
            return;
        }
    }
    std::string err = append_line_locked(opts_.path, sign_record(key_, body));
    if (!err.empty()) {
        std::cerr << "[WARN] audit append failed: " << err << std::endl;
    }
}

void AuditLog::pre(const std::string& tool, const std::string& phase, const std::string& policy) {
    if (!opts_.enabled) return;
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "ts", json_object_new_string(rfc3339_millis_now().c_str()));
    json_object_object_add(rec, "tool", json_mini::new_string(tool));
    json_object_object_add(rec, "phase", json_mini::new_string(phase));
    json_object_object_add(rec, "policy", json_mini::new_string(policy));
    json_object_object_add(rec, "auto_yes", json_object_new_boolean(opts_.auto_yes ? 1 : 0));
    std::string body = json_mini::dump(rec);
    json_object_put(rec);
    write(body);
}

void AuditLog::done(const std::string& tool, bool ok, int64_t duration_ms,
                    const std::optional<std::string>& error, const std::string& policy) {
    if (!opts_.enabled) return;
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "ts", json_object_new_string(rfc3339_millis_now().c_str()));
    json_object_object_add(rec, "tool", json_mini::new_string(tool));
    json_object_object_add(rec, "phase", json_object_new_string("done"));
    json_object_object_add(rec, "ok", json_object_new_boolean(ok ? 1 : 0));
    json_object_object_add(rec, "duration_ms", json_object_new_int64(duration_ms));
    if (error) json_object_object_add(rec, "error", json_mini::new_string(*error));
    json_object_object_add(rec, "policy", json_mini::new_string(policy));
    json_object_object_add(rec, "auto_yes", json_object_new_boolean(opts_.auto_yes ? 1 : 0));
    std::string body = json_mini::dump(rec);
    json_object_put(rec);
    write(body);
}

} // namespace devit
