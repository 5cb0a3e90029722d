#include "test_common.h"

#include "devit/audit.h"
#include "devit/json_mini.h"

#include <sstream>
#include <vector>

static std::vector<std::string> lines_of(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

int main() {
    using namespace devit;
    namespace fs = std::filesystem;
    fs::path dir = fresh_dir("devit_test_audit");

    AuditOptions opts;
    opts.path = dir / "logs" / "journal.jsonl";
    opts.key_path = dir / "keys" / "hmac.key";
    opts.auto_yes = false;

    {
        AuditLog log(opts);
        log.pre("devit.tool_call", "pre-deny", "on_request");
        log.done("echo", true, 3, std::nullopt, "never");
        log.done("devit.tool_list", false, 12, std::string("devit tool list: timeout after 50ms"), "never");
    }

    // Key created once, 32 bytes, owner-only.
    expect_true(fs::exists(opts.key_path), "key file created");
    const std::string key = read_file(opts.key_path);
    expect_eq_ll((long long)key.size(), (long long)kHmacKeyBytes, "key size");
    auto perms = fs::status(opts.key_path).permissions();
    expect_true((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none, "key mode 0600");

    auto lines = lines_of(read_file(opts.path));
    expect_eq_ll((long long)lines.size(), 3, "three records");

    for (const auto& l : lines) {
        expect_true(verify_record(key, l), "signature verifies: " + l);
    }

    {
        json_mini::Doc pre = json_mini::parse(lines[0]);
        expect_true(json_mini::is_object(pre.root), "pre record is an object");
        expect_eq_str(json_mini::get_string(pre.root, "tool").value_or(""), "devit.tool_call", "pre tool");
        expect_eq_str(json_mini::get_string(pre.root, "phase").value_or(""), "pre-deny", "pre phase");
        expect_eq_str(json_mini::get_string(pre.root, "policy").value_or(""), "on_request", "pre policy");
        expect_true(json_mini::get_bool(pre.root, "auto_yes") == false, "pre auto_yes");
        const std::string ts = json_mini::get_string(pre.root, "ts").value_or("");
        expect_eq_ll((long long)ts.size(), 24, "ts length: " + ts);
        expect_true(ts[10] == 'T' && ts.back() == 'Z', "ts shape: " + ts);
        expect_true(json_mini::get_string(pre.root, "sig").has_value(), "sig member present");
    }
    {
        json_mini::Doc done = json_mini::parse(lines[2]);
        expect_eq_str(json_mini::get_string(done.root, "phase").value_or(""), "done", "done phase");
        expect_true(json_mini::get_bool(done.root, "ok") == false, "done ok=false");
        expect_eq_ll(json_mini::get_int(done.root, "duration_ms").value_or(-1), 12, "duration");
        expect_eq_str(json_mini::get_string(done.root, "error").value_or(""),
                      "devit tool list: timeout after 50ms", "error text");
        json_mini::Doc ok = json_mini::parse(lines[1]);
        expect_true(!json_mini::has_member(ok.root, "error"), "no error member on success");
    }

    // Any byte change breaks the signature.
    {
        std::string tampered = lines[1];
        size_t pos = tampered.find("\"echo\"");
        expect_true(pos != std::string::npos, "echo in record");
        tampered[pos + 1] = 'E';
        expect_true(!verify_record(key, tampered), "tampered body rejected");

        std::string flipped = lines[1];
        flipped.replace(flipped.find("true"), 4, "fals");
        expect_true(!verify_record(key, flipped), "flipped flag rejected");

        expect_true(!verify_record(std::string(32, 'x'), lines[1]), "wrong key rejected");
        expect_true(!verify_record(key, "{\"tool\":\"echo\"}"), "unsigned line rejected");
    }

    // Only the closing brace of the record is replaced.
    {
        const std::string body = "{\"a\":{\"b\":1}}";
        const std::string signed_line = sign_record(key, body);
        expect_true(signed_line.rfind("{\"a\":{\"b\":1},\"sig\":\"", 0) == 0, "sig spliced after nested object");
        expect_true(verify_record(key, signed_line), "nested body verifies");
    }

    // Second logger reuses the persisted key and appends.
    {
        AuditLog log(opts);
        log.pre("echo", "rate-limit", "never");
        expect_eq_str(read_file(opts.key_path), key, "key unchanged");
        auto after = lines_of(read_file(opts.path));
        expect_eq_ll((long long)after.size(), 4, "appended");
        expect_true(verify_record(key, after[3]), "appended record verifies");
    }

    // Existing longer key is used as-is.
    {
        fs::path kp = dir / "long.key";
        write_file(kp, std::string(40, 'k'));
        std::string k, err;
        expect_true(load_or_create_key(kp, &k, &err), "load long key: " + err);
        expect_eq_ll((long long)k.size(), 40, "long key kept");
    }

    // Short key file is replaced.
    {
        fs::path kp = dir / "short.key";
        write_file(kp, "abc");
        std::string k, err;
        expect_true(load_or_create_key(kp, &k, &err), "replace short key: " + err);
        expect_eq_ll((long long)k.size(), 32, "fresh key");
        expect_eq_str(read_file(kp), k, "fresh key persisted");
    }

    // Disabled audit writes nothing.
    {
        AuditOptions off = opts;
        off.enabled = false;
        off.path = dir / "off" / "journal.jsonl";
        off.key_path = dir / "off" / "hmac.key";
        AuditLog log(off);
        log.pre("echo", "pre-deny", "never");
        log.done("echo", true, 1, std::nullopt, "never");
        expect_true(!fs::exists(off.path), "no journal when disabled");
        expect_true(!fs::exists(off.key_path), "no key when disabled");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_audit: ALL PASSED" << std::endl;
    return 0;
}
