#include "devit/protocol.h"

namespace devit::proto {

static std::string clip(const std::string& s) {
    constexpr size_t kMax = 200;
    if (s.size() <= kMax) return s;
    return s.substr(0, kMax) + "...";
}

bool parse_message(const std::string& line, Message* out, std::string* err) {
    if (!out) return false;
    json_mini::Doc d = json_mini::parse(line);
    if (!d) {
        if (err) *err = "invalid json: " + clip(line);
        return false;
    }
    if (!json_mini::is_object(d.root)) {
        if (err) *err = "message must be a JSON object";
        return false;
    }
    auto type = json_mini::get_string(d.root, "type");
    if (!type) {
        if (err) *err = "missing type";
        return false;
    }
    out->type = *type;
    out->payload = json_mini::member(d.root, "payload");
    out->doc = std::move(d);
    return true;
}

std::string encode(const char* type, json_object* payload) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "type", json_object_new_string(type));
    if (payload) json_object_object_add(root, "payload", payload);
    std::string s = json_mini::dump(root);
    json_object_put(root);
    return s;
}

std::string encode_error(const std::string& message) {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "message", json_mini::new_string(message));
    return encode(kError, p);
}

std::string expect_type(const Message& msg, const char* expected) {
    if (msg.type == expected) return "";
    return "unexpected type: " + msg.type + ", want " + expected;
}

} // namespace devit::proto
