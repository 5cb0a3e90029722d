#include "devit/policy.h"
#include "devit/json_mini.h"
#include "devit/tools.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace devit {

const char* policy_name(Policy p) {
    switch (p) {
        case Policy::NEVER:      return "never";
        case Policy::ON_REQUEST: return "on_request";
        case Policy::ON_FAILURE: return "on_failure";
        case Policy::UNTRUSTED:  return "untrusted";
    }
    return "on_request";
}

std::optional<Policy> parse_policy(const std::string& s) {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "never") return Policy::NEVER;
    if (v == "on_request") return Policy::ON_REQUEST;
    if (v == "on_failure") return Policy::ON_FAILURE;
    if (v == "untrusted") return Policy::UNTRUSTED;
    return std::nullopt;
}

bool needs_pre_approval(Policy p, bool auto_yes) {
    if (auto_yes) return false;
    return p == Policy::ON_REQUEST || p == Policy::UNTRUSTED;
}

bool needs_post_approval(Policy p, bool auto_yes, bool result_ok) {
    if (auto_yes || result_ok) return false;
    return p == Policy::ON_FAILURE;
}

PolicyTable PolicyTable::defaults() {
    PolicyTable t;
    for (const auto& spec : tool_specs()) t.tools_[spec.name] = spec.default_policy;
    return t;
}

static Policy require_policy(const std::string& raw, const std::string& where) {
    auto p = parse_policy(raw);
    if (!p) throw std::runtime_error("config: unknown policy \"" + raw + "\" for " + where);
    return *p;
}

PolicyTable PolicyTable::load(const std::optional<std::filesystem::path>& config_path) {
    PolicyTable t = defaults();

    std::filesystem::path path = config_path.value_or(std::filesystem::path(kDefaultConfigPath));
    std::error_code ec;
    if (!config_path && !std::filesystem::exists(path, ec)) return t;

    std::ifstream f(path);
    if (!f) throw std::runtime_error("config: cannot open " + path.string());
    std::stringstream ss;
    ss << f.rdbuf();

    json_mini::Doc d = json_mini::parse(ss.str());
    if (!d || !json_mini::is_object(d.root)) {
        throw std::runtime_error("config: " + path.string() + " is not a JSON object");
    }

    json_object* approvals = json_mini::member(json_mini::member(d.root, "mcp"), "approvals");
    if (!approvals) return t;
    if (!json_mini::is_object(approvals)) {
        throw std::runtime_error("config: mcp.approvals must be an object");
    }

    json_object_object_foreach(approvals, key, val) {
        if (!val || !json_object_is_type(val, json_type_string)) {
            throw std::runtime_error(std::string("config: policy for ") + key + " must be a string");
        }
        Policy p = require_policy(json_object_get_string(val), key);
        if (std::string(key) == "default") {
            t.default_ = p;
        } else {
            t.tools_[key] = p;
        }
    }
    return t;
}

Policy PolicyTable::lookup(const std::string& tool) const {
    auto it = tools_.find(tool);
    return it == tools_.end() ? default_ : it->second;
}

json_object* PolicyTable::approvals_json() const {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "default", json_object_new_string(policy_name(default_)));
    json_object* tools = json_object_new_object();
    for (const auto& kv : tools_) {
        json_object_object_add(tools, kv.first.c_str(), json_object_new_string(policy_name(kv.second)));
    }
    json_object_object_add(root, "tools", tools);
    return root;
}

} // namespace devit
