#pragma once

// Approval policies.
//
//   NEVER       run without asking
//   ON_REQUEST  ask before running (pre checkpoint)
//   ON_FAILURE  ask only when the tool reports failure (post checkpoint)
//   UNTRUSTED   treated like ON_REQUEST by the pre checkpoint
//
// A server started with auto-yes passes both checkpoints unconditionally.

#include <json-c/json.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace devit {

enum class Policy { NEVER, ON_REQUEST, ON_FAILURE, UNTRUSTED };

const char* policy_name(Policy p);

// Case-insensitive; nullopt for anything outside the four names.
std::optional<Policy> parse_policy(const std::string& s);

bool needs_pre_approval(Policy p, bool auto_yes);
bool needs_post_approval(Policy p, bool auto_yes, bool result_ok);

constexpr const char* kDefaultConfigPath = ".devit/devit.json";

// Tool name -> policy, built once at startup and read-only afterwards.
// Unlisted tools resolve to default_policy() (ON_REQUEST unless the config
// file sets "default").
class PolicyTable {
public:
    // Built-in defaults for every known tool.
    static PolicyTable defaults();

    // Defaults merged with {"mcp":{"approvals":{...}}} from config_path.
    // Without an explicit path, .devit/devit.json is read if it exists.
    // Throws std::runtime_error for an unreadable/unparsable file or an
    // unknown policy string.
    static PolicyTable load(const std::optional<std::filesystem::path>& config_path);

    Policy lookup(const std::string& tool) const;
    Policy default_policy() const { return default_; }
    const std::map<std::string, Policy>& tools() const { return tools_; }

    void set(const std::string& tool, Policy p) { tools_[tool] = p; }
    void set_default(Policy p) { default_ = p; }

    // {"default": "...", "tools": {...}} (new reference)
    json_object* approvals_json() const;

private:
    std::map<std::string, Policy> tools_;
    Policy default_{Policy::ON_REQUEST};
};

} // namespace devit
