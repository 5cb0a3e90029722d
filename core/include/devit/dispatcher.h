#pragma once

#include "devit/audit.h"
#include "devit/context_index.h"
#include "devit/json_mini.h"
#include "devit/policy.h"
#include "devit/rate_limiter.h"
#include "devit/server_state.h"
#include "devit/tools.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace devit {

constexpr const char* kServerName = "devit-mcpd";
constexpr const char* kDefaultServerVersion = "devit-mcpd/0.1.0";

struct ServerConfig {
    std::string server_version{kDefaultServerVersion};
    std::string devit_bin{"devit"};
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    bool auto_yes{false};
    bool dry_run{false};
    Limits limits;
    AuditOptions audit;
    std::optional<std::filesystem::path> plugins_dir;  // default_registry_dir() when unset
    std::filesystem::path index_path{kDefaultIndexPath};
};

// Outcome of running one tool handler.
struct ToolOutput {
    bool executed{false};  // false: spawn/io/timeout/parse failure, see error
    bool timed_out{false};
    std::string error;
    json_mini::Doc result;
};

// One request line in, one reply line out. Strictly sequential: a call,
// including any child it spawns, is fully handled before the next line.
// Gate order for tool.call: dry-run, policy pre, payload size, schema, rate
// limit, execute, policy post.
class Dispatcher {
public:
    Dispatcher(ServerConfig cfg, PolicyTable policies);

    // Reply line without the trailing newline; "" for a blank line.
    std::string handle_line(const std::string& line);

    const ServerState& state() const { return state_; }
    const ServerConfig& config() const { return cfg_; }
    const PolicyTable& policies() const { return policies_; }

    // server.policy document (new reference).
    json_object* policy_document() const;

private:
    std::string handle_tool_call(json_object* payload);
    ToolOutput run_tool(const ToolSpec& spec, json_object* args);

    ToolOutput run_devit_list();
    ToolOutput run_devit_call(json_object* args);
    ToolOutput run_plugin_invoke(json_object* args);
    ToolOutput run_health();
    ToolOutput run_context_head(json_object* args);
    ToolOutput run_echo(json_object* args);

    json_object* limits_json() const;
    json_object* audit_json() const;

    ServerConfig cfg_;
    PolicyTable policies_;
    RateLimiter limiter_;
    AuditLog audit_;
    ServerState state_;
};

} // namespace devit
