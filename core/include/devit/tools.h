#pragma once

#include "devit/policy.h"

#include <json-c/json.h>

#include <optional>
#include <string>
#include <vector>

namespace devit {

// Every tool the server can dispatch. Handlers switch over this, so adding
// an entry without a handler is a compile-time warning.
enum class ToolId {
    DEVIT_TOOL_LIST,
    DEVIT_TOOL_CALL,
    PLUGIN_INVOKE,
    SERVER_POLICY,
    SERVER_HEALTH,
    SERVER_STATS,
    SERVER_CONTEXT_HEAD,
    ECHO,
};

struct FieldRule {
    const char* key;
    json_type type;
};

struct ToolSpec {
    ToolId id;
    const char* name;
    Policy default_policy;
    bool introspection;   // allowed under dry-run
    bool size_checked;    // args subject to max_json_kb
    std::vector<FieldRule> required;
};

// In capability (advertised) order.
const std::vector<ToolSpec>& tool_specs();

const ToolSpec* find_tool(const std::string& name);

std::vector<std::string> capability_names();

struct SchemaError {
    std::string field;  // "payload.<key>"
    std::string kind;   // "missing" | "type_mismatch"
};

// args may be nullptr (treated as {}).
std::optional<SchemaError> validate_args(const ToolSpec& spec, json_object* args);

} // namespace devit
