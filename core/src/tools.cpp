#include "devit/tools.h"

namespace devit {

const std::vector<ToolSpec>& tool_specs() {
    static const std::vector<ToolSpec> specs = {
        {ToolId::DEVIT_TOOL_LIST,     "devit.tool_list",     Policy::NEVER,      false, false, {}},
        {ToolId::DEVIT_TOOL_CALL,     "devit.tool_call",     Policy::ON_REQUEST, false, true,
            {{"tool", json_type_string}, {"args", json_type_object}}},
        {ToolId::PLUGIN_INVOKE,       "plugin.invoke",       Policy::ON_REQUEST, false, true,
            {{"id", json_type_string}, {"payload", json_type_object}}},
        {ToolId::SERVER_POLICY,       "server.policy",       Policy::NEVER,      true,  false, {}},
        {ToolId::SERVER_HEALTH,       "server.health",       Policy::NEVER,      true,  false, {}},
        {ToolId::SERVER_STATS,        "server.stats",        Policy::NEVER,      true,  false, {}},
        {ToolId::SERVER_CONTEXT_HEAD, "server.context_head", Policy::NEVER,      true,  false, {}},
        {ToolId::ECHO,                "echo",                Policy::NEVER,      true,  false, {}},
    };
    return specs;
}

const ToolSpec* find_tool(const std::string& name) {
    for (const auto& s : tool_specs()) {
        if (name == s.name) return &s;
    }
    return nullptr;
}

std::vector<std::string> capability_names() {
    std::vector<std::string> out;
    out.reserve(tool_specs().size());
    for (const auto& s : tool_specs()) out.emplace_back(s.name);
    return out;
}

std::optional<SchemaError> validate_args(const ToolSpec& spec, json_object* args) {
    if (args && !json_object_is_type(args, json_type_object)) {
        return SchemaError{"payload.args", "type_mismatch"};
    }
    for (const auto& rule : spec.required) {
        json_object* v = nullptr;
        if (!args || !json_object_object_get_ex(args, rule.key, &v) || !v) {
            return SchemaError{std::string("payload.") + rule.key, "missing"};
        }
        if (!json_object_is_type(v, rule.type)) {
            return SchemaError{std::string("payload.") + rule.key, "type_mismatch"};
        }
    }
    return std::nullopt;
}

} // namespace devit
