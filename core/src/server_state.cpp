#include "devit/server_state.h"

namespace devit {

static json_object* counters_json(const CallCounters& c) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "calls", json_object_new_int64(static_cast<int64_t>(c.calls)));
    json_object_object_add(o, "ok", json_object_new_int64(static_cast<int64_t>(c.ok)));
    json_object_object_add(o, "errors", json_object_new_int64(static_cast<int64_t>(c.errors)));
    return o;
}

void ServerState::record(const std::string& tool, bool ok) {
    auto& c = per_tool_[tool];
    c.calls++;
    total_.calls++;
    if (ok) {
        c.ok++;
        total_.ok++;
    } else {
        c.errors++;
        total_.errors++;
    }
}

int64_t ServerState::uptime_ms() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - start_).count();
}

const CallCounters* ServerState::tool(const std::string& name) const {
    auto it = per_tool_.find(name);
    return it == per_tool_.end() ? nullptr : &it->second;
}

json_object* ServerState::stats_json() const {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "uptime_ms", json_object_new_int64(uptime_ms()));
    json_object_object_add(root, "total", counters_json(total_));
    json_object* tools = json_object_new_object();
    for (const auto& kv : per_tool_) {
        json_object_object_add(tools, kv.first.c_str(), counters_json(kv.second));
    }
    json_object_object_add(root, "tools", tools);
    return root;
}

} // namespace devit
