#pragma once

#include <json-c/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace devit {

struct CallCounters {
    uint64_t calls{0};
    uint64_t ok{0};
    uint64_t errors{0};
};

// In-memory call counters for the introspection tools. Reset every process
// start; owned by the dispatch loop.
class ServerState {
public:
    ServerState() : start_(std::chrono::steady_clock::now()) {}

    void record(const std::string& tool, bool ok);

    int64_t uptime_ms() const;
    const CallCounters& totals() const { return total_; }

    // nullptr if the tool was never called
    const CallCounters* tool(const std::string& name) const;

    // {"uptime_ms","total":{calls,ok,errors},"tools":{name:{...}}} (new reference)
    json_object* stats_json() const;

private:
    std::chrono::steady_clock::time_point start_;
    CallCounters total_;
    std::map<std::string, CallCounters> per_tool_;
};

} // namespace devit
