#pragma once

#include "devit/json_mini.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace devit {

struct InvokeResult {
    int exit_code{-1};
    bool timed_out{false};
    std::string output;  // captured stdout (stderr is inherited)
    std::string error;   // spawn/io/timeout error, not child stderr
};

// Spawn argv, optionally write stdin_data to the child's stdin and close it,
// drain stdout on a worker and race that against timeout. On expiry the
// child's process group is killed and reaped, res->timed_out is set and no
// partial output is returned. Returns true when stdout reached EOF in time.
// A child that exits without reading its stdin does not raise SIGPIPE in
// the caller.
bool invoke_capture(const std::vector<std::string>& argv,
                    const std::optional<std::string>& stdin_data,
                    std::chrono::milliseconds timeout,
                    InvokeResult* res);

// Result of re-invoking the host CLI's own tool subcommands.
struct CliCallResult {
    bool timed_out{false};
    std::string error;
    json_mini::Doc value;
};

// `<bin> tool list` with stdin closed.
bool devit_tool_list(const std::string& bin, std::chrono::milliseconds timeout, CliCallResult* res);

// `<bin> tool call -` with request_json on stdin.
bool devit_tool_call(const std::string& bin, const std::string& request_json,
                     std::chrono::milliseconds timeout, CliCallResult* res);

} // namespace devit
