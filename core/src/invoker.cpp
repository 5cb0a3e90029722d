#include "devit/invoker.h"
#include "devit/deadline.h"
#include "devit/proc.h"

#include <algorithm>
#include <iostream>
#include <thread>

#include <unistd.h>

namespace devit {

namespace {

struct DrainOutcome {
    bool ok{false};
    std::string data;
    std::string error;
};

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

bool parse_cli_output(const InvokeResult& ir, const char* what, CliCallResult* res) {
    json_mini::Doc d = json_mini::parse(trim(ir.output));
    if (!d) {
        res->error = std::string(what) + ": invalid JSON";
        if (ir.exit_code != 0) res->error += " (exit " + std::to_string(ir.exit_code) + ")";
        return false;
    }
    res->value = std::move(d);
    return true;
}

} // namespace

bool invoke_capture(const std::vector<std::string>& argv,
                    const std::optional<std::string>& stdin_data,
                    std::chrono::milliseconds timeout,
                    InvokeResult* res) {
    if (!res) return false;
    *res = InvokeResult{};

    ChildProcess child;
    SpawnOptions opts;
    opts.pipe_stdin = stdin_data.has_value();
    std::string err;
    if (!child.spawn(argv, opts, &err)) {
        res->error = "spawn " + (argv.empty() ? std::string("<empty>") : argv[0]) + ": " + err;
        return false;
    }
    const auto start = std::chrono::steady_clock::now();

    // The writer gets its own thread so a child that floods stdout before
    // reading stdin cannot deadlock against us.
    if (stdin_data) {
        int in_fd = child.take_stdin();
        std::string data = *stdin_data;
        std::thread([in_fd, data]() {
            std::string werr;
            if (!write_all_fd(in_fd, data, &werr)) {
                std::cerr << "[WARN] child stdin: " << werr << std::endl;
            }
            (void)::close(in_fd);
        }).detach();
    }

    int out_fd = child.take_stdout();
    auto drained = run_with_deadline([out_fd]() {
        DrainOutcome d;
        d.ok = read_all_fd(out_fd, &d.data, &d.error);
        (void)::close(out_fd);
        return d;
    }, timeout);

    if (!drained) {
        child.kill_group();
        (void)child.wait();
        res->timed_out = true;
        res->error = "timeout after " + std::to_string(timeout.count()) + "ms";
        return false;
    }
    if (!drained->ok) {
        child.kill_group();
        (void)child.wait();
        res->error = drained->error;
        return false;
    }

    // stdout is closed; the child gets what is left of the deadline to exit.
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    auto remaining = std::max(timeout - elapsed, std::chrono::milliseconds(0));
    int code = -1;
    if (!child.wait_for(remaining, &code)) {
        child.kill_group();
        (void)child.wait();
        res->timed_out = true;
        res->error = "timeout after " + std::to_string(timeout.count()) + "ms";
        return false;
    }

    res->exit_code = code;
    res->output = std::move(drained->data);
    if (code == 127 && res->output.empty()) {
        res->error = "exec failed: " + argv[0];
        return false;
    }
    return true;
}

bool devit_tool_list(const std::string& bin, std::chrono::milliseconds timeout, CliCallResult* res) {
    if (!res) return false;
    *res = CliCallResult{};
    InvokeResult ir;
    if (!invoke_capture({bin, "tool", "list"}, std::nullopt, timeout, &ir)) {
        res->timed_out = ir.timed_out;
        res->error = "devit tool list: " + ir.error;
        return false;
    }
    return parse_cli_output(ir, "devit tool list", res);
}

bool devit_tool_call(const std::string& bin, const std::string& request_json,
                     std::chrono::milliseconds timeout, CliCallResult* res) {
    if (!res) return false;
    *res = CliCallResult{};
    InvokeResult ir;
    if (!invoke_capture({bin, "tool", "call", "-"}, request_json, timeout, &ir)) {
        res->timed_out = ir.timed_out;
        res->error = "devit tool call: " + ir.error;
        return false;
    }
    return parse_cli_output(ir, "devit tool call", res);
}

} // namespace devit
