#include "devit/client.h"
#include "devit/deadline.h"

#include <unistd.h>

namespace devit {

namespace {

struct LineOutcome {
    bool ok{false};
    std::string line;
    std::string error;
};

} // namespace

McpClient::McpClient(const std::string& cmd, std::chrono::milliseconds timeout)
    : timeout_(timeout) {
    SpawnOptions opts;
    opts.pipe_stdin = true;
    std::string err;
    if (!child_.spawn({"bash", "-lc", cmd}, opts, &err)) {
        throw std::runtime_error("spawn server: " + err);
    }
    stdin_fd_ = child_.take_stdin();
    reader_ = std::make_shared<FdLineReader>(child_.take_stdout());
}

McpClient::~McpClient() {
    if (stdin_fd_ >= 0) {
        (void)::close(stdin_fd_);
        stdin_fd_ = -1;
    }
    int code = 0;
    if (!child_.wait_for(std::chrono::milliseconds(1000), &code)) {
        child_.kill_group();
        (void)child_.wait();
    }
}

void McpClient::send(const std::string& line) {
    std::string err;
    if (stdin_fd_ < 0 || !write_all_fd(stdin_fd_, line + "\n", &err)) {
        throw std::runtime_error("write to server: " + (err.empty() ? std::string("stdin closed") : err));
    }
}

proto::Message McpClient::read_message() {
    std::shared_ptr<FdLineReader> reader = reader_;
    auto got = run_with_deadline([reader]() {
        LineOutcome o;
        do {
            o.ok = reader->read_line(&o.line, &o.error);
        } while (o.ok && o.line.find_first_not_of(" \t\r") == std::string::npos);
        return o;
    }, timeout_);

    if (!got) throw TimeoutError("timeout (no response within per-message deadline)");
    if (!got->ok) {
        if (got->error == "eof") throw std::runtime_error("server closed the stream");
        throw std::runtime_error("read from server: " + got->error);
    }

    proto::Message msg;
    std::string err;
    if (!proto::parse_message(got->line, &msg, &err)) {
        throw std::runtime_error("protocol: " + err);
    }
    return msg;
}

proto::Message McpClient::request(const std::string& line) {
    send(line);
    return read_message();
}

Capabilities McpClient::handshake(const std::string& client_version) {
    Capabilities caps;

    proto::Message pong = request(proto::encode(proto::kPing, nullptr));
    std::string bad = proto::expect_type(pong, proto::kPong);
    if (!bad.empty()) throw std::runtime_error("handshake: " + bad);

    json_object* vp = json_object_new_object();
    json_object_object_add(vp, "client", json_mini::new_string(client_version));
    proto::Message ver = request(proto::encode(proto::kVersion, vp));
    bad = proto::expect_type(ver, proto::kVersion);
    if (!bad.empty()) throw std::runtime_error("handshake: " + bad);
    caps.server_version = json_mini::get_string(ver.payload, "server").value_or("");
    caps.server_name = json_mini::get_string(ver.payload, "server_name").value_or("");

    proto::Message cap = request(proto::encode(proto::kCapabilities, nullptr));
    bad = proto::expect_type(cap, proto::kCapabilities);
    if (!bad.empty()) throw std::runtime_error("handshake: " + bad);
    caps.tools = json_mini::get_array_strings(cap.payload, "tools");
    return caps;
}

proto::Message McpClient::tool_call(const std::string& name, json_object* args) {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "name", json_mini::new_string(name));
    json_object_object_add(p, "args", args ? json_mini::share(args) : json_object_new_object());
    proto::Message reply = request(proto::encode(proto::kToolCall, p));
    if (reply.type != proto::kToolResult && reply.type != proto::kToolError) {
        std::string msg = json_mini::get_string(reply.payload, "message").value_or("");
        throw std::runtime_error("tool.call " + name + ": unexpected type: " + reply.type +
                                 (msg.empty() ? "" : " (" + msg + ")"));
    }
    return reply;
}

proto::Message McpClient::echo(const std::string& text) {
    json_mini::Doc args(json_object_new_object());
    json_object_object_add(args.root, "text", json_mini::new_string(text));
    return tool_call("echo", args.root);
}

} // namespace devit
