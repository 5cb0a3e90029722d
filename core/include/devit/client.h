#pragma once

#include "devit/json_mini.h"
#include "devit/proc.h"
#include "devit/protocol.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace devit {

constexpr const char* kDefaultClientVersion = "0.2.0-rc.1";

// No reply within the per-message deadline.
class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Capabilities {
    std::string server_version;
    std::string server_name;
    std::vector<std::string> tools;
};

// Client side of a tool-call session. The server command runs through
// `bash -lc` in its own process group; every reply is awaited with the same
// worker-plus-deadline race the server uses for its children. Protocol and
// transport failures throw std::runtime_error, an expired deadline throws
// TimeoutError, after which the client must be discarded.
class McpClient {
public:
    McpClient(const std::string& cmd, std::chrono::milliseconds timeout);
    ~McpClient();
    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;

    // ping -> pong, version -> version, capabilities -> capabilities.
    Capabilities handshake(const std::string& client_version);

    // Reply to one tool.call: tool.result or tool.error. args is borrowed
    // (nullptr sends {}).
    proto::Message tool_call(const std::string& name, json_object* args);

    proto::Message echo(const std::string& text);

private:
    void send(const std::string& line);
    proto::Message request(const std::string& line);
    proto::Message read_message();

    ChildProcess child_;
    int stdin_fd_{-1};
    std::shared_ptr<FdLineReader> reader_;
    std::chrono::milliseconds timeout_;
};

} // namespace devit
