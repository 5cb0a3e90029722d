#pragma once

// Line-delimited JSON framing: one object per line, {"type": ..., "payload": {...}}.
//
//   ping                     -> pong
//   version {client}         -> version {server, server_name}
//   capabilities             -> capabilities {tools: [...]}
//   tool.call {name, args}   -> tool.result {...} | tool.error {...}
//   anything else            -> error {message}

#include "devit/json_mini.h"

#include <string>

namespace devit::proto {

constexpr const char* kPing = "ping";
constexpr const char* kPong = "pong";
constexpr const char* kVersion = "version";
constexpr const char* kCapabilities = "capabilities";
constexpr const char* kToolCall = "tool.call";
constexpr const char* kToolResult = "tool.result";
constexpr const char* kToolError = "tool.error";
constexpr const char* kError = "error";

struct Message {
    std::string type;
    json_object* payload{nullptr};  // borrowed from doc; may be nullptr
    json_mini::Doc doc;
};

// Returns false with *err for malformed JSON, a non-object, or a missing type.
bool parse_message(const std::string& line, Message* out, std::string* err);

// Serialized single line (no '\n'). Takes ownership of payload (may be nullptr).
std::string encode(const char* type, json_object* payload);

std::string encode_error(const std::string& message);

// "" when msg has the expected type, otherwise a protocol error text.
std::string expect_type(const Message& msg, const char* expected);

} // namespace devit::proto
