#pragma once

// WASI plugins: JSON on stdin, JSON on stdout, run through the `wasmtime`
// binary. Registry layout: <root>/<id>/devit-plugin.json, with root taken
// from DEVIT_PLUGINS_DIR or .devit/plugins. The sandbox is closed by
// default: no --dir pre-opens and no env unless the manifest lists them.

#include "devit/json_mini.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devit {

constexpr const char* kPluginManifestName = "devit-plugin.json";
constexpr const char* kWasiRuntime = "wasmtime";

struct PluginManifest {
    std::string id;
    std::optional<std::string> name;
    std::string wasm;  // relative to the manifest's directory
    std::optional<std::string> version;
    std::vector<std::string> allowed_dirs;
    std::vector<std::string> env;  // KEY=VALUE
};

struct PluginInfo {
    std::string id;
    std::string name;  // falls back to id
    std::optional<std::string> version;
    std::string manifest_path;
};

std::filesystem::path default_registry_dir();

// Throws std::runtime_error on read/parse failure or missing id/wasm.
PluginManifest load_manifest(const std::filesystem::path& path);

// Subdirectories of root holding a manifest, sorted by id. Invalid manifests
// are skipped with a warning. A missing root yields an empty list.
std::vector<PluginInfo> discover_plugins(const std::optional<std::filesystem::path>& root);

json_object* plugin_infos_json(const std::vector<PluginInfo>& infos);

// `wasmtime run --dir=<d>... --env=<kv>... <wasm>`
std::vector<std::string> wasi_command(const std::string& runtime,
                                      const PluginManifest& m,
                                      const std::filesystem::path& wasm_path);

// First line of out whose trimmed start is '{' or '['.
std::optional<std::string> first_json_line(const std::string& out);

struct PluginCallResult {
    bool timed_out{false};
    std::string error;
    json_mini::Doc value;
};

bool invoke_manifest(const std::filesystem::path& manifest_path,
                     const std::string& request_json,
                     std::chrono::milliseconds timeout,
                     PluginCallResult* res);

bool invoke_by_id(const std::string& id,
                  const std::string& request_json,
                  std::chrono::milliseconds timeout,
                  const std::optional<std::filesystem::path>& root,
                  PluginCallResult* res);

} // namespace devit
