#include "devit/plugins.h"
#include "devit/invoker.h"
#include "devit/proc.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace devit {

static std::string slurp(const std::filesystem::path& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open: " + path.string());
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::filesystem::path default_registry_dir() {
    if (const char* p = std::getenv("DEVIT_PLUGINS_DIR")) {
        if (*p) return std::filesystem::path(p);
    }
    return std::filesystem::path(".devit/plugins");
}

PluginManifest load_manifest(const std::filesystem::path& path) {
    const std::string j = slurp(path);
    json_mini::Doc d = json_mini::parse(j);
    if (!d || !json_mini::is_object(d.root)) {
        throw std::runtime_error("manifest " + path.string() + ": not a JSON object");
    }

    PluginManifest m;
    m.id = json_mini::get_string(d.root, "id").value_or("");
    m.wasm = json_mini::get_string(d.root, "wasm").value_or("");
    if (m.id.empty()) throw std::runtime_error("manifest " + path.string() + ": missing id");
    if (m.wasm.empty()) throw std::runtime_error("manifest " + path.string() + ": missing wasm");
    m.name = json_mini::get_string(d.root, "name");
    m.version = json_mini::get_string(d.root, "version");
    m.allowed_dirs = json_mini::get_array_strings(d.root, "allowed_dirs");
    m.env = json_mini::get_array_strings(d.root, "env");
    return m;
}

std::vector<PluginInfo> discover_plugins(const std::optional<std::filesystem::path>& root) {
    namespace fs = std::filesystem;
    const fs::path dir = root.value_or(default_registry_dir());
    std::vector<PluginInfo> out;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;

    std::vector<fs::path> candidates;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_directory(entry_ec)) continue;
        fs::path manifest = it->path() / kPluginManifestName;
        if (fs::exists(manifest, entry_ec)) candidates.push_back(manifest);
    }
    if (ec) {
        std::cerr << "[WARN] plugin registry " << dir.string() << ": " << ec.message() << std::endl;
    }

    for (const auto& manifest : candidates) {
        try {
            PluginManifest m = load_manifest(manifest);
            PluginInfo info;
            info.id = m.id;
            info.name = m.name.value_or(m.id);
            info.version = m.version;
            info.manifest_path = manifest.string();
            out.push_back(std::move(info));
        } catch (const std::exception& e) {
            std::cerr << "[WARN] invalid plugin manifest " << manifest.string() << ": " << e.what() << std::endl;
        }
    }

    std::sort(out.begin(), out.end(), [](const PluginInfo& a, const PluginInfo& b) { return a.id < b.id; });
    return out;
}

json_object* plugin_infos_json(const std::vector<PluginInfo>& infos) {
    json_object* arr = json_object_new_array();
    for (const auto& p : infos) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "id", json_mini::new_string(p.id));
        json_object_object_add(o, "name", json_mini::new_string(p.name));
        json_object_object_add(o, "version", p.version ? json_mini::new_string(*p.version) : nullptr);
        json_object_object_add(o, "manifest_path", json_mini::new_string(p.manifest_path));
        json_object_array_add(arr, o);
    }
    return arr;
}

std::vector<std::string> wasi_command(const std::string& runtime,
                                      const PluginManifest& m,
                                      const std::filesystem::path& wasm_path) {
    std::vector<std::string> argv = {runtime, "run"};
    for (const auto& d : m.allowed_dirs) argv.push_back("--dir=" + d);
    for (const auto& kv : m.env) argv.push_back("--env=" + kv);
    argv.push_back(wasm_path.string());
    return argv;
}

std::optional<std::string> first_json_line(const std::string& out) {
    std::stringstream ss(out);
    std::string line;
    while (std::getline(ss, line)) {
        size_t b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos) continue;
        if (line[b] == '{' || line[b] == '[') return line.substr(b);
    }
    return std::nullopt;
}

bool invoke_manifest(const std::filesystem::path& manifest_path,
                     const std::string& request_json,
                     std::chrono::milliseconds timeout,
                     PluginCallResult* res) {
    if (!res) return false;
    *res = PluginCallResult{};

    auto runtime = which(kWasiRuntime);
    if (!runtime) {
        res->error = std::string("required binary ") + kWasiRuntime + " not found in PATH";
        return false;
    }

    PluginManifest m;
    try {
        m = load_manifest(manifest_path);
    } catch (const std::exception& e) {
        res->error = e.what();
        return false;
    }

    std::filesystem::path base = manifest_path.parent_path();
    if (base.empty()) base = ".";
    const std::filesystem::path wasm_path = base / m.wasm;
    std::error_code ec;
    if (!std::filesystem::exists(wasm_path, ec)) {
        res->error = "wasm file not found: " + wasm_path.string();
        return false;
    }

    InvokeResult ir;
    if (!invoke_capture(wasi_command(*runtime, m, wasm_path), request_json, timeout, &ir)) {
        res->timed_out = ir.timed_out;
        res->error = ir.timed_out ? "timeout waiting plugin output" : ir.error;
        return false;
    }

    auto line = first_json_line(ir.output);
    if (!line) {
        res->error = "no JSON found on plugin stdout";
        return false;
    }
    json_mini::Doc d = json_mini::parse(*line);
    if (!d) {
        res->error = "invalid JSON: " + *line;
        return false;
    }
    res->value = std::move(d);
    return true;
}

bool invoke_by_id(const std::string& id,
                  const std::string& request_json,
                  std::chrono::milliseconds timeout,
                  const std::optional<std::filesystem::path>& root,
                  PluginCallResult* res) {
    if (!res) return false;
    *res = PluginCallResult{};
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        res->error = "invalid plugin id: \"" + id + "\"";
        return false;
    }
    const std::filesystem::path manifest = root.value_or(default_registry_dir()) / id / kPluginManifestName;
    std::error_code ec;
    if (!std::filesystem::exists(manifest, ec)) {
        res->error = "plugin id \"" + id + "\" not found at " + manifest.string();
        return false;
    }
    return invoke_manifest(manifest, request_json, timeout, res);
}

} // namespace devit
