#include "test_common.h"

#include "devit/json_mini.h"
#include "devit/plugins.h"

#include <chrono>
#include <csignal>
#include <stdexcept>

using namespace devit;
namespace fs = std::filesystem;

static void make_plugin(const fs::path& registry, const std::string& dirname, const std::string& manifest,
                        const std::string& wasm_name) {
    fs::create_directories(registry / dirname);
    write_file(registry / dirname / kPluginManifestName, manifest);
    if (!wasm_name.empty()) write_file(registry / dirname / wasm_name, std::string("\0asm", 4));
}

static bool manifest_throws(const fs::path& p) {
    try {
        (void)load_manifest(p);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);

    fs::path dir = fresh_dir("devit_test_plugins");
    fs::path registry = dir / "registry";
    fs::path bin = dir / "bin";
    fs::create_directories(bin);

    // Stand-in for the WASI runtime: echoes its argv and the request.
    write_script(bin / kWasiRuntime,
                 "case \"$*\" in\n"
                 "  *slow.wasm*) sleep 5 ;;\n"
                 "  *quiet.wasm*) cat >/dev/null; echo \"nothing here\"; exit 0 ;;\n"
                 "esac\n"
                 "req=$(cat)\n"
                 "echo \"plugin: starting\"\n"
                 "printf '{\"argv\":\"%s\",\"req\":%s}\\n' \"$*\" \"$req\"\n");

    make_plugin(registry, "b_dir", R"({"id":"beta","wasm":"beta.wasm","version":"1.0","env":["GREETING=hi"]})", "beta.wasm");
    make_plugin(registry, "alpha", R"({"id":"alpha","name":"Alpha","wasm":"alpha.wasm","allowed_dirs":["/data","/tmp/x"]})", "alpha.wasm");
    make_plugin(registry, "broken", "{not json", "");
    make_plugin(registry, "noid", R"({"wasm":"x.wasm"})", "");
    make_plugin(registry, "slow", R"({"id":"slow","wasm":"slow.wasm"})", "slow.wasm");
    make_plugin(registry, "quiet", R"({"id":"quiet","wasm":"quiet.wasm"})", "quiet.wasm");
    make_plugin(registry, "nowasm", R"({"id":"nowasm","wasm":"missing.wasm"})", "");
    fs::create_directories(registry / "empty_dir");
    write_file(registry / "stray.txt", "x");

    // Manifest parsing
    {
        PluginManifest m = load_manifest(registry / "alpha" / kPluginManifestName);
        expect_eq_str(m.id, "alpha", "id");
        expect_true(m.name && *m.name == "Alpha", "name");
        expect_eq_ll((long long)m.allowed_dirs.size(), 2, "allowed_dirs");
        expect_true(m.env.empty(), "env defaults to empty");
        expect_true(manifest_throws(registry / "broken" / kPluginManifestName), "broken manifest");
        expect_true(manifest_throws(registry / "noid" / kPluginManifestName), "manifest without id");
        expect_true(manifest_throws(registry / "empty_dir" / kPluginManifestName), "missing manifest");
    }

    // Discovery skips invalid entries and sorts by id.
    {
        auto infos = discover_plugins(registry);
        expect_eq_ll((long long)infos.size(), 5, "valid plugins discovered");
        expect_eq_str(infos[0].id, "alpha", "sorted first");
        expect_eq_str(infos[0].name, "Alpha", "explicit name");
        expect_eq_str(infos[1].id, "beta", "sorted second");
        expect_eq_str(infos[1].name, "beta", "name falls back to id");
        expect_true(infos[1].version && *infos[1].version == "1.0", "version");
        expect_true(infos[1].manifest_path.find("b_dir") != std::string::npos, "manifest path");

        json_mini::Doc j(plugin_infos_json(infos));
        expect_eq_ll((long long)json_object_array_length(j.root), 5, "json list");
        json_object* first = json_object_array_get_idx(j.root, 0);
        expect_true(json_mini::has_member(first, "version") && !json_mini::member(first, "version"),
                    "absent version is null");

        expect_true(discover_plugins(dir / "no_such_registry").empty(), "missing registry is empty");
    }

    // Registry root from the environment
    {
        ::setenv("DEVIT_PLUGINS_DIR", registry.c_str(), 1);
        expect_true(default_registry_dir() == registry, "DEVIT_PLUGINS_DIR");
        expect_eq_ll((long long)discover_plugins(std::nullopt).size(), 5, "env registry used");
        ::unsetenv("DEVIT_PLUGINS_DIR");
        expect_true(default_registry_dir() == fs::path(".devit/plugins"), "default registry");
    }

    // Sandbox command: exactly the listed pre-opens and env entries.
    {
        PluginManifest m = load_manifest(registry / "alpha" / kPluginManifestName);
        m.env = {"A=1"};
        auto argv = wasi_command("wasmtime", m, "/r/alpha.wasm");
        expect_eq_ll((long long)argv.size(), 6, "argv size");
        expect_eq_str(argv[1], "run", "run");
        expect_eq_str(argv[2], "--dir=/data", "dir 1");
        expect_eq_str(argv[3], "--dir=/tmp/x", "dir 2");
        expect_eq_str(argv[4], "--env=A=1", "env");
        expect_eq_str(argv[5], "/r/alpha.wasm", "module last");

        PluginManifest closed;
        closed.id = "c";
        closed.wasm = "c.wasm";
        expect_eq_ll((long long)wasi_command("wasmtime", closed, "c.wasm").size(), 3, "closed sandbox");
    }

    // First JSON line
    {
        expect_true(first_json_line("loading\n  {\"a\":1}\n{\"b\":2}\n") == std::string("{\"a\":1}"), "skips diagnostics");
        expect_true(first_json_line("x\n[1,2]\n") == std::string("[1,2]"), "array line");
        expect_true(!first_json_line("no json\nat all\n").has_value(), "no json");
    }

    const std::string path_env = std::getenv("PATH") ? std::getenv("PATH") : "/usr/bin:/bin";
    const auto timeout = std::chrono::milliseconds(5000);

    // Runtime must be on PATH.
    {
        ::setenv("PATH", (dir / "nothing").c_str(), 1);
        PluginCallResult r;
        expect_true(!invoke_by_id("b_dir", "{}", timeout, registry, &r), "no runtime");
        expect_true(r.error.find("wasmtime not found") != std::string::npos, "runtime error: " + r.error);
    }
    ::setenv("PATH", (bin.string() + ":" + path_env).c_str(), 1);

    // Successful call through the stand-in runtime
    {
        PluginCallResult r;
        bool ok = invoke_by_id("b_dir", R"({"x":1})", timeout, registry, &r);
        expect_true(ok, "invoke beta: " + r.error);
        json_object* req = json_mini::member(r.value.root, "req");
        expect_eq_ll(json_mini::get_int(req, "x").value_or(-1), 1, "request piped to stdin");
        const std::string argv = json_mini::get_string(r.value.root, "argv").value_or("");
        expect_true(argv.find("--env=GREETING=hi") != std::string::npos, "env passed: " + argv);
        expect_true(argv.find("--dir=") == std::string::npos, "no pre-opens: " + argv);
    }

    // Direct manifest path bypasses the registry.
    {
        PluginCallResult r;
        expect_true(invoke_manifest(registry / "alpha" / kPluginManifestName, "{}", timeout, &r),
                    "invoke by manifest: " + r.error);
        const std::string argv = json_mini::get_string(r.value.root, "argv").value_or("");
        expect_true(argv.find("--dir=/data --dir=/tmp/x") != std::string::npos, "pre-opens: " + argv);
    }

    // Failures
    {
        PluginCallResult r;
        expect_true(!invoke_by_id("../alpha", "{}", timeout, registry, &r), "path traversal id");
        expect_true(r.error.find("invalid plugin id") != std::string::npos, r.error);

        expect_true(!invoke_by_id("ghost", "{}", timeout, registry, &r), "unknown id");
        expect_true(r.error.find("not found") != std::string::npos, r.error);

        expect_true(!invoke_by_id("nowasm", "{}", timeout, registry, &r), "missing module");
        expect_true(r.error.find("wasm file not found") != std::string::npos, r.error);

        expect_true(!invoke_by_id("quiet", "{}", timeout, registry, &r), "no json output");
        expect_eq_str(r.error, "no JSON found on plugin stdout", "no json error");
        expect_true(!r.timed_out, "not a timeout");
    }

    // Deadline: the runtime is killed and the call fails promptly.
    {
        PluginCallResult r;
        const auto t0 = std::chrono::steady_clock::now();
        expect_true(!invoke_by_id("slow", "{}", std::chrono::milliseconds(300), registry, &r), "slow plugin");
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0).count();
        expect_true(r.timed_out, "timed out");
        expect_eq_str(r.error, "timeout waiting plugin output", "timeout error");
        expect_true(ms >= 250 && ms < 3000, "bounded by the deadline: " + std::to_string(ms) + "ms");
    }

    ::setenv("PATH", path_env.c_str(), 1);
    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_plugins: ALL PASSED" << std::endl;
    return 0;
}
