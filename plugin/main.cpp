#include "devit/config.h"
#include "devit/json_mini.h"
#include "devit/plugins.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

using namespace devit;

static void usage() {
    std::cerr << "usage:\n"
              << "  devit_plugin list [--dir <registry>]\n"
              << "  devit_plugin invoke --id <id> [--dir <registry>] [--timeout-secs N] < request.json\n"
              << "  devit_plugin invoke --manifest <file> [--timeout-secs N] < request.json\n";
}

static int cmd_list(int argc, char** argv) {
    std::optional<std::filesystem::path> dir;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--dir" && i + 1 < argc) { dir = std::filesystem::path(argv[++i]); continue; }
        throw std::runtime_error("unknown option: " + a);
    }
    json_mini::Doc list(plugin_infos_json(discover_plugins(dir)));
    std::cout << json_mini::dump_pretty(list.root) << std::endl;
    return 0;
}

static int cmd_invoke(int argc, char** argv) {
    std::optional<std::string> id;
    std::optional<std::filesystem::path> manifest;
    std::optional<std::filesystem::path> dir;
    std::optional<int64_t> timeout_secs;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--id" && i + 1 < argc) { id = argv[++i]; continue; }
        if (a == "--manifest" && i + 1 < argc) { manifest = std::filesystem::path(argv[++i]); continue; }
        if (a == "--dir" && i + 1 < argc) { dir = std::filesystem::path(argv[++i]); continue; }
        if (a == "--timeout-secs" && i + 1 < argc) {
            timeout_secs = static_cast<int64_t>(parse_flag_u64(a, argv[++i], kMaxDurationSecs));
            continue;
        }
        throw std::runtime_error("unknown option: " + a);
    }
    if (!id && !manifest) throw std::runtime_error("provide either --id <id> or --manifest <file>");

    std::string req((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    const size_t b = req.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) throw std::runtime_error("stdin is empty; expected JSON request");
    req = req.substr(b, req.find_last_not_of(" \t\r\n") - b + 1);
    if (!json_mini::parse(req)) throw std::runtime_error("stdin must be valid JSON");

    const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(resolve_timeout(timeout_secs));
    PluginCallResult res;
    bool ok = manifest ? invoke_manifest(*manifest, req, timeout, &res)
                       : invoke_by_id(*id, req, timeout, dir, &res);
    if (!ok) {
        if (res.timed_out) {
            std::cerr << "error: plugin timeout" << std::endl;
            return 124;
        }
        std::cerr << "error: " << res.error << std::endl;
        return 2;
    }
    std::cout << json_mini::dump(res.value.root) << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    ::signal(SIGPIPE, SIG_IGN);
    if (argc < 2) {
        usage();
        return 2;
    }
    const std::string cmd = argv[1];
    try {
        if (cmd == "list") return cmd_list(argc, argv);
        if (cmd == "invoke") return cmd_invoke(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    }
    std::cerr << "unknown command: " << cmd << "\n";
    usage();
    return 2;
}
