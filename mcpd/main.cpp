#include "devit/config.h"
#include "devit/dispatcher.h"
#include "devit/json_mini.h"
#include "devit/policy.h"
#include "devit/watchdog.h"

#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace devit;

static void usage() {
    std::cerr
        << "usage: devit_mcpd [options]   (line-delimited JSON on stdin/stdout)\n"
        << "  --server-version <s>     version announced in the handshake (default " << kDefaultServerVersion << ")\n"
        << "  --devit-bin <path>       host CLI for devit.tool_* (default $DEVIT_BIN or devit)\n"
        << "  --timeout-secs <n>       per-call deadline (default $DEVIT_TIMEOUT_SECS or 30)\n"
        << "  --yes                    approve every pre/post checkpoint\n"
        << "  --config <path>          approvals config (default " << kDefaultConfigPath << ")\n"
        << "  --policy-dump            print effective approvals and exit\n"
        << "  --no-audit               disable the audit journal\n"
        << "  --audit-path <path>      audit journal (default " << kDefaultAuditPath << ")\n"
        << "  --hmac-key <path>        audit signing key (default " << kDefaultHmacKeyPath << ")\n"
        << "  --max-calls-per-min <n>  per-tool sliding window cap (default 60)\n"
        << "  --max-json-kb <n>        args size cap for devit.tool_call/plugin.invoke (default 256)\n"
        << "  --cooldown-ms <n>        minimum spacing between calls to one tool (default 250)\n"
        << "  --dry-run                refuse everything but the introspection tools\n"
        << "  --max-runtime-secs <n>   exit with code " << kWatchdogExitCode << " after n seconds (0 = off)\n"
        << "  --plugins-dir <path>     plugin registry (default $DEVIT_PLUGINS_DIR or .devit/plugins)\n";
}

int main(int argc, char** argv) {
    ::signal(SIGPIPE, SIG_IGN);

    ServerConfig cfg;
    std::optional<std::string> devit_bin;
    std::optional<int64_t> timeout_secs;
    std::optional<std::filesystem::path> config_path;
    bool policy_dump = false;
    uint64_t max_runtime_secs = 0;

    try {
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::runtime_error(a + ": missing value");
                return argv[++i];
            };
            if (a == "--server-version") { cfg.server_version = value(); continue; }
            if (a == "--devit-bin") { devit_bin = value(); continue; }
            if (a == "--timeout-secs") { timeout_secs = static_cast<int64_t>(parse_flag_u64(a, value(), kMaxDurationSecs)); continue; }
            if (a == "--yes") { cfg.auto_yes = true; continue; }
            if (a == "--config") { config_path = value(); continue; }
            if (a == "--policy-dump") { policy_dump = true; continue; }
            if (a == "--no-audit") { cfg.audit.enabled = false; continue; }
            if (a == "--audit-path") { cfg.audit.path = value(); continue; }
            if (a == "--hmac-key") { cfg.audit.key_path = value(); continue; }
            if (a == "--max-calls-per-min") { cfg.limits.max_calls_per_min = static_cast<uint32_t>(parse_flag_u64(a, value(), UINT32_MAX)); continue; }
            if (a == "--max-json-kb") { cfg.limits.max_json_kb = static_cast<size_t>(parse_flag_u64(a, value(), kMaxJsonKb)); continue; }
            if (a == "--cooldown-ms") { cfg.limits.cooldown = std::chrono::milliseconds(parse_flag_u64(a, value(), kMaxDurationSecs * 1000)); continue; }
            if (a == "--dry-run") { cfg.dry_run = true; continue; }
            if (a == "--max-runtime-secs") { max_runtime_secs = parse_flag_u64(a, value(), kMaxDurationSecs); continue; }
            if (a == "--plugins-dir") { cfg.plugins_dir = std::filesystem::path(value()); continue; }
            if (a == "-h" || a == "--help") { usage(); return 0; }
            throw std::runtime_error("unknown option: " + a);
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        usage();
        return 2;
    }

    PolicyTable policies;
    try {
        policies = PolicyTable::load(config_path);
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    }

    if (policy_dump) {
        json_mini::Doc approvals(policies.approvals_json());
        std::cout << json_mini::dump_pretty(approvals.root) << std::endl;
        return 0;
    }

    cfg.devit_bin = resolve_devit_bin(devit_bin);
    cfg.timeout = resolve_timeout(timeout_secs);

    Watchdog watchdog{std::chrono::seconds(max_runtime_secs)};
    watchdog.start_ticker();

    Dispatcher dispatcher(std::move(cfg), std::move(policies));

    std::string line;
    while (std::getline(std::cin, line)) {
        watchdog.check();
        std::string reply = dispatcher.handle_line(line);
        if (reply.empty()) continue;
        std::cout << reply << "\n";
        std::cout.flush();
        if (!std::cout) {
            std::cerr << "error: stdout closed" << std::endl;
            return 2;
        }
    }
    return 0;
}
