#include "devit/client.h"
#include "devit/config.h"
#include "devit/json_mini.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>

using namespace devit;

static void usage() {
    std::cerr
        << "usage: devit_mcp --cmd <server command> [action] [options]\n"
        << "actions:\n"
        << "  --handshake-only         stop after ping/version/capabilities\n"
        << "  --echo <text>            call echo\n"
        << "  --call <name> --json <json|@->   call a tool (@- reads args from stdin)\n"
        << "  --policy | --health | --stats    call server.policy / server.health / server.stats\n"
        << "options:\n"
        << "  --dry-run                print the planned session and exit\n"
        << "  --timeout-secs <n>       per-message deadline (default $DEVIT_TIMEOUT_SECS or 30)\n"
        << "  --client-version <s>     version announced in the handshake (default " << kDefaultClientVersion << ")\n";
}

static json_object* opt_string(const std::optional<std::string>& s) {
    return s ? json_mini::new_string(*s) : nullptr;
}

int main(int argc, char** argv) {
    ::signal(SIGPIPE, SIG_IGN);

    std::optional<std::string> cmd;
    std::optional<std::string> echo_text;
    std::optional<std::string> call_name;
    std::optional<std::string> call_json;
    std::optional<int64_t> timeout_secs;
    std::string client_version = kDefaultClientVersion;
    bool handshake_only = false;
    bool dry_run = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string a = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) throw std::runtime_error(a + ": missing value");
                return argv[++i];
            };
            if (a == "--cmd") { cmd = value(); continue; }
            if (a == "--handshake-only") { handshake_only = true; continue; }
            if (a == "--echo") { echo_text = value(); continue; }
            if (a == "--call") { call_name = value(); continue; }
            if (a == "--json") { call_json = value(); continue; }
            if (a == "--policy") { call_name = "server.policy"; continue; }
            if (a == "--health") { call_name = "server.health"; continue; }
            if (a == "--stats") { call_name = "server.stats"; continue; }
            if (a == "--dry-run") { dry_run = true; continue; }
            if (a == "--timeout-secs") { timeout_secs = static_cast<int64_t>(parse_flag_u64(a, value(), kMaxDurationSecs)); continue; }
            if (a == "--client-version") { client_version = value(); continue; }
            if (a == "-h" || a == "--help") { usage(); return 0; }
            throw std::runtime_error("unknown option: " + a);
        }
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        usage();
        return 2;
    }

    const std::chrono::seconds timeout = resolve_timeout(timeout_secs);

    if (dry_run) {
        json_mini::Doc plan(json_object_new_object());
        json_object_object_add(plan.root, "dry_run", json_object_new_boolean(1));
        json_object_object_add(plan.root, "cmd", opt_string(cmd));
        json_object_object_add(plan.root, "timeout_secs", json_object_new_int64(timeout.count()));
        json_object_object_add(plan.root, "handshake_only", json_object_new_boolean(handshake_only ? 1 : 0));
        json_object* call = nullptr;
        if (call_name) {
            call = json_object_new_object();
            json_object_object_add(call, "name", json_mini::new_string(*call_name));
            json_object_object_add(call, "json", opt_string(call_json));
        }
        json_object_object_add(plan.root, "call", call);
        json_object_object_add(plan.root, "echo", opt_string(echo_text));
        std::cout << json_mini::dump(plan.root) << std::endl;
        return 0;
    }

    if (!cmd) {
        std::cerr << "error: --cmd is required" << std::endl;
        usage();
        return 2;
    }
    if (!handshake_only && !echo_text && !call_name) {
        std::cerr << "error: nothing to do (use --handshake-only, --echo, --call, --policy, --health or --stats)" << std::endl;
        return 2;
    }

    // Parse call args before starting the server.
    json_mini::Doc call_args(json_object_new_object());
    if (call_name && call_json) {
        std::string text = *call_json;
        if (text == "@-") {
            text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
        call_args = json_mini::parse(text);
        if (!call_args || !json_mini::is_object(call_args.root)) {
            std::cerr << "error: --json must be a JSON object" << std::endl;
            return 2;
        }
    }

    try {
        McpClient client(*cmd, std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
        Capabilities caps = client.handshake(client_version);

        json_mini::Doc ok(json_object_new_object());
        json_object_object_add(ok.root, "type", json_object_new_string("handshake.ok"));
        json_object* p = json_object_new_object();
        json_object_object_add(p, "tools", json_mini::new_string_array(caps.tools));
        json_object_object_add(ok.root, "payload", p);
        std::cout << json_mini::dump(ok.root) << std::endl;

        if (handshake_only) return 0;

        if (echo_text) {
            proto::Message reply = client.echo(*echo_text);
            std::cout << json_mini::dump(reply.doc.root) << std::endl;
        }
        if (call_name) {
            proto::Message reply = client.tool_call(*call_name, call_args.root);
            std::cout << json_mini::dump(reply.doc.root) << std::endl;
        }
        return 0;
    } catch (const TimeoutError&) {
        std::cerr << "error: timeout (no response within per-message deadline)" << std::endl;
        return 124;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 2;
    }
}
