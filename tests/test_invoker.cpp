#include "test_common.h"

#include "devit/invoker.h"
#include "devit/json_mini.h"
#include "devit/proc.h"

#include <chrono>
#include <csignal>

#include <unistd.h>

using namespace devit;
using std::chrono::milliseconds;

static long long elapsed_ms(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - t0).count();
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);
    namespace fs = std::filesystem;
    fs::path dir = fresh_dir("devit_test_invoker");

    const std::string devit_ok = write_script(dir / "devit_ok",
        "if [ \"$1\" = tool ] && [ \"$2\" = list ]; then\n"
        "  echo '{\"tools\":[\"fs_patch_apply\",\"shell_exec\"]}'\n"
        "  exit 0\n"
        "fi\n"
        "if [ \"$1\" = tool ] && [ \"$2\" = call ] && [ \"$3\" = - ]; then\n"
        "  req=$(cat)\n"
        "  printf '  {\"ok\":true,\"request\":%s}\\n\\n' \"$req\"\n"
        "  exit 0\n"
        "fi\n"
        "exit 2\n").string();
    const std::string devit_bad = write_script(dir / "devit_bad", "echo 'not json'\nexit 1\n").string();
    const std::string devit_trailing = write_script(dir / "devit_trailing", "echo '{\"a\":1}'\necho xyz\n").string();
    const std::string devit_slow = write_script(dir / "devit_slow", "sleep 5\n").string();

    // Plain capture and exit codes
    {
        InvokeResult r;
        expect_true(invoke_capture({"/bin/sh", "-c", "echo hello"}, std::nullopt, milliseconds(5000), &r),
                    "echo: " + r.error);
        expect_eq_str(r.output, "hello\n", "stdout captured");
        expect_eq_ll(r.exit_code, 0, "exit 0");

        expect_true(invoke_capture({"/bin/sh", "-c", "exit 7"}, std::nullopt, milliseconds(5000), &r), "exit 7");
        expect_eq_ll(r.exit_code, 7, "exit code propagated");
    }

    // stdin is written then closed.
    {
        InvokeResult r;
        expect_true(invoke_capture({"cat"}, std::string("{\"a\":1}"), milliseconds(5000), &r), "cat: " + r.error);
        expect_eq_str(r.output, "{\"a\":1}", "stdin round trip");
    }

    // A child that never reads its stdin does not take the caller down,
    // even with the default SIGPIPE disposition.
    {
        ::signal(SIGPIPE, SIG_DFL);
        InvokeResult r;
        const std::string big(1 << 20, 'x');
        expect_true(invoke_capture({"/bin/sh", "-c", "exit 0"}, big, milliseconds(5000), &r), "unread stdin: " + r.error);
        expect_eq_ll(r.exit_code, 0, "child exit code");
        std::string err;
        int fds[2];
        expect_true(::pipe(fds) == 0, "pipe");
        ::close(fds[0]);
        expect_true(!write_all_fd(fds[1], "data", &err), "write to a closed pipe fails");
        expect_true(err.find("Broken pipe") != std::string::npos, "EPIPE reported: " + err);
        ::close(fds[1]);
        ::usleep(200 * 1000);  // let the detached writer finish
        ::signal(SIGPIPE, SIG_IGN);
    }

    // Missing executable fails that call only.
    {
        InvokeResult r;
        expect_true(!invoke_capture({"devit-no-such-binary-xyz"}, std::nullopt, milliseconds(1000), &r), "missing bin");
        expect_true(!r.timed_out, "not a timeout");
        expect_true(r.error.find("spawn devit-no-such-binary-xyz") == 0, "spawn error: " + r.error);
    }

    // A child that never answers is killed within the deadline.
    {
        InvokeResult r;
        auto t0 = std::chrono::steady_clock::now();
        expect_true(!invoke_capture({"/bin/sh", "-c", "sleep 5"}, std::nullopt, milliseconds(300), &r), "sleep");
        long long ms = elapsed_ms(t0);
        expect_true(r.timed_out, "timed_out set");
        expect_true(r.output.empty(), "no partial output");
        expect_eq_str(r.error, "timeout after 300ms", "timeout error");
        expect_true(ms >= 250 && ms < 3000, "bounded: " + std::to_string(ms) + "ms");
    }

    // A grandchild holding stdout open is taken down with the group.
    {
        InvokeResult r;
        auto t0 = std::chrono::steady_clock::now();
        expect_true(!invoke_capture({"/bin/sh", "-c", "echo partial; sleep 5 & wait"}, std::nullopt,
                                    milliseconds(300), &r), "background sleep");
        long long ms = elapsed_ms(t0);
        expect_true(r.timed_out, "group timed out");
        expect_true(r.output.empty(), "partial output dropped");
        expect_true(ms < 3000, "bounded with grandchild: " + std::to_string(ms) + "ms");
    }

    // Host CLI subcommands
    {
        CliCallResult r;
        expect_true(devit_tool_list(devit_ok, milliseconds(5000), &r), "tool list: " + r.error);
        auto tools = json_mini::get_array_strings(r.value.root, "tools");
        expect_eq_ll((long long)tools.size(), 2, "tool list parsed");
        expect_eq_str(tools[0], "fs_patch_apply", "first tool");
    }
    {
        CliCallResult r;
        expect_true(devit_tool_call(devit_ok, R"({"tool":"shell_exec","args":{"cmd":"ls"}})", milliseconds(5000), &r),
                    "tool call: " + r.error);
        expect_true(json_mini::get_bool(r.value.root, "ok") == true, "ok field");
        json_object* req = json_mini::member(r.value.root, "request");
        expect_eq_str(json_mini::get_string(req, "tool").value_or(""), "shell_exec", "request forwarded on stdin");
    }
    {
        CliCallResult r;
        expect_true(!devit_tool_list(devit_bad, milliseconds(5000), &r), "bad output");
        expect_true(r.error.find("devit tool list: invalid JSON") == 0, "invalid JSON error: " + r.error);
        expect_true(!r.timed_out, "bad output is not a timeout");
    }
    {
        CliCallResult r;
        expect_true(!devit_tool_list(devit_trailing, milliseconds(5000), &r), "document followed by garbage");
        expect_eq_str(r.error, "devit tool list: invalid JSON", "trailing output rejected");
        expect_true(!r.value, "no partial value");
    }
    {
        CliCallResult r;
        auto t0 = std::chrono::steady_clock::now();
        expect_true(!devit_tool_call(devit_slow, "{}", milliseconds(300), &r), "slow call");
        expect_true(r.timed_out, "slow call timed out");
        expect_true(r.error.find("devit tool call: timeout after") == 0, "timeout error: " + r.error);
        expect_true(elapsed_ms(t0) < 3000, "slow call bounded");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cerr << "test_invoker: ALL PASSED" << std::endl;
    return 0;
}
