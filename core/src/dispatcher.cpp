#include "devit/dispatcher.h"
#include "devit/invoker.h"
#include "devit/plugins.h"
#include "devit/proc.h"
#include "devit/protocol.h"

#include <utility>

namespace devit {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

json_object* new_error_payload(const char* name) {
    json_object* p = json_object_new_object();
    json_object_object_add(p, "name", json_object_new_string(name));
    return p;
}

json_object* path_or_null(const std::optional<std::string>& p) {
    return p ? json_mini::new_string(*p) : nullptr;
}

// A result object reporting {"ok": false} counts as a failed call.
bool result_ok(json_object* result) {
    auto ok = json_mini::get_bool(result, "ok");
    return !ok || *ok;
}

ToolOutput from_cli(bool ok, CliCallResult&& res) {
    ToolOutput out;
    out.executed = ok;
    out.timed_out = res.timed_out;
    out.error = std::move(res.error);
    out.result = std::move(res.value);
    return out;
}

ToolOutput builtin(json_object* result) {
    ToolOutput out;
    out.executed = true;
    out.result = json_mini::Doc(result);
    return out;
}

} // namespace

Dispatcher::Dispatcher(ServerConfig cfg, PolicyTable policies)
    : cfg_(std::move(cfg)),
      policies_(std::move(policies)),
      limiter_(cfg_.limits),
      audit_([this]() {
          AuditOptions o = cfg_.audit;
          o.auto_yes = cfg_.auto_yes;
          return o;
      }()) {}

std::string Dispatcher::handle_line(const std::string& raw) {
    const std::string line = trim(raw);
    if (line.empty()) return "";

    proto::Message msg;
    std::string err;
    if (!proto::parse_message(line, &msg, &err)) return proto::encode_error(err);

    if (msg.type == proto::kPing) return proto::encode(proto::kPong, nullptr);

    if (msg.type == proto::kVersion) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "server", json_mini::new_string(cfg_.server_version));
        json_object_object_add(p, "server_name", json_object_new_string(kServerName));
        return proto::encode(proto::kVersion, p);
    }

    if (msg.type == proto::kCapabilities) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "tools", json_mini::new_string_array(capability_names()));
        return proto::encode(proto::kCapabilities, p);
    }

    if (msg.type == proto::kToolCall) return handle_tool_call(msg.payload);

    return proto::encode_error("unsupported type: " + msg.type);
}

std::string Dispatcher::handle_tool_call(json_object* payload) {
    auto name = json_mini::get_string(payload, "name");
    if (!name) return proto::encode_error("tool.call: missing name");
    const ToolSpec* spec = find_tool(*name);
    if (!spec) return proto::encode_error("unknown tool: " + *name);

    json_object* args = json_mini::member(payload, "args");
    const Policy policy = policies_.lookup(spec->name);
    const std::string pname = policy_name(policy);

    if (cfg_.dry_run && !spec->introspection) {
        audit_.pre(spec->name, "dry-run-deny", pname);
        state_.record(spec->name, false);
        json_object* p = new_error_payload(spec->name);
        json_object_object_add(p, "denied", json_object_new_boolean(1));
        json_object_object_add(p, "dry_run", json_object_new_boolean(1));
        json_object_object_add(p, "reason", json_object_new_string("dry_run"));
        return proto::encode(proto::kToolError, p);
    }

    if (needs_pre_approval(policy, cfg_.auto_yes)) {
        audit_.pre(spec->name, "pre-deny", pname);
        state_.record(spec->name, false);
        json_object* p = new_error_payload(spec->name);
        json_object_object_add(p, "approval_required", json_object_new_boolean(1));
        json_object_object_add(p, "policy", json_object_new_string(pname.c_str()));
        json_object_object_add(p, "phase", json_object_new_string("pre"));
        return proto::encode(proto::kToolError, p);
    }

    if (spec->size_checked && args) {
        const size_t got = json_mini::dump(args).size();
        const size_t max_bytes = cfg_.limits.max_json_kb * 1024;
        if (got > max_bytes) {
            audit_.pre(spec->name, "payload-too-large", pname);
            state_.record(spec->name, false);
            json_object* p = new_error_payload(spec->name);
            json_object_object_add(p, "payload_too_large", json_object_new_boolean(1));
            json_object_object_add(p, "max_json_kb", json_object_new_int64(static_cast<int64_t>(cfg_.limits.max_json_kb)));
            json_object_object_add(p, "got_bytes", json_object_new_int64(static_cast<int64_t>(got)));
            return proto::encode(proto::kToolError, p);
        }
    }

    if (auto serr = validate_args(*spec, args)) {
        audit_.pre(spec->name, "schema-error", pname);
        state_.record(spec->name, false);
        json_object* p = new_error_payload(spec->name);
        json_object_object_add(p, "schema_error", json_object_new_boolean(1));
        json_object_object_add(p, "field", json_mini::new_string(serr->field));
        json_object_object_add(p, "kind", json_mini::new_string(serr->kind));
        return proto::encode(proto::kToolError, p);
    }

    RateDecision rd = limiter_.allow(spec->name, RateLimiter::Clock::now());
    if (!rd.allowed()) {
        audit_.pre(spec->name, "rate-limit", pname);
        state_.record(spec->name, false);
        json_object* p = new_error_payload(spec->name);
        json_object_object_add(p, "rate_limited", json_object_new_boolean(1));
        if (rd.kind == RateDecision::Kind::TOO_MANY_CALLS) {
            json_object_object_add(p, "reason", json_object_new_string("too_many_calls"));
            json_object_object_add(p, "limit_per_min", json_object_new_int64(rd.limit));
        } else {
            json_object_object_add(p, "reason", json_object_new_string("cooldown"));
            json_object_object_add(p, "cooldown_ms", json_object_new_int64(rd.ms_left));
        }
        return proto::encode(proto::kToolError, p);
    }

    const auto start = std::chrono::steady_clock::now();
    ToolOutput out = run_tool(*spec, args);
    const int64_t dur = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    const bool ok = out.executed && result_ok(out.result.root);
    audit_.done(spec->name, ok, dur,
                out.executed ? std::nullopt : std::optional<std::string>(out.error), pname);

    if (needs_post_approval(policy, cfg_.auto_yes, ok)) {
        state_.record(spec->name, false);
        json_object* p = new_error_payload(spec->name);
        json_object_object_add(p, "approval_required", json_object_new_boolean(1));
        json_object_object_add(p, "policy", json_object_new_string(pname.c_str()));
        json_object_object_add(p, "phase", json_object_new_string("post"));
        return proto::encode(proto::kToolError, p);
    }

    if (!out.executed) {
        state_.record(spec->name, false);
        json_object* p = new_error_payload(spec->name);
        json_object_object_add(p, "message", json_mini::new_string(out.error));
        if (out.timed_out) json_object_object_add(p, "timeout", json_object_new_boolean(1));
        return proto::encode(proto::kToolError, p);
    }

    state_.record(spec->name, ok);
    json_object* p = json_object_new_object();
    json_object_object_add(p, "ok", json_object_new_boolean(ok ? 1 : 0));
    json_object_object_add(p, "name", json_object_new_string(spec->name));
    json_object_object_add(p, "result", out.result.release());
    return proto::encode(proto::kToolResult, p);
}

ToolOutput Dispatcher::run_tool(const ToolSpec& spec, json_object* args) {
    switch (spec.id) {
        case ToolId::DEVIT_TOOL_LIST: return run_devit_list();
        case ToolId::DEVIT_TOOL_CALL: return run_devit_call(args);
        case ToolId::PLUGIN_INVOKE: return run_plugin_invoke(args);
        case ToolId::SERVER_POLICY: return builtin(policy_document());
        case ToolId::SERVER_HEALTH: return run_health();
        case ToolId::SERVER_STATS: return builtin(state_.stats_json());
        case ToolId::SERVER_CONTEXT_HEAD: return run_context_head(args);
        case ToolId::ECHO: return run_echo(args);
    }
    ToolOutput out;
    out.error = std::string("no handler for ") + spec.name;
    return out;
}

ToolOutput Dispatcher::run_devit_list() {
    CliCallResult res;
    bool ok = devit_tool_list(cfg_.devit_bin, cfg_.timeout, &res);
    return from_cli(ok, std::move(res));
}

ToolOutput Dispatcher::run_devit_call(json_object* args) {
    CliCallResult res;
    bool ok = devit_tool_call(cfg_.devit_bin, json_mini::dump(args), cfg_.timeout, &res);
    return from_cli(ok, std::move(res));
}

ToolOutput Dispatcher::run_plugin_invoke(json_object* args) {
    const std::string id = json_mini::get_string(args, "id").value_or("");
    const std::string request = json_mini::dump(json_mini::member(args, "payload"));

    PluginCallResult res;
    bool ok = invoke_by_id(id, request, cfg_.timeout, cfg_.plugins_dir, &res);
    ToolOutput out;
    out.executed = ok;
    out.timed_out = res.timed_out;
    out.error = std::move(res.error);
    out.result = std::move(res.value);
    return out;
}

ToolOutput Dispatcher::run_health() {
    json_object* h = json_object_new_object();
    json_object_object_add(h, "uptime_ms", json_object_new_int64(state_.uptime_ms()));

    json_object* server = json_object_new_object();
    json_object_object_add(server, "name", json_object_new_string(kServerName));
    json_object_object_add(server, "version", json_mini::new_string(cfg_.server_version));
    json_object_object_add(h, "server", server);

    json_object* bins = json_object_new_object();
    json_object_object_add(bins, "devit", path_or_null(which(cfg_.devit_bin)));
    json_object_object_add(bins, "wasmtime", path_or_null(which(kWasiRuntime)));
    json_object_object_add(h, "bins", bins);

    json_object_object_add(h, "limits", limits_json());
    json_object_object_add(h, "audit", audit_json());
    json_object_object_add(h, "dry_run", json_object_new_boolean(cfg_.dry_run ? 1 : 0));
    json_object_object_add(h, "auto_yes", json_object_new_boolean(cfg_.auto_yes ? 1 : 0));
    return builtin(h);
}

ToolOutput Dispatcher::run_context_head(json_object* args) {
    return builtin(context_head(context_head_query(args, cfg_.index_path)));
}

ToolOutput Dispatcher::run_echo(json_object* args) {
    json_object* r = json_object_new_object();
    json_object_object_add(r, "text", json_mini::new_string(json_mini::get_string(args, "text").value_or("")));
    return builtin(r);
}

json_object* Dispatcher::limits_json() const {
    json_object* l = json_object_new_object();
    json_object_object_add(l, "max_calls_per_min", json_object_new_int64(cfg_.limits.max_calls_per_min));
    json_object_object_add(l, "max_json_kb", json_object_new_int64(static_cast<int64_t>(cfg_.limits.max_json_kb)));
    json_object_object_add(l, "cooldown_ms", json_object_new_int64(cfg_.limits.cooldown.count()));
    return l;
}

json_object* Dispatcher::audit_json() const {
    json_object* a = json_object_new_object();
    json_object_object_add(a, "enabled", json_object_new_boolean(cfg_.audit.enabled ? 1 : 0));
    json_object_object_add(a, "path", json_mini::new_string(cfg_.audit.path.string()));
    return a;
}

json_object* Dispatcher::policy_document() const {
    json_object* doc = json_object_new_object();
    json_object* server = json_object_new_object();
    json_object_object_add(server, "name", json_object_new_string(kServerName));
    json_object_object_add(server, "version", json_mini::new_string(cfg_.server_version));
    json_object_object_add(doc, "server", server);
    json_object_object_add(doc, "approvals", policies_.approvals_json());
    json_object_object_add(doc, "limits", limits_json());
    json_object_object_add(doc, "audit", audit_json());
    return doc;
}

} // namespace devit
