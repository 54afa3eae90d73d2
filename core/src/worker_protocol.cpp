#include "codemode/worker_protocol.h"

namespace codemode::protocol {

namespace {

std::string finish_line(json::Doc& d) {
    return json::to_string(d.root) + "\n";
}

bool need(const std::optional<std::string>& v, const char* field, std::string* err) {
    if (v) return true;
    if (err) *err = std::string("missing field: ") + field;
    return false;
}

bool read_id(json_object* msg, uint64_t* id, std::string* err) {
    auto v = json::get_int(msg, "id");
    if (!v || *v < 0) {
        if (err) *err = "missing field: id";
        return false;
    }
    *id = (uint64_t)*v;
    return true;
}

} // namespace

std::string encode_ready(int pid) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "op", "ready");
    json_object_object_add(d.root, "pid", json_object_new_int(pid));
    return finish_line(d);
}

std::string encode_fatal(const std::string& error) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "op", "fatal");
    json::put_string(d.root, "error", error);
    return finish_line(d);
}

std::string encode_shutdown() {
    json::Doc d = json::new_object();
    json::put_string(d.root, "op", "shutdown");
    return finish_line(d);
}

std::string encode_execute(const ExecuteRequest& req) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "op", "execute");
    json_object_object_add(d.root, "id", json_object_new_int64((int64_t)req.id));
    json::put_string(d.root, "code", req.code);
    json_object_object_add(d.root, "timeout_ms", json_object_new_int(req.budget.timeout_ms));
    json_object_object_add(d.root, "cpu_limit_ms", json_object_new_int(req.budget.cpu_limit_ms));
    json::put_string(d.root, "namespace", kBindingNamespace);
    json_object* manifest = json_object_new_object();
    for (const auto& g : req.manifest) {
        json_object* arr = json_object_new_array();
        for (const auto& m : g.second) json_object_array_add(arr, json_object_new_string(m.c_str()));
        json_object_object_add(manifest, g.first.c_str(), arr);
    }
    json_object_object_add(d.root, "manifest", manifest);
    return finish_line(d);
}

std::string encode_call(const CallRequest& call) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "op", "call");
    json_object_object_add(d.root, "id", json_object_new_int64((int64_t)call.id));
    json::put_string(d.root, "group", call.group);
    json::put_string(d.root, "method", call.method);
    json::put_string(d.root, "params", call.params_json);
    return finish_line(d);
}

std::string encode_call_result(const CallReply& reply) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "op", "call_result");
    json_object_object_add(d.root, "id", json_object_new_int64((int64_t)reply.id));
    json_object_object_add(d.root, "ok", json_object_new_boolean(reply.result.ok));
    if (reply.result.ok) {
        if (!reply.result.result_json.empty()) json::put_string(d.root, "result", reply.result.result_json);
    } else {
        json::put_string(d.root, "error", reply.result.error);
    }
    return finish_line(d);
}

std::string encode_result(const ExecuteReply& reply) {
    const RealmOutcome& o = reply.outcome;
    json::Doc d = json::new_object();
    json::put_string(d.root, "op", "result");
    json_object_object_add(d.root, "id", json_object_new_int64((int64_t)reply.id));
    json_object_object_add(d.root, "ok", json_object_new_boolean(o.ok));
    if (o.ok) {
        json::put_string(d.root, "type", o.value.type);
        if (o.value.json) json::put_string(d.root, "value", *o.value.json);
    } else {
        json::put_string(d.root, "error", o.error);
        if (o.stack) json::put_string(d.root, "stack", *o.stack);
        json::put_string(d.root, "kind", failure_kind_name(o.kind));
    }
    json_object_object_add(d.root, "cpu_ms", json_object_new_double(o.cpu_time_ms));
    json_object_object_add(d.root, "memory_mb", json_object_new_double(o.memory_used_mb));
    json_object* console = json_object_new_array();
    for (const auto& line : reply.console) {
        json_object_array_add(console, json_object_new_string_len(line.c_str(), (int)line.size()));
    }
    json_object_object_add(d.root, "console", console);
    return finish_line(d);
}

std::string message_op(json_object* msg) {
    if (!msg || !json_object_is_type(msg, json_type_object)) return {};
    return json::get_string(msg, "op").value_or("");
}

bool decode_execute(json_object* msg, ExecuteRequest* out, std::string* err) {
    if (!read_id(msg, &out->id, err)) return false;
    auto code = json::get_string(msg, "code");
    if (!need(code, "code", err)) return false;
    out->code = *code;
    auto timeout = json::get_int(msg, "timeout_ms");
    auto cpu = json::get_int(msg, "cpu_limit_ms");
    if (!timeout || *timeout <= 0) {
        if (err) *err = "missing field: timeout_ms";
        return false;
    }
    out->budget.timeout_ms = (int)*timeout;
    out->budget.cpu_limit_ms = cpu ? (int)*cpu : 0;

    out->manifest.clear();
    json_object* manifest = nullptr;
    if (json_object_object_get_ex(msg, "manifest", &manifest) &&
        json_object_is_type(manifest, json_type_object)) {
        json_object_object_foreach(manifest, group, methods) {
            (void)methods;
            out->manifest[group] = json::get_string_array(manifest, group);
        }
    }
    return true;
}

bool decode_call(json_object* msg, CallRequest* out, std::string* err) {
    if (!read_id(msg, &out->id, err)) return false;
    auto group = json::get_string(msg, "group");
    auto method = json::get_string(msg, "method");
    if (!need(group, "group", err) || !need(method, "method", err)) return false;
    out->group = *group;
    out->method = *method;
    out->params_json = json::get_string(msg, "params").value_or("null");
    return true;
}

bool decode_call_result(json_object* msg, CallReply* out, std::string* err) {
    if (!read_id(msg, &out->id, err)) return false;
    auto ok = json::get_bool(msg, "ok");
    if (!ok) {
        if (err) *err = "missing field: ok";
        return false;
    }
    if (*ok) {
        out->result = BindingResult::value(json::get_string(msg, "result").value_or(""));
    } else {
        out->result = BindingResult::fail(json::get_string(msg, "error").value_or("Unknown error"));
    }
    return true;
}

bool decode_result(json_object* msg, ExecuteReply* out, std::string* err) {
    if (!read_id(msg, &out->id, err)) return false;
    auto ok = json::get_bool(msg, "ok");
    if (!ok) {
        if (err) *err = "missing field: ok";
        return false;
    }
    RealmOutcome& o = out->outcome;
    o = RealmOutcome{};
    o.ok = *ok;
    if (o.ok) {
        o.value.type = json::get_string(msg, "type").value_or("undefined");
        o.value.json = json::get_string(msg, "value");
    } else {
        o.error = json::get_string(msg, "error").value_or("Unknown error");
        o.stack = json::get_string(msg, "stack");
        auto kind = parse_failure_kind(json::get_string(msg, "kind").value_or(""));
        o.kind = kind ? *kind : FailureKind::SCRIPT_ERROR;
    }
    o.cpu_time_ms = json::get_double(msg, "cpu_ms").value_or(0.0);
    o.memory_used_mb = json::get_double(msg, "memory_mb").value_or(0.0);
    out->console = json::get_string_array(msg, "console");
    return true;
}

} // namespace codemode::protocol
