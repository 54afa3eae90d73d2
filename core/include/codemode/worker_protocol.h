#pragma once

// Newline-delimited JSON spoken between ProcessSandbox and codemode_worker.
// One message per line, host -> worker on the worker's stdin, worker -> host
// on its stdout. JSON payloads (params, results, completion values) travel as
// JSON text inside string fields so they round-trip byte for byte.
//
//   worker: {"op":"ready","pid":N}
//   worker: {"op":"fatal","error":"..."}
//   host:   {"op":"execute","id":N,"code":"...","timeout_ms":N,"cpu_limit_ms":N,
//            "namespace":"pg","manifest":{"group":["method",...]}}
//   worker: {"op":"call","id":N,"group":"...","method":"...","params":"<json>"}
//   host:   {"op":"call_result","id":N,"ok":true,"result":"<json>"}
//           {"op":"call_result","id":N,"ok":false,"error":"..."}
//   worker: {"op":"result","id":N,"ok":true,"type":"object","value":"<json>",
//            "kind":"...","cpu_ms":F,"memory_mb":F,"console":["..."]}
//   host:   {"op":"shutdown"}

#include "codemode/bindings.h"
#include "codemode/json.h"
#include "codemode/realm.h"

#include <cstdint>
#include <string>
#include <vector>

namespace codemode::protocol {

struct ExecuteRequest {
    uint64_t id{0};
    std::string code;
    RunBudget budget;
    BindingManifest manifest;
};

struct CallRequest {
    uint64_t id{0};
    std::string group;
    std::string method;
    std::string params_json{"null"};
};

struct CallReply {
    uint64_t id{0};
    BindingResult result;
};

struct ExecuteReply {
    uint64_t id{0};
    RealmOutcome outcome;
    std::vector<std::string> console;
};

// Every encoder returns one line including the trailing '\n'.
std::string encode_ready(int pid);
std::string encode_fatal(const std::string& error);
std::string encode_shutdown();
std::string encode_execute(const ExecuteRequest& req);
std::string encode_call(const CallRequest& call);
std::string encode_call_result(const CallReply& reply);
std::string encode_result(const ExecuteReply& reply);

// "op" of a parsed message, empty if missing.
std::string message_op(json_object* msg);

bool decode_execute(json_object* msg, ExecuteRequest* out, std::string* err);
bool decode_call(json_object* msg, CallRequest* out, std::string* err);
bool decode_call_result(json_object* msg, CallReply* out, std::string* err);
bool decode_result(json_object* msg, ExecuteReply* out, std::string* err);

} // namespace codemode::protocol
