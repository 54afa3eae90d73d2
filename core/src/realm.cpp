#include "codemode/realm.h"
#include "codemode/json.h"

#include <quickjs.h>

#include <algorithm>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace codemode {

namespace {

// Evaluates to a factory taking the native hooks. It hardens the fresh
// global object, installs console and the binding namespace, and returns
// finish(promise), which reports the script's settlement through settle().
// Natives only ever live in this closure, never on the global object.
const char* PRELUDE = R"JS((function (hostCall, settle, print, manifest, nsName) {
  'use strict';
  const stringify = JSON.stringify;
  const parse = JSON.parse;
  const freeze = Object.freeze;
  const keys = Object.keys;
  const defineProperty = Object.defineProperty;
  const getPrototypeOf = Object.getPrototypeOf;
  const ErrorCtor = Error;
  const PromiseCtor = Promise;
  const then = Promise.prototype.then;
  const global = globalThis;

  const format = (args) => {
    let out = '';
    for (let i = 0; i < args.length; i++) {
      const a = args[i];
      let s;
      try {
        if (typeof a === 'string') s = a;
        else if (typeof a === 'object' && a !== null) s = stringify(a);
        if (s === undefined) s = String(a);
      } catch (e) {
        s = '[' + typeof a + ']';
      }
      out += (i > 0 ? ' ' : '') + s;
    }
    return out;
  };

  const console = freeze({
    log: (...args) => { print(format(args)); },
    info: (...args) => { print('[INFO] ' + format(args)); },
    warn: (...args) => { print('[WARN] ' + format(args)); },
    error: (...args) => { print('[ERROR] ' + format(args)); },
    debug: (...args) => { print('[DEBUG] ' + format(args)); },
  });

  const api = {};
  for (const group of keys(manifest)) {
    const methods = {};
    for (const method of manifest[group]) {
      methods[method] = function (params) {
        return new PromiseCtor((resolve) => {
          const text = hostCall(group, method, params === undefined ? 'null' : stringify(params));
          resolve(text === undefined ? undefined : parse(text));
        });
      };
    }
    api[group] = freeze(methods);
  }

  const lock = (name, value) => {
    defineProperty(global, name, { value, writable: false, enumerable: false, configurable: false });
  };

  const blockedCtor = (proto) => {
    const blocked = function () {
      throw new EvalError('Code generation from strings is disabled');
    };
    blocked.prototype = proto;
    defineProperty(proto, 'constructor', { value: blocked, writable: false, enumerable: false, configurable: false });
    return blocked;
  };
  const FunctionBlocked = blockedCtor(getPrototypeOf(function () {}));
  blockedCtor(getPrototypeOf(async function () {}));
  blockedCtor(getPrototypeOf(function* () {}));
  blockedCtor(getPrototypeOf(async function* () {}));

  lock('console', console);
  lock(nsName, freeze(api));
  lock('Function', FunctionBlocked);
  for (const name of ['require', 'process', 'global', 'module', 'exports', '__dirname',
                      '__filename', 'setTimeout', 'setInterval', 'setImmediate', 'eval']) {
    lock(name, undefined);
  }
  lock('globalThis', undefined);

  return function finish(promise) {
    then.call(promise, (value) => {
      let text;
      try {
        text = stringify(value);
      } catch (e) {
        text = undefined;
      }
      settle(true, typeof value, text);
    }, (err) => {
      let message = 'Uncaught exception';
      let stack;
      try {
        if (err instanceof ErrorCtor) {
          message = String(err.message);
          if (err.stack !== undefined) stack = String(err.stack);
        } else {
          message = String(err);
        }
      } catch (e) {
        message = 'Uncaught exception (unprintable value)';
      }
      settle(false, message, stack);
    });
  };
}))JS";

const char* OOM_MESSAGE = "out of memory";
constexpr size_t kMaxDrainedJobs = 100000;

std::string to_std_string(JSContext* ctx, JSValueConst v) {
    size_t len = 0;
    const char* s = JS_ToCStringLen(ctx, &len, v);
    if (!s) {
        JSValue ex = JS_GetException(ctx);
        JS_FreeValue(ctx, ex);
        return {};
    }
    std::string out(s, len);
    JS_FreeCString(ctx, s);
    return out;
}

int64_t heap_bytes(JSRuntime* rt) {
    JSMemoryUsage mu;
    JS_ComputeMemoryUsage(rt, &mu);
    return mu.memory_used_size;
}

} // namespace

struct ScriptRealm::RunState {
    ScriptRealm* realm{nullptr};
    const HostCall* host{nullptr};
    std::chrono::steady_clock::time_point deadline;
    double cpu_start_ms{0.0};
    int cpu_limit_ms{0};
    std::optional<FailureKind> abort_kind;
    bool draining{false};

    bool settled{false};
    bool settled_ok{false};
    std::string settled_type;   // typeof on success, error message on failure
    std::optional<std::string> settled_text;
    std::optional<std::string> settled_stack;
};

double thread_cpu_ms() {
    struct timespec ts;
    if (clock_gettime(CLOCK_THREAD_CPUTIME_ID, &ts) != 0) return 0.0;
    return (double)ts.tv_sec * 1000.0 + (double)ts.tv_nsec / 1e6;
}

namespace {

ScriptRealm::RunState* run_state(JSContext* ctx) {
    return static_cast<ScriptRealm::RunState*>(JS_GetContextOpaque(ctx));
}

JSValue js_host_call(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    ScriptRealm::RunState* st = run_state(ctx);
    if (!st || !st->host || argc < 3) return JS_ThrowInternalError(ctx, "binding bridge unavailable");

    std::string group = to_std_string(ctx, argv[0]);
    std::string method = to_std_string(ctx, argv[1]);
    std::string params = JS_IsString(argv[2]) ? to_std_string(ctx, argv[2]) : std::string("null");

    BindingResult r = (*st->host)(group, method, params);

    // A bound call is not preemptible; charge its time once it returns.
    if (!st->abort_kind && std::chrono::steady_clock::now() >= st->deadline) {
        st->abort_kind = FailureKind::TIMEOUT;
    }
    if (st->abort_kind) return JS_ThrowInternalError(ctx, "interrupted");

    if (!r.ok) {
        JSValue err = JS_NewError(ctx);
        JS_SetPropertyStr(ctx, err, "message", JS_NewStringLen(ctx, r.error.data(), r.error.size()));
        return JS_Throw(ctx, err);
    }
    if (r.result_json.empty()) return JS_UNDEFINED;
    return JS_NewStringLen(ctx, r.result_json.data(), r.result_json.size());
}

JSValue js_settle(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    ScriptRealm::RunState* st = run_state(ctx);
    if (!st || st->settled || argc < 3) return JS_UNDEFINED;
    st->settled = true;
    st->settled_ok = JS_ToBool(ctx, argv[0]) > 0;
    st->settled_type = to_std_string(ctx, argv[1]);
    if (JS_IsString(argv[2])) {
        std::string s = to_std_string(ctx, argv[2]);
        if (st->settled_ok) st->settled_text = std::move(s);
        else st->settled_stack = std::move(s);
    }
    return JS_UNDEFINED;
}

JSValue js_print(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    ScriptRealm::RunState* st = run_state(ctx);
    if (!st || argc < 1) return JS_UNDEFINED;
    st->realm->append_console(to_std_string(ctx, argv[0]));
    return JS_UNDEFINED;
}

JSContext* new_restricted_context(JSRuntime* rt) {
    JSContext* ctx = JS_NewContextRaw(rt);
    if (!ctx) return nullptr;
    JS_AddIntrinsicBaseObjects(ctx);
    JS_AddIntrinsicDate(ctx);
    JS_AddIntrinsicEval(ctx);
    JS_AddIntrinsicStringNormalize(ctx);
    JS_AddIntrinsicRegExpCompiler(ctx);
    JS_AddIntrinsicRegExp(ctx);
    JS_AddIntrinsicJSON(ctx);
    JS_AddIntrinsicMapSet(ctx);
    JS_AddIntrinsicPromise(ctx);
    return ctx;
}

// Message and stack of the pending exception; clears it.
void take_exception(JSContext* ctx, std::string* message, std::optional<std::string>* stack) {
    JSValue ex = JS_GetException(ctx);
    if (JS_IsError(ctx, ex)) {
        JSValue m = JS_GetPropertyStr(ctx, ex, "message");
        *message = JS_IsUndefined(m) ? to_std_string(ctx, ex) : to_std_string(ctx, m);
        JS_FreeValue(ctx, m);
        JSValue s = JS_GetPropertyStr(ctx, ex, "stack");
        if (JS_IsString(s)) *stack = to_std_string(ctx, s);
        JS_FreeValue(ctx, s);
    } else {
        *message = to_std_string(ctx, ex);
    }
    JS_FreeValue(ctx, ex);
    if (message->empty()) *message = "Uncaught exception";
}

} // namespace

ScriptRealm::ScriptRealm(const RealmLimits& limits) : limits_(limits) {
    rt_ = JS_NewRuntime();
    if (!rt_) throw std::runtime_error("failed to create QuickJS runtime");
    if (limits_.memory_limit_mb > 0) {
        JS_SetMemoryLimit(rt_, limits_.memory_limit_mb * 1024 * 1024);
    }
    JS_SetMaxStackSize(rt_, limits_.max_stack_bytes);
    JS_SetInterruptHandler(rt_, &ScriptRealm::on_interrupt, this);
}

ScriptRealm::~ScriptRealm() {
    if (rt_) JS_FreeRuntime(rt_);
}

int ScriptRealm::on_interrupt(JSRuntime*, void* opaque) {
    auto* self = static_cast<ScriptRealm*>(opaque);
    RunState* st = self->state_;
    if (!st) return 0;
    if (st->draining || st->abort_kind) return 1;
    if (self->interrupt_requested_.load()) {
        st->abort_kind = FailureKind::DISPOSED;
        return 1;
    }
    if (std::chrono::steady_clock::now() >= st->deadline) {
        st->abort_kind = FailureKind::TIMEOUT;
        return 1;
    }
    if (st->cpu_limit_ms > 0 && thread_cpu_ms() - st->cpu_start_ms >= st->cpu_limit_ms) {
        st->abort_kind = FailureKind::CPU_LIMIT;
        return 1;
    }
    return 0;
}

void ScriptRealm::append_console(const std::string& line) {
    std::lock_guard<std::mutex> lk(console_mu_);
    if (console_truncated_) return;
    if (console_.size() >= limits_.console_max_lines ||
        console_bytes_ + line.size() > limits_.console_max_bytes) {
        console_truncated_ = true;
        console_.push_back("[WARN] console output truncated");
        return;
    }
    console_bytes_ += line.size();
    console_.push_back(line);
}

std::vector<std::string> ScriptRealm::console_output() const {
    std::lock_guard<std::mutex> lk(console_mu_);
    return console_;
}

void ScriptRealm::clear_console_output() {
    std::lock_guard<std::mutex> lk(console_mu_);
    console_.clear();
    console_bytes_ = 0;
    console_truncated_ = false;
}

RealmOutcome ScriptRealm::run(const std::string& code, const BindingManifest& manifest,
                              const HostCall& host, const RunBudget& budget) {
    RealmOutcome out;
    auto wall_start = std::chrono::steady_clock::now();

    RunState st;
    st.realm = this;
    st.host = &host;
    st.deadline = wall_start + std::chrono::milliseconds(std::max(1, budget.timeout_ms));
    st.cpu_start_ms = thread_cpu_ms();
    st.cpu_limit_ms = budget.cpu_limit_ms;

    // The runtime may have been created on another thread.
    JS_UpdateStackTop(rt_);
    int64_t heap_before = heap_bytes(rt_);

    JSContext* ctx = new_restricted_context(rt_);
    if (!ctx) {
        out.kind = FailureKind::MEMORY_LIMIT;
        out.error = "failed to create script context";
        return out;
    }
    JS_SetContextOpaque(ctx, &st);
    state_ = &st;

    json::Doc manifest_doc = json::new_object();
    for (const auto& g : manifest) {
        json_object* arr = json_object_new_array();
        for (const auto& m : g.second) json_object_array_add(arr, json_object_new_string(m.c_str()));
        json_object_object_add(manifest_doc.root, g.first.c_str(), arr);
    }
    const std::string manifest_json = json::to_string(manifest_doc.root);
    const std::string wrapped = "(async () => {\n" + code + "\n})()";

    bool failed = false;
    std::string message;
    std::optional<std::string> stack;

    JSValue finish = JS_UNDEFINED;
    JSValue factory = JS_Eval(ctx, PRELUDE, std::strlen(PRELUDE), "<codemode-prelude>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(factory)) {
        failed = true;
        take_exception(ctx, &message, &stack);
    } else {
        JSValue args[5] = {
            JS_NewCFunction(ctx, js_host_call, "hostCall", 3),
            JS_NewCFunction(ctx, js_settle, "settle", 3),
            JS_NewCFunction(ctx, js_print, "print", 1),
            JS_ParseJSON(ctx, manifest_json.c_str(), manifest_json.size(), "<manifest>"),
            JS_NewString(ctx, kBindingNamespace),
        };
        finish = JS_Call(ctx, factory, JS_UNDEFINED, 5, args);
        for (JSValue& a : args) JS_FreeValue(ctx, a);
        if (JS_IsException(finish)) {
            failed = true;
            take_exception(ctx, &message, &stack);
        }
    }
    JS_FreeValue(ctx, factory);

    if (!failed) {
        heap_before = heap_bytes(rt_);
        JSValue promise = JS_Eval(ctx, wrapped.c_str(), wrapped.size(), "<script>", JS_EVAL_TYPE_GLOBAL);
        if (JS_IsException(promise)) {
            failed = true;
            take_exception(ctx, &message, &stack);
        } else {
            JSValue r = JS_Call(ctx, finish, JS_UNDEFINED, 1, &promise);
            if (JS_IsException(r)) {
                failed = true;
                take_exception(ctx, &message, &stack);
            }
            JS_FreeValue(ctx, r);
        }
        JS_FreeValue(ctx, promise);
    }
    JS_FreeValue(ctx, finish);

    while (!failed && !st.settled) {
        JSContext* job_ctx = nullptr;
        int r = JS_ExecutePendingJob(rt_, &job_ctx);
        if (r < 0) {
            failed = true;
            take_exception(job_ctx ? job_ctx : ctx, &message, &stack);
        } else if (r == 0) {
            break;
        }
    }

    out.cpu_time_ms = std::max(0.0, thread_cpu_ms() - st.cpu_start_ms);
    out.memory_used_mb = std::max<double>(0.0, double(heap_bytes(rt_) - heap_before) / (1024.0 * 1024.0));

    if (st.abort_kind) {
        out.kind = *st.abort_kind;
        switch (*st.abort_kind) {
            case FailureKind::TIMEOUT:
                out.error = timeout_error_text(budget.timeout_ms);
                break;
            case FailureKind::CPU_LIMIT:
                out.error = "Execution timeout: exceeded CPU limit of " +
                            std::to_string(budget.cpu_limit_ms) + "ms";
                break;
            default:
                out.error = "Sandbox has been disposed";
                break;
        }
    } else if (failed) {
        out.kind = message == OOM_MESSAGE ? FailureKind::MEMORY_LIMIT : FailureKind::SCRIPT_ERROR;
        out.error = message;
        out.stack = stack;
    } else if (!st.settled) {
        out.kind = FailureKind::STALLED;
        out.error = "Script awaited a promise that can never settle";
    } else if (st.settled_ok) {
        out.ok = true;
        out.value.type = st.settled_type;
        out.value.json = st.settled_text;
    } else {
        out.kind = st.settled_type == OOM_MESSAGE ? FailureKind::MEMORY_LIMIT : FailureKind::SCRIPT_ERROR;
        out.error = st.settled_type;
        out.stack = st.settled_stack;
    }

    // Kill whatever the script left queued so no job outlives its context.
    // Every job now trips the interrupt handler at its first check.
    st.draining = true;
    size_t drained = 0;
    while (true) {
        JSContext* job_ctx = nullptr;
        int r = JS_ExecutePendingJob(rt_, &job_ctx);
        if (r == 0) break;
        if (r < 0 && job_ctx) {
            JSValue ex = JS_GetException(job_ctx);
            JS_FreeValue(job_ctx, ex);
        }
        if (++drained > kMaxDrainedJobs) {
            poisoned_ = true;
            break;
        }
    }

    state_ = nullptr;
    JS_SetContextOpaque(ctx, nullptr);
    JS_FreeContext(ctx);
    JS_RunGC(rt_);
    interrupt_requested_.store(false);
    return out;
}

} // namespace codemode
