#include "dmk/errors.h"
#include "dmk/log.h"
#include "dmk_script/script_runtime.h"

#if DMK_HAVE_QUICKJS
#include <quickjs.h>
#endif

#include <cmath>
#include <cstdint>
#include <exception>
#include <utility>

namespace dmk::script {

namespace {

#if DMK_HAVE_QUICKJS
constexpr size_t kMemoryLimit = 64 * 1024 * 1024;
constexpr size_t kMaxStackSize = 1024 * 1024;

std::string js_string(JSContext* ctx, JSValueConst value) {
  size_t len = 0;
  const char* s = JS_ToCStringLen(ctx, &len, value);
  if (!s) {
    return std::string();
  }
  std::string out(s, len);
  JS_FreeCString(ctx, s);
  return out;
}

std::string property_string(JSContext* ctx, JSValueConst obj, const char* name) {
  JSValue v = JS_GetPropertyStr(ctx, obj, name);
  std::string out = JS_IsUndefined(v) || JS_IsNull(v) ? std::string() : js_string(ctx, v);
  JS_FreeValue(ctx, v);
  return out;
}

void describe_exception(JSContext* ctx, JSValueConst exc, std::string& name, std::string& message,
                        std::string& stack) {
  if (JS_IsObject(exc)) {
    name = property_string(ctx, exc, "name");
    message = property_string(ctx, exc, "message");
    stack = property_string(ctx, exc, "stack");
  } else {
    message = js_string(ctx, exc);
  }
  if (name.empty()) {
    name = "Error";
  }
}

nlohmann::json to_json(JSContext* ctx, JSValueConst value) {
  if (JS_IsUndefined(value) || JS_IsNull(value) || JS_IsFunction(ctx, value)) {
    return nullptr;
  }
  if (JS_IsBool(value)) {
    return JS_ToBool(ctx, value) != 0;
  }
  if (JS_IsString(value)) {
    return js_string(ctx, value);
  }
  if (JS_IsNumber(value)) {
    double d = 0;
    JS_ToFloat64(ctx, &d, value);
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9007199254740992.0) {
      return static_cast<long long>(d);
    }
    return d;
  }
  JSValue text = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
  if (JS_IsException(text)) {
    JS_FreeValue(ctx, JS_GetException(ctx));
    return nullptr;
  }
  const std::string s = JS_IsUndefined(text) ? std::string() : js_string(ctx, text);
  JS_FreeValue(ctx, text);
  nlohmann::json out = nlohmann::json::parse(s, nullptr, false);
  return out.is_discarded() ? nlohmann::json() : out;
}

JSValue from_json(JSContext* ctx, const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
      return JS_NULL;
    case nlohmann::json::value_t::boolean:
      return JS_NewBool(ctx, value.get<bool>());
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
      return JS_NewInt64(ctx, value.get<int64_t>());
    case nlohmann::json::value_t::number_float:
      return JS_NewFloat64(ctx, value.get<double>());
    case nlohmann::json::value_t::string: {
      const auto& s = value.get_ref<const std::string&>();
      return JS_NewStringLen(ctx, s.data(), s.size());
    }
    default: {
      const std::string s = value.dump();
      return JS_ParseJSON(ctx, s.c_str(), s.size(), "<native>");
    }
  }
}
#endif

class JsRuntime final : public IScriptRuntime {
 public:
  const char* name() const override { return "js"; }

  bool init(std::string& error) override {
#if DMK_HAVE_QUICKJS
    if (!rt_) {
      rt_ = JS_NewRuntime();
      if (!rt_) {
        error = "QuickJS runtime could not be created";
        return false;
      }
      JS_SetMemoryLimit(rt_, kMemoryLimit);
      JS_SetMaxStackSize(rt_, kMaxStackSize);
      JS_SetInterruptHandler(rt_, &JsRuntime::interrupt_handler, this);
    }
    log::info("script:js init (QuickJS)");
    return true;
#else
    error = "JavaScript runtime not available (built without QuickJS)";
    log::warn("script:js not available (QuickJS not found)");
    return false;
#endif
  }

  void bind_native(const NativeBinding& binding) override {
    if (!binding.fn) {
      return;
    }
    for (auto& existing : natives_) {
      if (existing.name == binding.name) {
        existing = binding;
        return;
      }
    }
    natives_.push_back(binding);
  }

  void set_interrupt(std::function<void()> poll) override { poll_ = std::move(poll); }

  EvalOutcome evaluate(const std::string& code, const std::string& filename) override {
#if DMK_HAVE_QUICKJS
    if (!rt_) {
      throw MacroError(ErrorKind::EnvironmentUnavailable, "runtime_unavailable", "script runtime not initialized");
    }
    // A fresh context per evaluation: nothing a macro defines survives into the next run.
    ContextHandle handle(*this, JS_NewContext(rt_));
    JSContext* ctx = handle.ctx;
    if (!ctx) {
      throw MacroError(ErrorKind::EnvironmentUnavailable, "runtime_unavailable", "QuickJS context could not be created");
    }
    JS_SetContextOpaque(ctx, this);
    install_natives(ctx);

    EvalOutcome out;
    JSValue result = JS_Eval(ctx, code.c_str(), code.size(), filename.c_str(), JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(result)) {
      JSValue exc = JS_GetException(ctx);
      describe_exception(ctx, exc, out.error_name, out.error_message, out.stack);
      JS_FreeValue(ctx, exc);
    } else {
      out.ok = true;
      out.value = to_json(ctx, result);
    }
    JS_FreeValue(ctx, result);

    if (pending_native_) {
      std::exception_ptr pending = std::exchange(pending_native_, nullptr);
      std::rethrow_exception(pending);
    }
    return out;
#else
    (void)code;
    (void)filename;
    throw MacroError(ErrorKind::EnvironmentUnavailable, "runtime_unavailable",
                     "JavaScript runtime not available (built without QuickJS)");
#endif
  }

  ~JsRuntime() override {
#if DMK_HAVE_QUICKJS
    if (rt_) {
      JS_FreeRuntime(rt_);
      rt_ = nullptr;
    }
#endif
  }

 private:
#if DMK_HAVE_QUICKJS
  struct ContextHandle {
    ContextHandle(JsRuntime& owner, JSContext* c) : self(owner), ctx(c) {}
    ~ContextHandle() {
      if (!ctx) return;
      self.drop_pending_script(ctx);
      JS_FreeContext(ctx);
    }
    ContextHandle(const ContextHandle&) = delete;
    ContextHandle& operator=(const ContextHandle&) = delete;

    JsRuntime& self;
    JSContext* ctx;
  };

  static int interrupt_handler(JSRuntime*, void* opaque) {
    auto* self = static_cast<JsRuntime*>(opaque);
    if (!self->poll_ || self->pending_native_) {
      return self->pending_native_ ? 1 : 0;
    }
    try {
      self->poll_();
    } catch (const std::exception&) {
      self->pending_native_ = std::current_exception();
      return 1;
    }
    return 0;
  }

  void drop_pending_script(JSContext* ctx) {
    if (has_pending_script_) {
      JS_FreeValue(ctx, pending_script_);
      has_pending_script_ = false;
    }
  }

  void install_natives(JSContext* ctx) {
    JSValue global = JS_GetGlobalObject(ctx);
    for (size_t i = 0; i < natives_.size(); ++i) {
      JSValue fn = JS_NewCFunctionData(ctx, &JsRuntime::trampoline, 0, static_cast<int>(i), 0, nullptr);
      JS_SetPropertyStr(ctx, global, natives_[i].name.c_str(), fn);
    }
    JS_FreeValue(ctx, global);
  }

  static JSValue trampoline(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic, JSValue*) {
    auto* self = static_cast<JsRuntime*>(JS_GetContextOpaque(ctx));
    const NativeBinding& binding = self->natives_.at(static_cast<size_t>(magic));
    if (self->pending_native_) {
      // The run has already failed; a macro that caught the error gets no further host calls.
      return JS_ThrowInternalError(ctx, "%s refused: run already failed", binding.name.c_str());
    }

    NativeCall call;
    call.args.reserve(static_cast<size_t>(argc));
    call.functions.resize(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) {
      if (JS_IsFunction(ctx, argv[i])) {
        call.args.emplace_back(nullptr);
        JSValueConst fn = argv[i];
        call.functions[static_cast<size_t>(i)] = [self, ctx, fn]() -> nlohmann::json {
          JSValue r = JS_Call(ctx, fn, JS_UNDEFINED, 0, nullptr);
          if (JS_IsException(r)) {
            JSValue exc = JS_GetException(ctx);
            std::string name, message, stack;
            describe_exception(ctx, exc, name, message, stack);
            self->drop_pending_script(ctx);
            self->pending_script_ = exc;
            self->has_pending_script_ = true;
            throw ScriptError(name, message);
          }
          nlohmann::json j = to_json(ctx, r);
          JS_FreeValue(ctx, r);
          return j;
        };
      } else {
        call.args.push_back(to_json(ctx, argv[i]));
      }
    }

    try {
      return from_json(ctx, binding.fn(call));
    } catch (const ScriptError& e) {
      if (self->has_pending_script_) {
        self->has_pending_script_ = false;
        return JS_Throw(ctx, self->pending_script_);
      }
      return JS_ThrowInternalError(ctx, "%s: %s", e.name().c_str(), e.what());
    } catch (const MacroError& e) {
      self->pending_native_ = std::current_exception();
      return JS_ThrowInternalError(ctx, "%s", e.display().c_str());
    } catch (const std::exception& e) {
      self->pending_native_ = std::current_exception();
      return JS_ThrowInternalError(ctx, "%s failed: %s", binding.name.c_str(), e.what());
    }
  }

  JSRuntime* rt_ = nullptr;
  JSValue pending_script_{};
  bool has_pending_script_ = false;
#endif
  std::vector<NativeBinding> natives_;
  std::function<void()> poll_;
  std::exception_ptr pending_native_;
};

} // namespace

std::unique_ptr<IScriptRuntime> make_js_runtime() {
  return std::make_unique<JsRuntime>();
}

} // namespace dmk::script
