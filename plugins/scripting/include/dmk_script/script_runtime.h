#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace dmk::script {

// Raised by NativeCall::call_function when the script callback threw. The
// runtime re-raises the original script exception once control is back in the
// engine, so natives normally let it propagate.
class ScriptError : public std::runtime_error {
 public:
  ScriptError(std::string name, const std::string& message)
      : std::runtime_error(message), name_(std::move(name)) {}
  const std::string& name() const { return name_; }

 private:
  std::string name_;
};

// Arguments of one native call. Plain values arrive as JSON (undefined becomes
// null); function arguments arrive as null in `args` with a callable in the
// matching `functions` slot.
struct NativeCall {
  std::vector<nlohmann::json> args;
  std::vector<std::function<nlohmann::json()>> functions;

  const nlohmann::json& arg(size_t i) const {
    static const nlohmann::json kNull;
    return i < args.size() ? args[i] : kNull;
  }
  std::string string_arg(size_t i) const {
    const nlohmann::json& v = arg(i);
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return std::string();
    return v.dump();
  }
  bool is_function(size_t i) const { return i < functions.size() && static_cast<bool>(functions[i]); }
  nlohmann::json call_function(size_t i) const { return functions.at(i)(); }
};

using NativeFn = std::function<nlohmann::json(const NativeCall& call)>;

struct NativeBinding {
  std::string name;
  NativeFn fn;
};

struct EvalOutcome {
  bool ok = false;
  nlohmann::json value;  // completion value of the script
  std::string error_name;  // "SyntaxError", "ReferenceError", ...
  std::string error_message;
  std::string stack;
};

// Executes runnable units. Natives are installed as global functions; a native
// that throws dmk::MacroError aborts the whole evaluation and the error is
// rethrown from evaluate() even if the script tried to catch it.
class IScriptRuntime {
 public:
  virtual ~IScriptRuntime() = default;
  virtual const char* name() const = 0;
  virtual bool init(std::string& error) = 0;
  // Replaces an earlier binding with the same name.
  virtual void bind_native(const NativeBinding& binding) = 0;
  // Polled while script code runs. An exception thrown by `poll` stops the
  // script and is rethrown from evaluate().
  virtual void set_interrupt(std::function<void()> poll) = 0;
  virtual EvalOutcome evaluate(const std::string& code, const std::string& filename) = 0;
};

// QuickJS-backed runtime. Without QuickJS at build time init() fails with
// an explanation.
std::unique_ptr<IScriptRuntime> make_js_runtime();

} // namespace dmk::script
