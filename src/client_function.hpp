#pragma once

#include "execution_context.hpp"
#include "reactive.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace genui {

enum class FunctionReturnType {
  kString,
  kNumber,
  kBoolean,
  kArray,
  kObject,
  kAny,
  kVoid,
};

const char* FunctionReturnTypeName(FunctionReturnType t);

class ClientFunction {
 public:
  virtual ~ClientFunction() = default;

  virtual std::string Name() const = 0;
  virtual std::string Description() const = 0;
  virtual nlohmann::json ArgumentSchema() const = 0;
  virtual FunctionReturnType ReturnType() const { return FunctionReturnType::kAny; }

  // Invoked again with fresh arguments whenever a bound argument changes;
  // the stream returned for the previous arguments is cancelled first.
  virtual ValueStream Execute(const nlohmann::json& args, const ExecutionContext& context) const = 0;
};

// Base for functions that compute a single value. An exception thrown by
// ExecuteSync becomes a stream error.
class SynchronousClientFunction : public ClientFunction {
 public:
  ValueStream Execute(const nlohmann::json& args, const ExecutionContext& context) const override;

 protected:
  virtual nlohmann::json ExecuteSync(const nlohmann::json& args, const ExecutionContext& context) const = 0;
};

class FunctionRegistry {
 public:
  FunctionRegistry() = default;
  FunctionRegistry(const FunctionRegistry&) = delete;
  FunctionRegistry& operator=(const FunctionRegistry&) = delete;

  // Replaces any function already registered under the same name.
  void Register(std::unique_ptr<ClientFunction> fn);

  const ClientFunction* Get(const std::string& name) const;
  bool Has(const std::string& name) const { return Get(name) != nullptr; }
  std::vector<std::string> Names() const;

  // [{"name", "description", "returnType", "parameters"}], sorted by name.
  nlohmann::json Describe() const;

  bool ValidateArguments(const std::string& name, const nlohmann::json& args, std::string* err) const;

 private:
  std::unordered_map<std::string, std::unique_ptr<ClientFunction>> functions_;
};

}  // namespace genui
