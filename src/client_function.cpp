#include "client_function.hpp"

#include "tooling.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace genui {

const char* FunctionReturnTypeName(FunctionReturnType t) {
  switch (t) {
    case FunctionReturnType::kString:
      return "string";
    case FunctionReturnType::kNumber:
      return "number";
    case FunctionReturnType::kBoolean:
      return "boolean";
    case FunctionReturnType::kArray:
      return "array";
    case FunctionReturnType::kObject:
      return "object";
    case FunctionReturnType::kAny:
      return "any";
    case FunctionReturnType::kVoid:
      return "void";
  }
  return "any";
}

ValueStream SynchronousClientFunction::Execute(const nlohmann::json& args, const ExecutionContext& context) const {
  try {
    return ValueStream::Of(ExecuteSync(args, context));
  } catch (const std::exception& e) {
    return ValueStream::Error(Name() + ": " + e.what());
  }
}

void FunctionRegistry::Register(std::unique_ptr<ClientFunction> fn) {
  if (!fn) return;
  auto name = fn->Name();
  functions_[name] = std::move(fn);
}

const ClientFunction* FunctionRegistry::Get(const std::string& name) const {
  auto it = functions_.find(name);
  if (it == functions_.end()) return nullptr;
  return it->second.get();
}

std::vector<std::string> FunctionRegistry::Names() const {
  std::vector<std::string> out;
  out.reserve(functions_.size());
  for (const auto& kv : functions_) out.push_back(kv.first);
  std::sort(out.begin(), out.end());
  return out;
}

nlohmann::json FunctionRegistry::Describe() const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& name : Names()) {
    const auto* fn = Get(name);
    out.push_back({{"name", name},
                   {"description", fn->Description()},
                   {"returnType", FunctionReturnTypeName(fn->ReturnType())},
                   {"parameters", fn->ArgumentSchema()}});
  }
  return out;
}

bool FunctionRegistry::ValidateArguments(const std::string& name, const nlohmann::json& args, std::string* err) const {
  const auto* fn = Get(name);
  if (!fn) {
    if (err) *err = "unknown function: " + name;
    return false;
  }
  return ValidateSchemaLoose(fn->ArgumentSchema(), args, err);
}

}  // namespace genui
