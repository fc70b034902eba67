#pragma once

#include "data_model.hpp"
#include "data_path.hpp"
#include "reactive.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace genui {

class ClientFunction;
class FunctionRegistry;

enum class BindingKind {
  kLiteral,
  kPathReference,
  kFunctionCall,
  kList,
};

// Classifies a value found in a component's property bundle.
BindingKind ClassifyBinding(const nlohmann::json& descriptor);

// Condition truthiness: null, false, "", 0 and empty collections are false.
bool IsConditionTrue(const nlohmann::json& value);

// Resolves binding descriptors against one surface's data model.
// A context is a cheap value: the data model and the function registry are
// borrowed and must outlive every stream resolved through the context.
class ExecutionContext {
 public:
  ExecutionContext(DataModel* data_model, const FunctionRegistry* functions, DataPath path = DataPath::Root());

  const DataPath& Path() const { return path_; }
  DataModel* Model() const { return data_model_; }
  const FunctionRegistry* Functions() const { return functions_; }

  const ClientFunction* GetFunction(const std::string& name) const;

  DataPath ResolvePath(const DataPath& path) const;
  ValueStream Watch(const DataPath& path) const;
  std::optional<nlohmann::json> GetValue(const DataPath& path, std::string* err = nullptr) const;
  bool Update(const DataPath& path, nlohmann::json contents, std::string* err = nullptr) const;

  // Child context for descendants bound inside repeated structures.
  ExecutionContext Nested(const DataPath& relative_path) const;

  // Turns a descriptor into a live value.
  // Literals emit once. `{"path": p}` follows the data model at p resolved
  // against Path(). `{"function": name, "args": {...}}` resolves every
  // argument and re-invokes the function, cancelling the previous
  // invocation, whenever any argument changes. Arrays resolve element-wise.
  ValueStream Resolve(const nlohmann::json& descriptor) const;

  ValueStream EvaluateCondition(const nlohmann::json& condition) const;

 private:
  ValueStream ResolveFunctionCall(const std::string& name, const nlohmann::json& args) const;

  DataModel* data_model_;
  const FunctionRegistry* functions_;
  DataPath path_;
};

}  // namespace genui
