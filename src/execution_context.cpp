#include "execution_context.hpp"

#include "client_function.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace genui {

BindingKind ClassifyBinding(const nlohmann::json& descriptor) {
  if (descriptor.is_array()) {
    for (const auto& item : descriptor) {
      if (ClassifyBinding(item) != BindingKind::kLiteral) return BindingKind::kList;
    }
    return BindingKind::kLiteral;
  }
  if (!descriptor.is_object()) return BindingKind::kLiteral;
  if (descriptor.size() == 1 && descriptor.contains("path") && descriptor["path"].is_string()) {
    return BindingKind::kPathReference;
  }
  if (descriptor.contains("function") && descriptor["function"].is_string()) {
    for (const auto& [key, _] : descriptor.items()) {
      if (key != "function" && key != "args") return BindingKind::kLiteral;
    }
    return BindingKind::kFunctionCall;
  }
  return BindingKind::kLiteral;
}

bool IsConditionTrue(const nlohmann::json& value) {
  if (value.is_null()) return false;
  if (value.is_boolean()) return value.get<bool>();
  if (value.is_string()) return !value.get_ref<const std::string&>().empty();
  if (value.is_number()) return value.get<double>() != 0.0;
  if (value.is_array() || value.is_object()) return !value.empty();
  return true;
}

ExecutionContext::ExecutionContext(DataModel* data_model, const FunctionRegistry* functions, DataPath path)
    : data_model_(data_model), functions_(functions), path_(std::move(path)) {}

const ClientFunction* ExecutionContext::GetFunction(const std::string& name) const {
  if (!functions_) return nullptr;
  return functions_->Get(name);
}

DataPath ExecutionContext::ResolvePath(const DataPath& path) const {
  return path.Resolve(path_);
}

ValueStream ExecutionContext::Watch(const DataPath& path) const {
  if (!data_model_) return ValueStream::Error("execution context has no data model");
  return data_model_->Watch(ResolvePath(path));
}

std::optional<nlohmann::json> ExecutionContext::GetValue(const DataPath& path, std::string* err) const {
  if (!data_model_) {
    if (err) *err = "execution context has no data model";
    return std::nullopt;
  }
  return data_model_->Get(ResolvePath(path), err);
}

bool ExecutionContext::Update(const DataPath& path, nlohmann::json contents, std::string* err) const {
  if (!data_model_) {
    if (err) *err = "execution context has no data model";
    return false;
  }
  return data_model_->Update(ResolvePath(path), std::move(contents), err);
}

ExecutionContext ExecutionContext::Nested(const DataPath& relative_path) const {
  return ExecutionContext(data_model_, functions_, path_.Join(relative_path));
}

ValueStream ExecutionContext::Resolve(const nlohmann::json& descriptor) const {
  switch (ClassifyBinding(descriptor)) {
    case BindingKind::kLiteral:
      return ValueStream::Of(descriptor);
    case BindingKind::kPathReference:
      return Watch(DataPath(descriptor["path"].get<std::string>()));
    case BindingKind::kFunctionCall: {
      nlohmann::json args = descriptor.contains("args") ? descriptor["args"] : nlohmann::json::object();
      return ResolveFunctionCall(descriptor["function"].get<std::string>(), args);
    }
    case BindingKind::kList: {
      std::vector<ValueStream> items;
      items.reserve(descriptor.size());
      for (const auto& item : descriptor) items.push_back(Resolve(item));
      return ValueStream::CombineLatest(std::move(items));
    }
  }
  return ValueStream::Of(descriptor);
}

ValueStream ExecutionContext::ResolveFunctionCall(const std::string& name, const nlohmann::json& args) const {
  const ClientFunction* fn = GetFunction(name);
  if (!fn) return ValueStream::Error("unknown function: " + name);
  if (!args.is_null() && !args.is_object()) return ValueStream::Error("arguments of " + name + " must be an object");

  std::vector<std::string> keys;
  std::vector<ValueStream> streams;
  if (args.is_object()) {
    for (const auto& [key, value] : args.items()) {
      keys.push_back(key);
      streams.push_back(Resolve(value));
    }
  }

  ExecutionContext self = *this;
  return ValueStream::CombineLatest(std::move(streams)).SwitchMap([keys, fn, self](const nlohmann::json& values) {
    nlohmann::json snapshot = nlohmann::json::object();
    for (size_t i = 0; i < keys.size() && i < values.size(); i++) snapshot[keys[i]] = values[i];
    try {
      return fn->Execute(snapshot, self);
    } catch (const std::exception& e) {
      return ValueStream::Error(fn->Name() + ": " + e.what());
    }
  });
}

ValueStream ExecutionContext::EvaluateCondition(const nlohmann::json& condition) const {
  return Resolve(condition).Map([](const nlohmann::json& v) { return nlohmann::json(IsConditionTrue(v)); });
}

}  // namespace genui
