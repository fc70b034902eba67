#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace genui {

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json parameters;
};

struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments_json;
};

struct ToolResult {
  std::string tool_call_id;
  std::string name;
  nlohmann::json result;
  bool ok = true;
  std::string error;
};

using ToolHandler = std::function<ToolResult(const std::string& tool_call_id, const nlohmann::json& arguments)>;

class ToolRegistry {
 public:
  ToolRegistry() = default;
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  void RegisterTool(ToolSchema schema, ToolHandler handler);
  std::optional<ToolSchema> GetSchema(const std::string& name) const;
  std::optional<ToolHandler> GetHandler(const std::string& name) const;

  // Sorted by name.
  std::vector<ToolSchema> ListSchemas() const;

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, ToolSchema> schemas_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools);

// Checks `type`, `required` and the type of each declared property. Unknown
// keywords and extra properties are accepted.
bool ValidateSchemaLoose(const nlohmann::json& schema, const nlohmann::json& args, std::string* err);

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text);

// Recovers tool calls that a model wrote into its text instead of the
// structured field: {"tool_calls": [...]}, a single {"name", "arguments"}
// object, or <tool_call>...</tool_call> blocks.
std::optional<std::vector<ToolCall>> ParseToolCallsFromAssistantText(const std::string& assistant_text);

// Runs one call against the registry and always returns a result.
// Unknown tools, unparsable or schema-violating arguments and handler
// exceptions all come back as `ok == false` with `error` set.
ToolResult ExecuteToolCall(const ToolRegistry& registry, const ToolCall& call);

}  // namespace genui
