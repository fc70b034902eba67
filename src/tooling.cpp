#include "tooling.hpp"

#include "ui_models.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <mutex>
#include <string>
#include <utility>

namespace genui {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string ToLower(std::string s) {
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  return s;
}

static std::optional<std::string> ExtractFirstJsonObject(const std::string& text) {
  auto pos = text.find('{');
  if (pos == std::string::npos) return std::nullopt;
  int depth = 0;
  bool in_string = false;
  bool escape = false;
  for (size_t i = pos; i < text.size(); i++) {
    char c = text[i];
    if (in_string) {
      if (escape) {
        escape = false;
      } else if (c == '\\') {
        escape = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
      continue;
    }
    if (c == '{') depth++;
    if (c == '}') {
      depth--;
      if (depth == 0) return text.substr(pos, i - pos + 1);
    }
  }
  return std::nullopt;
}

// Strips a ```json ... ``` fence around the whole text.
static std::string StripCodeFence(const std::string& text) {
  auto t = Trim(text);
  if (t.rfind("```", 0) != 0) return t;
  auto first_nl = t.find('\n');
  if (first_nl == std::string::npos) return t;
  auto close = t.rfind("```");
  if (close == std::string::npos || close <= first_nl) return t;
  return Trim(t.substr(first_nl + 1, close - first_nl - 1));
}

static std::optional<ToolCall> MakeCall(const nlohmann::json& item) {
  if (!item.is_object()) return std::nullopt;
  ToolCall c;
  c.id = NewId("call");
  if (item.contains("id") && item["id"].is_string()) c.id = item["id"].get<std::string>();

  if (item.contains("name") && item["name"].is_string()) c.name = item["name"].get<std::string>();
  if (c.name.empty() && item.contains("tool") && item["tool"].is_string()) c.name = item["tool"].get<std::string>();
  if (c.name.empty() && item.contains("function") && item["function"].is_object() && item["function"].contains("name") &&
      item["function"]["name"].is_string()) {
    c.name = item["function"]["name"].get<std::string>();
  }
  if (c.name.empty()) return std::nullopt;

  const nlohmann::json* args = nullptr;
  if (item.contains("arguments")) {
    args = &item["arguments"];
  } else if (item.contains("args")) {
    args = &item["args"];
  } else if (item.contains("function") && item["function"].is_object() && item["function"].contains("arguments")) {
    args = &item["function"]["arguments"];
  }
  if (!args) return std::nullopt;

  if (args->is_string()) {
    const auto s = args->get<std::string>();
    c.arguments_json = ParseJsonLoose(s) ? s : nlohmann::json(s).dump();
  } else if (args->is_null()) {
    c.arguments_json = "{}";
  } else {
    c.arguments_json = args->dump();
  }
  if (c.arguments_json.empty()) c.arguments_json = "{}";
  return c;
}

static std::optional<std::vector<ToolCall>> ExtractToolCallsFromJson(const nlohmann::json& root) {
  if (!root.is_object()) return std::nullopt;

  for (const auto& key : {"tool_call", "toolCall"}) {
    if (root.contains(key) && root[key].is_object()) {
      if (auto c = MakeCall(root[key])) return std::vector<ToolCall>{*c};
    }
  }

  if (auto c = MakeCall(root)) return std::vector<ToolCall>{*c};

  for (const auto& key : {"tool_calls", "toolCalls"}) {
    if (!root.contains(key) || !root[key].is_array()) continue;
    std::vector<ToolCall> calls;
    for (const auto& item : root[key]) {
      if (auto c = MakeCall(item)) calls.push_back(std::move(*c));
    }
    if (!calls.empty()) return calls;
  }
  return std::nullopt;
}

static std::optional<std::vector<ToolCall>> ExtractToolCallsFromTaggedText(const std::string& assistant_text) {
  const std::string lower = ToLower(assistant_text);
  const std::string open_tag = "<tool_call>";
  const std::string close_tag = "</tool_call>";

  std::vector<ToolCall> calls;
  size_t pos = 0;
  while (pos < lower.size()) {
    size_t start = lower.find(open_tag, pos);
    if (start == std::string::npos) break;
    start += open_tag.size();
    size_t end = lower.find(close_tag, start);
    if (end == std::string::npos) end = lower.size();

    auto body = Trim(assistant_text.substr(start, end - start));
    if (auto j = ParseJsonLoose(body)) {
      if (auto c = MakeCall(*j)) calls.push_back(std::move(*c));
    }
    pos = end + close_tag.size();
  }
  if (calls.empty()) return std::nullopt;
  return calls;
}

static bool CheckType(const std::string& t, const nlohmann::json& v) {
  if (t == "string") return v.is_string();
  if (t == "integer") return v.is_number_integer() || (v.is_number_float() && std::floor(v.get<double>()) == v.get<double>());
  if (t == "number") return v.is_number();
  if (t == "boolean") return v.is_boolean();
  if (t == "object") return v.is_object();
  if (t == "array") return v.is_array();
  if (t == "null") return v.is_null();
  return true;
}

static ToolResult ErrorResult(const ToolCall& call, const std::string& message) {
  ToolResult r;
  r.tool_call_id = call.id;
  r.name = call.name;
  r.ok = false;
  r.error = message;
  r.result = {{"ok", false}, {"error", message}};
  return r;
}

}  // namespace

void ToolRegistry::RegisterTool(ToolSchema schema, ToolHandler handler) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto name = schema.name;
  schemas_[name] = std::move(schema);
  handlers_[name] = std::move(handler);
}

std::optional<ToolSchema> ToolRegistry::GetSchema(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = schemas_.find(name);
  if (it == schemas_.end()) return std::nullopt;
  return it->second;
}

std::optional<ToolHandler> ToolRegistry::GetHandler(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return std::nullopt;
  return it->second;
}

std::vector<ToolSchema> ToolRegistry::ListSchemas() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolSchema> out;
  out.reserve(schemas_.size());
  for (const auto& [_, schema] : schemas_) out.push_back(schema);
  std::sort(out.begin(), out.end(), [](const ToolSchema& a, const ToolSchema& b) { return a.name < b.name; });
  return out;
}

std::vector<std::string> ExtractToolNames(const std::vector<ToolSchema>& tools) {
  std::vector<std::string> out;
  out.reserve(tools.size());
  for (const auto& t : tools) out.push_back(t.name);
  return out;
}

bool ValidateSchemaLoose(const nlohmann::json& schema, const nlohmann::json& args, std::string* err) {
  if (!schema.is_object()) return true;
  if (schema.contains("type") && schema["type"].is_string()) {
    auto t = schema["type"].get<std::string>();
    if (!CheckType(t, args)) {
      if (err) *err = "arguments type mismatch: expected " + t;
      return false;
    }
  }
  if (schema.contains("required") && schema["required"].is_array() && args.is_object()) {
    for (const auto& r : schema["required"]) {
      if (!r.is_string()) continue;
      auto k = r.get<std::string>();
      if (!args.contains(k)) {
        if (err) *err = "missing required field: " + k;
        return false;
      }
    }
  }
  if (schema.contains("properties") && schema["properties"].is_object() && args.is_object()) {
    for (const auto& [k, ps] : schema["properties"].items()) {
      if (!args.contains(k)) continue;
      if (!ps.is_object()) continue;
      if (ps.contains("type") && ps["type"].is_string()) {
        if (!CheckType(ps["type"].get<std::string>(), args[k])) {
          if (err) *err = "field type mismatch: " + k;
          return false;
        }
      }
    }
  }
  return true;
}

std::optional<nlohmann::json> ParseJsonLoose(const std::string& text) {
  auto trimmed = StripCodeFence(text);
  if (trimmed.empty()) return std::nullopt;
  if (auto j = nlohmann::json::parse(trimmed, nullptr, false); !j.is_discarded()) return j;
  if (auto obj = ExtractFirstJsonObject(trimmed)) {
    auto j = nlohmann::json::parse(*obj, nullptr, false);
    if (!j.is_discarded()) return j;
  }
  return std::nullopt;
}

std::optional<std::vector<ToolCall>> ParseToolCallsFromAssistantText(const std::string& assistant_text) {
  if (auto tagged = ExtractToolCallsFromTaggedText(assistant_text)) return tagged;
  auto jopt = ParseJsonLoose(assistant_text);
  if (jopt) return ExtractToolCallsFromJson(*jopt);
  return std::nullopt;
}

ToolResult ExecuteToolCall(const ToolRegistry& registry, const ToolCall& call) {
  auto handler = registry.GetHandler(call.name);
  if (!handler) return ErrorResult(call, "tool not found");

  auto args = ParseJsonLoose(call.arguments_json.empty() ? "{}" : call.arguments_json);
  if (!args) return ErrorResult(call, "invalid tool arguments json");

  if (auto schema = registry.GetSchema(call.name)) {
    std::string verr;
    if (!ValidateSchemaLoose(schema->parameters, *args, &verr)) return ErrorResult(call, "invalid tool arguments: " + verr);
  }

  ToolResult r;
  try {
    r = (*handler)(call.id, *args);
  } catch (const std::exception& e) {
    return ErrorResult(call, std::string("tool failed: ") + e.what());
  }
  if (r.tool_call_id.empty()) r.tool_call_id = call.id;
  if (r.name.empty()) r.name = call.name;
  if (!r.ok && r.error.empty()) r.error = "tool failed";
  return r;
}

}  // namespace genui
