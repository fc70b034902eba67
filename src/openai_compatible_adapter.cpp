#include "openai_compatible_adapter.hpp"

#include "log.hpp"
#include "ui_models.hpp"

#include <httplib.h>

#include <iostream>
#include <memory>
#include <utility>

namespace genui {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(5);
  cli->set_read_timeout(300);
  cli->set_write_timeout(30);
  return cli;
}

static std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

static ToolCall ToolCallFromOpenAi(const nlohmann::json& item) {
  ToolCall c;
  // Some servers send "id": null.
  if (item.contains("id") && item["id"].is_string()) c.id = item["id"].get<std::string>();
  if (c.id.empty()) c.id = NewId("call");
  if (item.contains("function") && item["function"].is_object()) {
    const auto& fn = item["function"];
    if (fn.contains("name") && fn["name"].is_string()) c.name = fn["name"].get<std::string>();
    if (fn.contains("arguments")) {
      const auto& a = fn["arguments"];
      c.arguments_json = a.is_string() ? a.get<std::string>() : a.dump();
    }
  }
  if (c.arguments_json.empty()) c.arguments_json = "{}";
  return c;
}

}  // namespace

OpenAiCompatibleAdapter::OpenAiCompatibleAdapter(HttpEndpoint endpoint, std::string model, std::string api_key)
    : endpoint_(std::move(endpoint)), model_(std::move(model)), api_key_(std::move(api_key)) {}

std::string OpenAiCompatibleAdapter::Name() const {
  return "openai_compatible";
}

nlohmann::json OpenAiCompatibleAdapter::AdaptTools(const std::vector<ToolSchema>& tools) const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& t : tools) {
    nlohmann::json params = t.parameters.is_object() ? t.parameters : nlohmann::json{{"type", "object"}};
    out.push_back({{"type", "function"},
                   {"function", {{"name", t.name}, {"description", t.description}, {"parameters", params}}}});
  }
  return out;
}

nlohmann::json OpenAiCompatibleAdapter::ConvertMessages(const std::vector<ChatMessage>& messages) const {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& m : messages) {
    if (m.role == "tool") {
      for (const auto& r : m.tool_results) {
        nlohmann::json content = r.result;
        if (!r.ok && !content.is_object()) content = {{"ok", false}, {"error", r.error}};
        out.push_back({{"role", "tool"}, {"tool_call_id", r.tool_call_id}, {"content", content.dump()}});
      }
      continue;
    }
    if (m.IsUiSurface()) {
      out.push_back({{"role", "assistant"},
                     {"content", "Surface '" + m.ui_surface_id + "' is on screen with this definition: " +
                                     m.ui_definition.dump()}});
      continue;
    }
    nlohmann::json j;
    j["role"] = m.role;
    if (m.role == "assistant" && !m.tool_calls.empty()) {
      j["content"] = m.content.empty() ? nlohmann::json(nullptr) : nlohmann::json(m.content);
      j["tool_calls"] = nlohmann::json::array();
      for (const auto& c : m.tool_calls) {
        j["tool_calls"].push_back(
            {{"id", c.id}, {"type", "function"}, {"function", {{"name", c.name}, {"arguments", c.arguments_json}}}});
      }
    } else {
      j["content"] = m.content;
    }
    out.push_back(std::move(j));
  }
  return out;
}

std::optional<nlohmann::json> OpenAiCompatibleAdapter::GenerateContent(const nlohmann::json& content,
                                                                       const nlohmann::json& tools,
                                                                       std::string* err) {
  auto cli = MakeClient(endpoint_);
  if (!api_key_.empty()) cli->set_bearer_token_auth(api_key_);

  nlohmann::json j;
  j["model"] = model_;
  j["stream"] = false;
  j["messages"] = content;
  if (tools.is_array() && !tools.empty()) j["tools"] = tools;

  auto res = cli->Post(JoinPath(endpoint_.base_path, "/v1/chat/completions"), j.dump(), "application/json");
  if (!res) {
    if (err) *err = Name() + ": failed to connect to " + endpoint_.host + ":" + std::to_string(endpoint_.port);
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = Name() + ": /v1/chat/completions http " + std::to_string(res->status);
    if (LogEnabled()) std::cout << "[provider-error] body=" << TruncateForLog(res->body, 2000) << "\n";
    return std::nullopt;
  }
  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") ||
      !jr["choices"][0]["message"].is_object()) {
    if (err) *err = Name() + ": invalid json from /v1/chat/completions";
    return std::nullopt;
  }
  return jr;
}

ModelTurnResult OpenAiCompatibleAdapter::ProcessResponse(const nlohmann::json& response) const {
  ModelTurnResult out;
  if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) return out;
  const auto& choice = response["choices"][0];
  if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) return out;
  const auto& message = choice["message"];

  if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
    for (const auto& item : message["tool_calls"]) {
      if (!item.is_object()) continue;
      auto c = ToolCallFromOpenAi(item);
      if (!c.name.empty()) out.tool_calls.push_back(std::move(c));
    }
  }

  std::string text;
  if (message.contains("content") && message["content"].is_string()) text = message["content"].get<std::string>();

  // Smaller local models often write the call into the text instead.
  if (out.tool_calls.empty() && !text.empty()) {
    if (auto calls = ParseToolCallsFromAssistantText(text)) {
      out.tool_calls = std::move(*calls);
      return out;
    }
  }
  if (!text.empty()) out.text = std::move(text);
  return out;
}

}  // namespace genui
