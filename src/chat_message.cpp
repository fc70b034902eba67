#include "chat_message.hpp"

#include <utility>

namespace genui {

ChatMessage ChatMessage::System(std::string text) {
  ChatMessage m;
  m.role = "system";
  m.content = std::move(text);
  return m;
}

ChatMessage ChatMessage::User(std::string text) {
  ChatMessage m;
  m.role = "user";
  m.content = std::move(text);
  return m;
}

ChatMessage ChatMessage::UiInteraction(std::string text) {
  ChatMessage m = User(std::move(text));
  m.ui_interaction = true;
  return m;
}

ChatMessage ChatMessage::Assistant(std::string text, std::vector<ToolCall> calls) {
  ChatMessage m;
  m.role = "assistant";
  m.content = std::move(text);
  m.tool_calls = std::move(calls);
  return m;
}

ChatMessage ChatMessage::Tool(std::vector<ToolResult> results) {
  ChatMessage m;
  m.role = "tool";
  m.tool_results = std::move(results);
  return m;
}

ChatMessage ChatMessage::UiSurface(std::string surface_id, nlohmann::json definition) {
  ChatMessage m;
  m.role = "assistant";
  m.ui_surface_id = std::move(surface_id);
  m.ui_definition = std::move(definition);
  return m;
}

nlohmann::json ChatMessage::ToJson() const {
  nlohmann::json j;
  j["role"] = role;
  j["content"] = content;
  if (ui_interaction) j["uiInteraction"] = true;
  if (IsUiSurface()) j["uiSurface"] = {{"surfaceId", ui_surface_id}, {"definition", ui_definition}};
  if (!tool_calls.empty()) {
    j["toolCalls"] = nlohmann::json::array();
    for (const auto& c : tool_calls) {
      j["toolCalls"].push_back({{"id", c.id}, {"name", c.name}, {"arguments", c.arguments_json}});
    }
  }
  if (!tool_results.empty()) {
    j["toolResults"] = nlohmann::json::array();
    for (const auto& r : tool_results) {
      j["toolResults"].push_back(
          {{"toolCallId", r.tool_call_id}, {"name", r.name}, {"ok", r.ok}, {"result", r.result}});
    }
  }
  return j;
}

}  // namespace genui
