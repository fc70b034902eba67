#pragma once

#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace genui {

// role is one of "system", "user", "assistant", "tool".
struct ChatMessage {
  std::string role;
  std::string content;
  std::vector<ToolCall> tool_calls;
  std::vector<ToolResult> tool_results;
  // Set on user messages produced from a surface interaction.
  bool ui_interaction = false;
  // Set on assistant messages that stand for a surface the model built;
  // `ui_definition` is the surface's current definition.
  std::string ui_surface_id;
  nlohmann::json ui_definition;

  static ChatMessage System(std::string text);
  static ChatMessage User(std::string text);
  static ChatMessage UiInteraction(std::string text);
  static ChatMessage Assistant(std::string text, std::vector<ToolCall> calls = {});
  static ChatMessage Tool(std::vector<ToolResult> results);
  static ChatMessage UiSurface(std::string surface_id, nlohmann::json definition);

  bool IsUiSurface() const { return !ui_surface_id.empty(); }

  nlohmann::json ToJson() const;
};

}  // namespace genui
