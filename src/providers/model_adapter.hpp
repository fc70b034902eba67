#pragma once

#include "chat_message.hpp"
#include "tooling.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace genui {

struct ModelTurnResult {
  std::vector<ToolCall> tool_calls;
  std::optional<std::string> text;
};

// Bridges the tool-call loop to one model backend. Backend-specific tool,
// content and response shapes travel as JSON.
class IModelAdapter {
 public:
  virtual ~IModelAdapter() = default;

  virtual std::string Name() const = 0;
  virtual nlohmann::json AdaptTools(const std::vector<ToolSchema>& tools) const = 0;
  virtual nlohmann::json ConvertMessages(const std::vector<ChatMessage>& messages) const = 0;
  virtual std::optional<nlohmann::json> GenerateContent(const nlohmann::json& content,
                                                        const nlohmann::json& tools,
                                                        std::string* err) = 0;
  virtual ModelTurnResult ProcessResponse(const nlohmann::json& response) const = 0;
};

}  // namespace genui
