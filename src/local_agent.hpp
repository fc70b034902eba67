#pragma once

#include "chat_message.hpp"
#include "providers/model_adapter.hpp"
#include "tooling.hpp"

#include <optional>
#include <string>
#include <vector>

namespace genui {

struct AgentOptions {
  // Model round trips allowed per run; 0 means unbounded.
  int max_iterations = 0;
  // Prepended as a system message when the history does not start with one.
  std::string system_prompt;
};

struct AgentRunResult {
  bool ok = true;
  std::optional<std::string> text;
  std::string error;
  // Assistant and tool messages produced during the run, in order.
  std::vector<ChatMessage> new_messages;
  int iterations = 0;
  bool hit_iteration_limit = false;
};

// Tool calls of one round run concurrently; results keep call order.
class LocalAgent {
 public:
  LocalAgent(IModelAdapter* adapter, const ToolRegistry* tools, AgentOptions options = {});

  AgentRunResult Execute(const std::vector<ChatMessage>& messages);

  const AgentOptions& Options() const { return options_; }

 private:
  std::vector<ToolResult> RunToolCalls(const std::vector<ToolCall>& calls) const;

  IModelAdapter* adapter_;
  const ToolRegistry* tools_;
  AgentOptions options_;
};

}  // namespace genui
