#include "local_agent.hpp"

#include "log.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <utility>

namespace genui {
namespace {

static void LogToolCall(const ToolCall& c) {
  if (!LogEnabled()) return;
  std::cout << "[tool-call] id=" << c.id << " name=" << c.name
            << " arguments=" << TruncateForLog(c.arguments_json, 2000) << "\n";
}

static void LogToolResult(const ToolResult& r) {
  if (!LogEnabled()) return;
  std::cout << "[tool-result] id=" << r.tool_call_id << " name=" << r.name << " ok=" << (r.ok ? 1 : 0)
            << " error=" << (r.error.empty() ? "-" : r.error) << " result=" << JsonForLog(r.result) << "\n";
}

}  // namespace

LocalAgent::LocalAgent(IModelAdapter* adapter, const ToolRegistry* tools, AgentOptions options)
    : adapter_(adapter), tools_(tools), options_(std::move(options)) {}

std::vector<ToolResult> LocalAgent::RunToolCalls(const std::vector<ToolCall>& calls) const {
  std::vector<std::future<ToolResult>> pending;
  pending.reserve(calls.size());
  for (const auto& c : calls) {
    LogToolCall(c);
    pending.push_back(std::async(std::launch::async, [this, c]() { return ExecuteToolCall(*tools_, c); }));
  }
  std::vector<ToolResult> results;
  results.reserve(calls.size());
  for (auto& f : pending) {
    results.push_back(f.get());
    LogToolResult(results.back());
  }
  return results;
}

AgentRunResult LocalAgent::Execute(const std::vector<ChatMessage>& messages) {
  AgentRunResult out;
  if (!adapter_ || !tools_) {
    out.ok = false;
    out.error = "agent is missing its model adapter or tool registry";
    return out;
  }

  std::vector<ChatMessage> history;
  history.reserve(messages.size() + 8);
  if (!options_.system_prompt.empty() && (messages.empty() || messages.front().role != "system")) {
    history.push_back(ChatMessage::System(options_.system_prompt));
  }
  history.insert(history.end(), messages.begin(), messages.end());

  while (true) {
    if (options_.max_iterations > 0 && out.iterations >= options_.max_iterations) {
      out.ok = false;
      out.hit_iteration_limit = true;
      out.error = "tool loop exceeded max iterations (" + std::to_string(options_.max_iterations) + ")";
      return out;
    }
    out.iterations++;

    std::string err;
    std::optional<ModelTurnResult> turn;
    try {
      auto response = adapter_->GenerateContent(adapter_->ConvertMessages(history),
                                                adapter_->AdaptTools(tools_->ListSchemas()), &err);
      if (response) turn = adapter_->ProcessResponse(*response);
    } catch (const std::exception& e) {
      err = adapter_->Name() + ": " + e.what();
    }
    if (!turn) {
      out.ok = false;
      out.error = err.empty() ? adapter_->Name() + ": request failed" : err;
      if (LogEnabled()) std::cout << "[provider-error] adapter=" << adapter_->Name() << " error=" << out.error << "\n";
      return out;
    }
    if (turn->tool_calls.empty()) {
      out.text = std::move(turn->text);
      return out;
    }

    auto assistant = ChatMessage::Assistant(turn->text.value_or(""), turn->tool_calls);
    auto results = RunToolCalls(turn->tool_calls);
    auto tool_message = ChatMessage::Tool(std::move(results));
    history.push_back(assistant);
    history.push_back(tool_message);
    out.new_messages.push_back(std::move(assistant));
    out.new_messages.push_back(std::move(tool_message));
  }
}

}  // namespace genui
