#pragma once

#include "chat_message.hpp"
#include "local_agent.hpp"
#include "reactive.hpp"
#include "surface_registry.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace genui {

// History holds user and assistant turns plus one entry per live surface
// with its latest definition. The registry and agent must outlive this.
class Conversation {
 public:
  Conversation(SurfaceRegistry* surfaces, LocalAgent* agent);
  ~Conversation();

  Conversation(const Conversation&) = delete;
  Conversation& operator=(const Conversation&) = delete;

  AgentRunResult SendRequest(const ChatMessage& message);

  std::vector<ChatMessage> History() const;
  // Surfaces with a definition that have not been deleted, in order of appearance.
  std::vector<std::string> ShownSurfaceIds() const;
  bool IsProcessing() const { return processing_.load(); }

  Broadcast<std::string>& TextResponses() { return text_responses_; }
  Broadcast<std::string>& Errors() { return errors_; }

 private:
  void OnSurfaceChange(const SurfaceLifecycleEvent& event);
  void RecordDefinition(const std::string& surface_id, const UiDefinition& definition);

  SurfaceRegistry* surfaces_;
  LocalAgent* agent_;

  mutable std::mutex mu_;
  std::vector<ChatMessage> history_;
  std::vector<std::string> shown_surfaces_;
  std::map<std::string, Subscription> definition_watches_;

  std::mutex run_mu_;
  std::atomic<bool> processing_{false};

  Broadcast<std::string> text_responses_;
  Broadcast<std::string> errors_;
  Subscription user_messages_sub_;
  Subscription surface_updates_sub_;
};

}  // namespace genui
