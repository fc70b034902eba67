#include "conversation.hpp"

#include "log.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace genui {

Conversation::Conversation(SurfaceRegistry* surfaces, LocalAgent* agent) : surfaces_(surfaces), agent_(agent) {
  if (!surfaces_) return;
  user_messages_sub_ = surfaces_->UserMessages().Subscribe([this](const ChatMessage& m) { SendRequest(m); });
  surface_updates_sub_ =
      surfaces_->SurfaceUpdates().Subscribe([this](const SurfaceLifecycleEvent& e) { OnSurfaceChange(e); });
}

Conversation::~Conversation() {
  user_messages_sub_.Cancel();
  surface_updates_sub_.Cancel();
  std::map<std::string, Subscription> watches;
  {
    std::lock_guard<std::mutex> lock(mu_);
    watches.swap(definition_watches_);
  }
  watches.clear();
  text_responses_.Close();
  errors_.Close();
}

void Conversation::OnSurfaceChange(const SurfaceLifecycleEvent& event) {
  if (event.change == SurfaceChange::kAdded) {
    if (!event.surface) return;
    if (auto definition = event.surface->Definition()) RecordDefinition(event.surface_id, *definition);
    const auto surface_id = event.surface_id;
    auto watch = event.surface->WatchDefinition([this, surface_id](const std::shared_ptr<const UiDefinition>& d) {
      if (d) RecordDefinition(surface_id, *d);
    });
    if (!watch) return;
    std::lock_guard<std::mutex> lock(mu_);
    definition_watches_[surface_id] = std::move(*watch);
    return;
  }

  Subscription watch;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = definition_watches_.find(event.surface_id);
    if (it != definition_watches_.end()) {
      watch = std::move(it->second);
      definition_watches_.erase(it);
    }
    shown_surfaces_.erase(std::remove(shown_surfaces_.begin(), shown_surfaces_.end(), event.surface_id),
                          shown_surfaces_.end());
    history_.erase(std::remove_if(history_.begin(), history_.end(),
                                  [&](const ChatMessage& m) { return m.ui_surface_id == event.surface_id; }),
                   history_.end());
  }
  watch.Cancel();
}

// Keeps one history entry per surface holding its latest definition.
void Conversation::RecordDefinition(const std::string& surface_id, const UiDefinition& definition) {
  auto message = ChatMessage::UiSurface(surface_id, definition.ToJson());
  std::lock_guard<std::mutex> lock(mu_);
  if (std::find(shown_surfaces_.begin(), shown_surfaces_.end(), surface_id) == shown_surfaces_.end()) {
    shown_surfaces_.push_back(surface_id);
  }
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->ui_surface_id == surface_id) {
      *it = std::move(message);
      return;
    }
  }
  history_.push_back(std::move(message));
}

AgentRunResult Conversation::SendRequest(const ChatMessage& message) {
  std::lock_guard<std::mutex> run_lock(run_mu_);
  processing_.store(true);

  std::vector<ChatMessage> transcript;
  {
    std::lock_guard<std::mutex> lock(mu_);
    transcript = history_;
    // UI interactions reach the model but are not shown as user turns.
    if (!message.ui_interaction) history_.push_back(message);
  }
  transcript.push_back(message);

  AgentRunResult result;
  if (!agent_) {
    result.ok = false;
    result.error = "conversation has no agent";
  } else {
    result = agent_->Execute(transcript);
  }

  if (result.ok) {
    if (result.text) {
      {
        std::lock_guard<std::mutex> lock(mu_);
        history_.push_back(ChatMessage::Assistant(*result.text));
      }
      text_responses_.Emit(*result.text);
    }
  } else {
    if (LogEnabled()) std::cout << "[provider-error] conversation error=" << result.error << "\n";
    {
      std::lock_guard<std::mutex> lock(mu_);
      history_.push_back(ChatMessage::Assistant("An error occurred: " + result.error));
    }
    errors_.Emit(result.error);
  }

  processing_.store(false);
  return result;
}

std::vector<ChatMessage> Conversation::History() const {
  std::lock_guard<std::mutex> lock(mu_);
  return history_;
}

std::vector<std::string> Conversation::ShownSurfaceIds() const {
  std::lock_guard<std::mutex> lock(mu_);
  return shown_surfaces_;
}

}  // namespace genui
