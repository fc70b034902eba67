#pragma once

#include "a2ui_message.hpp"
#include "chat_message.hpp"
#include "reactive.hpp"
#include "surface.hpp"
#include "ui_models.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace genui {

enum class SurfaceChange {
  kAdded,
  kRemoved,
};

struct SurfaceLifecycleEvent {
  SurfaceChange change = SurfaceChange::kAdded;
  std::string surface_id;
  std::shared_ptr<Surface> surface;
};

// The id map is guarded internally. Mutating one surface from several
// threads needs an outer lock.
class SurfaceRegistry {
 public:
  SurfaceRegistry() = default;
  ~SurfaceRegistry();

  SurfaceRegistry(const SurfaceRegistry&) = delete;
  SurfaceRegistry& operator=(const SurfaceRegistry&) = delete;

  // Returns null with `err` set after Dispose().
  std::shared_ptr<Surface> GetOrCreate(const std::string& surface_id, std::string* err = nullptr);

  bool Dispatch(const A2uiMessage& message, std::string* err = nullptr);

  // Turns a user action into a `{"userAction": {...}}` user message.
  // Returns true when a message was published; non-action events are
  // ignored and return false without an error.
  bool HandleInteraction(const UiEvent& event, std::string* err = nullptr);

  std::shared_ptr<Surface> Find(const std::string& surface_id) const;
  std::vector<std::string> SurfaceIds() const;
  bool Contains(const std::string& surface_id) const;

  Broadcast<SurfaceLifecycleEvent>& SurfaceUpdates() { return surface_updates_; }
  Broadcast<ChatMessage>& UserMessages() { return user_messages_; }

  void Dispose();
  bool Disposed() const;

 private:
  bool Remove(const std::string& surface_id);

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<Surface>> surfaces_;
  bool disposed_ = false;
  Broadcast<SurfaceLifecycleEvent> surface_updates_;
  Broadcast<ChatMessage> user_messages_;
};

}  // namespace genui
