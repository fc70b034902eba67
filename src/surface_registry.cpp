#include "surface_registry.hpp"

#include "log.hpp"

#include <iostream>
#include <utility>

namespace genui {

SurfaceRegistry::~SurfaceRegistry() {
  Dispose();
}

std::shared_ptr<Surface> SurfaceRegistry::GetOrCreate(const std::string& surface_id, std::string* err) {
  std::shared_ptr<Surface> created;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (disposed_) {
      if (err) *err = "registry disposed";
      return nullptr;
    }
    auto it = surfaces_.find(surface_id);
    if (it != surfaces_.end()) return it->second;
    created = std::make_shared<Surface>(surface_id, [this](const UiEvent& e) { HandleInteraction(e); });
    surfaces_[surface_id] = created;
  }
  if (LogEnabled()) std::cout << "[surface] created surface_id=" << surface_id << "\n";
  surface_updates_.Emit({SurfaceChange::kAdded, surface_id, created});
  return created;
}

bool SurfaceRegistry::Dispatch(const A2uiMessage& message, std::string* err) {
  if (Disposed()) {
    if (err) *err = "registry disposed";
    return false;
  }
  if (const auto* deletion = std::get_if<SurfaceDeletion>(&message)) {
    Remove(deletion->surface_id);
    return true;
  }
  auto surface = GetOrCreate(MessageSurfaceId(message), err);
  if (!surface) return false;
  return surface->Apply(message, err);
}

bool SurfaceRegistry::Remove(const std::string& surface_id) {
  std::shared_ptr<Surface> removed;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = surfaces_.find(surface_id);
    if (it == surfaces_.end()) return false;
    removed = std::move(it->second);
    surfaces_.erase(it);
  }
  if (LogEnabled()) std::cout << "[surface] deleted surface_id=" << surface_id << "\n";
  surface_updates_.Emit({SurfaceChange::kRemoved, surface_id, removed});
  removed->Dispose();
  return true;
}

bool SurfaceRegistry::HandleInteraction(const UiEvent& event, std::string* err) {
  if (Disposed()) {
    if (err) *err = "registry disposed";
    return false;
  }
  if (!event.is_action) return false;

  nlohmann::json action = event.ToJson();
  action["isAction"] = true;
  nlohmann::json payload = {{"userAction", std::move(action)}};
  if (LogEnabled()) {
    std::cout << "[surface] user-action surface_id=" << event.surface_id << " name=" << event.name
              << " source=" << event.source_component_id << "\n";
  }
  return user_messages_.Emit(ChatMessage::UiInteraction(payload.dump()));
}

std::shared_ptr<Surface> SurfaceRegistry::Find(const std::string& surface_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = surfaces_.find(surface_id);
  if (it == surfaces_.end()) return nullptr;
  return it->second;
}

std::vector<std::string> SurfaceRegistry::SurfaceIds() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(surfaces_.size());
  for (const auto& kv : surfaces_) out.push_back(kv.first);
  return out;
}

bool SurfaceRegistry::Contains(const std::string& surface_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return surfaces_.find(surface_id) != surfaces_.end();
}

void SurfaceRegistry::Dispose() {
  std::map<std::string, std::shared_ptr<Surface>> surfaces;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (disposed_) return;
    disposed_ = true;
    surfaces.swap(surfaces_);
  }
  surface_updates_.Close();
  user_messages_.Close();
  for (auto& kv : surfaces) kv.second->Dispose();
}

bool SurfaceRegistry::Disposed() const {
  std::lock_guard<std::mutex> lock(mu_);
  return disposed_;
}

}  // namespace genui
