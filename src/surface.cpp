#include "surface.hpp"

#include "log.hpp"

#include <iostream>
#include <type_traits>
#include <utility>

namespace genui {

Surface::Surface(std::string surface_id, UiEventHandler on_ui_event)
    : surface_id_(std::move(surface_id)), on_ui_event_(std::move(on_ui_event)) {}

Surface::~Surface() {
  Dispose();
}

bool Surface::Apply(const A2uiMessage& message, std::string* err) {
  if (disposed_) {
    if (err) *err = "surface disposed: " + surface_id_;
    return false;
  }
  const auto& target = MessageSurfaceId(message);
  if (target != surface_id_) {
    if (err) *err = "routing mismatch: expected " + surface_id_ + ", got " + target;
    return false;
  }
  // Removal is the registry's job.
  if (std::holds_alternative<SurfaceDeletion>(message)) return true;

  auto current = [this]() {
    if (definition_) return *definition_;
    UiDefinition d;
    d.surface_id = surface_id_;
    return d;
  };

  return std::visit(
      [&](const auto& m) -> bool {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SurfaceUpdate>) {
          UiDefinition next = current();
          for (const auto& c : m.components) next.components[c.id] = c;
          Publish(std::make_shared<const UiDefinition>(std::move(next)));
          return true;
        } else if constexpr (std::is_same_v<T, BeginRendering>) {
          UiDefinition next = current();
          next.root_component_id = m.root;
          Publish(std::make_shared<const UiDefinition>(std::move(next)));
          return true;
        } else if constexpr (std::is_same_v<T, DataModelUpdate>) {
          const std::string path = m.path ? *m.path : "/";
          if (LogEnabled()) {
            std::cout << "[surface] data-model-update surface_id=" << surface_id_ << " path=" << path << "\n";
          }
          return data_model_.Update(DataPath(path), m.contents, err);
        } else {
          return true;
        }
      },
      message);
}

std::optional<Subscription> Surface::WatchDefinition(DefinitionListener listener, std::string* err) {
  if (disposed_) {
    if (err) *err = "surface disposed: " + surface_id_;
    return std::nullopt;
  }
  return definition_changes_.Subscribe(std::move(listener));
}

void Surface::DispatchUiEvent(const UiEvent& event) {
  if (disposed_ || !on_ui_event_) return;
  on_ui_event_(event);
}

void Surface::Dispose() {
  if (disposed_) return;
  disposed_ = true;
  data_model_.Dispose();
  definition_changes_.Close();
}

void Surface::Publish(std::shared_ptr<const UiDefinition> next) {
  definition_ = next;
  definition_changes_.Emit(next);
}

}  // namespace genui
