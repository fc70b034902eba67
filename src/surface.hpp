#pragma once

#include "a2ui_message.hpp"
#include "data_model.hpp"
#include "reactive.hpp"
#include "ui_models.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace genui {

// One surface's UI definition and data model. Published definitions are
// immutable snapshots.
class Surface {
 public:
  using UiEventHandler = std::function<void(const UiEvent& event)>;
  using DefinitionListener = std::function<void(const std::shared_ptr<const UiDefinition>& definition)>;

  Surface(std::string surface_id, UiEventHandler on_ui_event);
  ~Surface();

  Surface(const Surface&) = delete;
  Surface& operator=(const Surface&) = delete;

  const std::string& Id() const { return surface_id_; }

  bool Apply(const A2uiMessage& message, std::string* err = nullptr);

  // Null until the first surfaceUpdate or beginRendering.
  std::shared_ptr<const UiDefinition> Definition() const { return definition_; }

  // std::nullopt with `err` set after Dispose().
  std::optional<Subscription> WatchDefinition(DefinitionListener listener, std::string* err = nullptr);

  DataModel& Model() { return data_model_; }
  const DataModel& Model() const { return data_model_; }

  // Forwards an interaction to the owner. Dropped after Dispose().
  void DispatchUiEvent(const UiEvent& event);

  void Dispose();
  bool Disposed() const { return disposed_; }

 private:
  void Publish(std::shared_ptr<const UiDefinition> next);

  std::string surface_id_;
  UiEventHandler on_ui_event_;
  std::shared_ptr<const UiDefinition> definition_;
  Broadcast<std::shared_ptr<const UiDefinition>> definition_changes_;
  DataModel data_model_;
  bool disposed_ = false;
};

}  // namespace genui
