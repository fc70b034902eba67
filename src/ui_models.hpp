#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace genui {

// One node of a surface's UI tree. `component` is the kind-tagged property
// bundle, e.g. {"Text": {"text": {"path": "/title"}}}.
struct Component {
  std::string id;
  nlohmann::json component = nlohmann::json::object();

  // First key of the property bundle, or "" when it is not a tagged object.
  std::string Kind() const;

  nlohmann::json ToJson() const;
  static std::optional<Component> FromJson(const nlohmann::json& j, std::string* err);
};

struct UiDefinition {
  std::string surface_id;
  std::map<std::string, Component> components;
  std::optional<std::string> root_component_id;

  const Component* FindComponent(const std::string& id) const;
  nlohmann::json ToJson() const;
};

struct UiEvent {
  std::string surface_id;
  std::string name;
  std::string source_component_id;
  std::string timestamp;
  bool is_action = false;
  nlohmann::json context = nlohmann::json::object();

  nlohmann::json ToJson() const;
  // Missing timestamp defaults to now. `isAction` defaults to true.
  static std::optional<UiEvent> FromJson(const nlohmann::json& j, std::string* err);
};

// ISO-8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.000Z.
std::string NowIso8601();

std::string NewId(const std::string& prefix);

}  // namespace genui
