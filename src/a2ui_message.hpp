#pragma once

#include "ui_models.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace genui {

struct SurfaceUpdate {
  std::string surface_id;
  std::vector<Component> components;
};

struct BeginRendering {
  std::string surface_id;
  std::string root;
};

struct DataModelUpdate {
  std::string surface_id;
  std::optional<std::string> path;
  nlohmann::json contents;
};

struct SurfaceDeletion {
  std::string surface_id;
};

using A2uiMessage = std::variant<SurfaceUpdate, BeginRendering, DataModelUpdate, SurfaceDeletion>;

const std::string& MessageSurfaceId(const A2uiMessage& message);
const char* MessageKind(const A2uiMessage& message);

// Decodes one wire message, `{"surfaceUpdate": {...}}` and friends.
// Returns std::nullopt with `err` set to "invalid message: ..." when the
// envelope or a required field is malformed.
std::optional<A2uiMessage> ParseMessage(const nlohmann::json& j, std::string* err);

nlohmann::json ToJson(const A2uiMessage& message);

}  // namespace genui
