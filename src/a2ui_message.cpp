#include "a2ui_message.hpp"

#include <type_traits>
#include <utility>

namespace genui {
namespace {

static bool Fail(std::string* err, const std::string& message) {
  if (err) *err = "invalid message: " + message;
  return false;
}

static bool RequireString(const nlohmann::json& body, const char* key, const char* kind, std::string* out, std::string* err) {
  if (!body.contains(key) || !body[key].is_string() || body[key].get_ref<const std::string&>().empty()) {
    return Fail(err, std::string(kind) + " requires a non-empty '" + key + "'");
  }
  *out = body[key].get<std::string>();
  return true;
}

static std::optional<A2uiMessage> ParseSurfaceUpdate(const nlohmann::json& body, std::string* err) {
  SurfaceUpdate m;
  if (!RequireString(body, "surfaceId", "surfaceUpdate", &m.surface_id, err)) return std::nullopt;
  if (!body.contains("components") || !body["components"].is_array()) {
    Fail(err, "surfaceUpdate requires a 'components' array");
    return std::nullopt;
  }
  for (const auto& item : body["components"]) {
    std::string cerr;
    auto c = Component::FromJson(item, &cerr);
    if (!c) {
      Fail(err, cerr);
      return std::nullopt;
    }
    m.components.push_back(std::move(*c));
  }
  return A2uiMessage(std::move(m));
}

static std::optional<A2uiMessage> ParseBeginRendering(const nlohmann::json& body, std::string* err) {
  BeginRendering m;
  if (!RequireString(body, "surfaceId", "beginRendering", &m.surface_id, err)) return std::nullopt;
  if (!RequireString(body, "root", "beginRendering", &m.root, err)) return std::nullopt;
  return A2uiMessage(std::move(m));
}

static std::optional<A2uiMessage> ParseDataModelUpdate(const nlohmann::json& body, std::string* err) {
  DataModelUpdate m;
  if (!RequireString(body, "surfaceId", "dataModelUpdate", &m.surface_id, err)) return std::nullopt;
  if (body.contains("path") && !body["path"].is_null()) {
    if (!body["path"].is_string()) {
      Fail(err, "dataModelUpdate 'path' must be a string");
      return std::nullopt;
    }
    m.path = body["path"].get<std::string>();
  }
  if (!body.contains("contents")) {
    Fail(err, "dataModelUpdate requires 'contents'");
    return std::nullopt;
  }
  m.contents = body["contents"];
  return A2uiMessage(std::move(m));
}

static std::optional<A2uiMessage> ParseSurfaceDeletion(const nlohmann::json& body, std::string* err) {
  SurfaceDeletion m;
  if (!RequireString(body, "surfaceId", "surfaceDeletion", &m.surface_id, err)) return std::nullopt;
  return A2uiMessage(std::move(m));
}

}  // namespace

const std::string& MessageSurfaceId(const A2uiMessage& message) {
  return std::visit([](const auto& m) -> const std::string& { return m.surface_id; }, message);
}

const char* MessageKind(const A2uiMessage& message) {
  return std::visit(
      [](const auto& m) -> const char* {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SurfaceUpdate>) return "surfaceUpdate";
        if constexpr (std::is_same_v<T, BeginRendering>) return "beginRendering";
        if constexpr (std::is_same_v<T, DataModelUpdate>) return "dataModelUpdate";
        return "surfaceDeletion";
      },
      message);
}

std::optional<A2uiMessage> ParseMessage(const nlohmann::json& j, std::string* err) {
  if (!j.is_object() || j.size() != 1) {
    Fail(err, "expected an object with exactly one message kind");
    return std::nullopt;
  }
  const auto& kind = j.begin().key();
  const auto& body = j.begin().value();
  if (!body.is_object()) {
    Fail(err, kind + " body must be an object");
    return std::nullopt;
  }
  if (kind == "surfaceUpdate") return ParseSurfaceUpdate(body, err);
  if (kind == "beginRendering") return ParseBeginRendering(body, err);
  if (kind == "dataModelUpdate") return ParseDataModelUpdate(body, err);
  if (kind == "surfaceDeletion" || kind == "deleteSurface") return ParseSurfaceDeletion(body, err);
  Fail(err, "unknown message kind '" + kind + "'");
  return std::nullopt;
}

nlohmann::json ToJson(const A2uiMessage& message) {
  nlohmann::json body = std::visit(
      [](const auto& m) -> nlohmann::json {
        using T = std::decay_t<decltype(m)>;
        nlohmann::json b;
        b["surfaceId"] = m.surface_id;
        if constexpr (std::is_same_v<T, SurfaceUpdate>) {
          b["components"] = nlohmann::json::array();
          for (const auto& c : m.components) b["components"].push_back(c.ToJson());
        } else if constexpr (std::is_same_v<T, BeginRendering>) {
          b["root"] = m.root;
        } else if constexpr (std::is_same_v<T, DataModelUpdate>) {
          if (m.path) b["path"] = *m.path;
          b["contents"] = m.contents;
        }
        return b;
      },
      message);
  return {{MessageKind(message), std::move(body)}};
}

}  // namespace genui
