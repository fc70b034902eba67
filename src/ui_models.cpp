#include "ui_models.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace genui {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static std::string StringField(const nlohmann::json& j, const char* key) {
  if (!j.contains(key) || !j[key].is_string()) return {};
  return j[key].get<std::string>();
}

}  // namespace

std::string Component::Kind() const {
  if (!component.is_object() || component.empty()) return {};
  return component.begin().key();
}

nlohmann::json Component::ToJson() const {
  return {{"id", id}, {"component", component}};
}

std::optional<Component> Component::FromJson(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "component must be an object";
    return std::nullopt;
  }
  Component c;
  c.id = StringField(j, "id");
  if (c.id.empty()) {
    if (err) *err = "component is missing 'id'";
    return std::nullopt;
  }
  if (!j.contains("component") || !j["component"].is_object()) {
    if (err) *err = "component '" + c.id + "' is missing its 'component' object";
    return std::nullopt;
  }
  c.component = j["component"];
  return c;
}

const Component* UiDefinition::FindComponent(const std::string& id) const {
  auto it = components.find(id);
  if (it == components.end()) return nullptr;
  return &it->second;
}

nlohmann::json UiDefinition::ToJson() const {
  nlohmann::json out;
  out["surfaceId"] = surface_id;
  out["components"] = nlohmann::json::array();
  for (const auto& [_, c] : components) out["components"].push_back(c.ToJson());
  out["root"] = root_component_id ? nlohmann::json(*root_component_id) : nlohmann::json(nullptr);
  return out;
}

nlohmann::json UiEvent::ToJson() const {
  return {{"surfaceId", surface_id},
          {"name", name},
          {"sourceComponentId", source_component_id},
          {"timestamp", timestamp},
          {"isAction", is_action},
          {"context", context}};
}

std::optional<UiEvent> UiEvent::FromJson(const nlohmann::json& j, std::string* err) {
  if (!j.is_object()) {
    if (err) *err = "event must be an object";
    return std::nullopt;
  }
  UiEvent e;
  e.surface_id = StringField(j, "surfaceId");
  e.name = StringField(j, "name");
  e.source_component_id = StringField(j, "sourceComponentId");
  if (e.surface_id.empty() || e.name.empty()) {
    if (err) *err = "event requires 'surfaceId' and 'name'";
    return std::nullopt;
  }
  e.timestamp = StringField(j, "timestamp");
  if (e.timestamp.empty()) e.timestamp = NowIso8601();
  e.is_action = true;
  if (j.contains("isAction") && j["isAction"].is_boolean()) e.is_action = j["isAction"].get<bool>();
  if (j.contains("context") && j["context"].is_object()) e.context = j["context"];
  return e;
}

std::string NowIso8601() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
  return oss.str();
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

}  // namespace genui
