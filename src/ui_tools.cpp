#include "ui_tools.hpp"

#include "a2ui_message.hpp"

#include <utility>

namespace genui {
namespace {

static ToolResult Ok(const std::string& tool_call_id, const std::string& name, nlohmann::json result) {
  ToolResult r;
  r.tool_call_id = tool_call_id;
  r.name = name;
  r.ok = true;
  r.result = std::move(result);
  return r;
}

static ToolResult Fail(const std::string& tool_call_id, const std::string& name, const std::string& error) {
  ToolResult r;
  r.tool_call_id = tool_call_id;
  r.name = name;
  r.ok = false;
  r.error = error;
  r.result = {{"ok", false}, {"error", error}};
  return r;
}

static nlohmann::json SurfaceIdProperty(const char* description) {
  return {{"type", "string"}, {"description", description}};
}

static nlohmann::json SurfaceUpdateParameters() {
  nlohmann::json component = {
      {"type", "object"},
      {"properties",
       {{"id", {{"type", "string"}, {"description", "Unique id of the component within the surface."}}},
        {"component",
         {{"type", "object"},
          {"description", "Exactly one key naming the component kind, mapped to its properties."}}}}},
      {"required", {"id", "component"}}};
  return {{"type", "object"},
          {"properties",
           {{"surfaceId", SurfaceIdProperty("The unique identifier for the UI surface to create or update.")},
            {"components", {{"type", "array"}, {"items", component}}}}},
          {"required", {"surfaceId", "components"}}};
}

static nlohmann::json BeginRenderingParameters() {
  return {{"type", "object"},
          {"properties",
           {{"surfaceId", SurfaceIdProperty("The unique identifier for the UI surface to render.")},
            {"root",
             {{"type", "string"},
              {"description",
               "The ID of the root widget. This ID must correspond to the ID of one of the components."}}}}},
          {"required", {"surfaceId", "root"}}};
}

static nlohmann::json DeleteSurfaceParameters() {
  return {{"type", "object"},
          {"properties", {{"surfaceId", SurfaceIdProperty("The unique identifier for the UI surface to remove.")}}},
          {"required", {"surfaceId"}}};
}

static nlohmann::json DataModelUpdateParameters() {
  return {{"type", "object"},
          {"properties",
           {{"surfaceId", SurfaceIdProperty("The surface whose data model is updated.")},
            {"path", {{"type", "string"}, {"description", "Target path such as /user/name. Defaults to the root."}}},
            {"contents", {{"description", "Value written at path."}}}}},
          {"required", {"surfaceId", "contents"}}};
}

// Rejects creating or updating a surface when the actions config forbids it.
static bool CheckStructuralAction(const SurfaceRegistry& surfaces, const ActionsConfig& actions,
                                  const std::string& surface_id, std::string* err) {
  const bool exists = surfaces.Contains(surface_id);
  if (!exists && !actions.allow_create) {
    *err = "creating surfaces is not allowed";
    return false;
  }
  if (exists && !actions.allow_update) {
    *err = "updating surfaces is not allowed";
    return false;
  }
  return true;
}

}  // namespace

void RegisterSurfaceTools(ToolRegistry* tools, SurfaceRegistry* surfaces, const ActionsConfig& actions,
                          std::mutex* surface_mu) {
  if (!tools || !surfaces || !surface_mu) return;

  // Decodes `arguments` as the body of a `kind` message and dispatches it.
  auto dispatch = [surfaces, surface_mu, actions](const char* kind, bool structural, const std::string& id,
                                                  const std::string& name, const nlohmann::json& arguments,
                                                  nlohmann::json ok_result) -> ToolResult {
    std::string err;
    nlohmann::json wire = nlohmann::json::object();
    wire[kind] = arguments;
    auto message = ParseMessage(wire, &err);
    if (!message) return Fail(id, name, err);

    std::lock_guard<std::mutex> lock(*surface_mu);
    if (structural && !CheckStructuralAction(*surfaces, actions, MessageSurfaceId(*message), &err)) {
      return Fail(id, name, err);
    }
    if (!surfaces->Dispatch(*message, &err)) return Fail(id, name, err);
    return Ok(id, name, std::move(ok_result));
  };

  if (actions.allow_create || actions.allow_update) {
    tools->RegisterTool({"surfaceUpdate", "Updates a surface with a new set of components.", SurfaceUpdateParameters()},
                        [dispatch](const std::string& id, const nlohmann::json& args) {
                          const auto surface_id = args.value("surfaceId", std::string());
                          return dispatch("surfaceUpdate", true, id, "surfaceUpdate", args,
                                          {{"surfaceId", surface_id}, {"status", "SUCCESS"}});
                        });
    tools->RegisterTool(
        {"beginRendering", "Signals the client to begin rendering a surface with a root component.",
         BeginRenderingParameters()},
        [dispatch](const std::string& id, const nlohmann::json& args) {
          return dispatch("beginRendering", true, id, "beginRendering", args, {{"status", "ok"}});
        });
  }

  if (actions.allow_delete) {
    tools->RegisterTool({"deleteSurface", "Removes a UI surface that is no longer needed.", DeleteSurfaceParameters()},
                        [dispatch](const std::string& id, const nlohmann::json& args) {
                          return dispatch("surfaceDeletion", false, id, "deleteSurface", args, {{"status", "ok"}});
                        });
  }

  tools->RegisterTool({"dataModelUpdate", "Updates the data model of a surface.", DataModelUpdateParameters()},
                      [dispatch](const std::string& id, const nlohmann::json& args) {
                        return dispatch("dataModelUpdate", false, id, "dataModelUpdate", args, {{"status", "ok"}});
                      });
}

std::string BuildUiTechPrompt(const std::vector<std::string>& tool_names) {
  if (tool_names.empty()) return {};
  std::string tools;
  if (tool_names.size() > 1) {
    tools = "the following UI generation tools: ";
    for (size_t i = 0; i < tool_names.size(); i++) {
      if (i > 0) tools += ", ";
      tools += "\"" + tool_names[i] + "\"";
    }
  } else {
    tools = "the UI generation tool \"" + tool_names.front() + "\"";
  }

  std::string prompt;
  prompt += "To show generated UI, use " + tools + ".\n";
  prompt += "When generating UI, always provide a unique surfaceId to identify the UI surface:\n\n";
  prompt += "* To create new UI, use a new surfaceId.\n";
  prompt += "* To update existing UI, use the existing surfaceId.\n\n";
  prompt += "Use the root component id: 'root'.\n";
  prompt += "Ensure one of the generated components has an id of 'root'.\n";
  return prompt;
}

}  // namespace genui
