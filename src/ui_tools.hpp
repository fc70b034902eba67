#pragma once

#include "config.hpp"
#include "surface_registry.hpp"
#include "tooling.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace genui {

// Registers the tools a model uses to drive surfaces: surfaceUpdate
// and beginRendering (when creating or updating is allowed), deleteSurface
// (when deleting is allowed) and dataModelUpdate.
// Handlers may run concurrently; each takes `surface_mu` for the whole
// registry mutation. Both pointers must outlive `tools`.
void RegisterSurfaceTools(ToolRegistry* tools, SurfaceRegistry* surfaces, const ActionsConfig& actions,
                          std::mutex* surface_mu);

// System-prompt fragment that tells the model how to use the UI tools.
std::string BuildUiTechPrompt(const std::vector<std::string>& tool_names);

}  // namespace genui
