#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace genui {

// A component catalog as advertised to the agent. `components` maps a
// component kind to its property schema.
struct CatalogDescriptor {
  std::optional<std::string> catalog_id;
  nlohmann::json components = nlohmann::json::object();
  nlohmann::json functions = nlohmann::json::array();

  // Inline document; catalogs without an id get `fallback_id`.
  nlohmann::json ToCapabilitiesJson(const std::string& fallback_id) const;
};

enum class InlineCatalogHandling {
  kNone,        // every catalog must carry an id
  kMissingIds,  // inline only the catalogs without an id
  kAll,         // inline everything
};

struct ClientCapabilities {
  std::vector<std::string> supported_catalog_ids;
  std::optional<std::vector<nlohmann::json>> inline_catalogs;

  // {"v0.9": {"supportedCatalogIds": [...], "inlineCatalogs"?: [...]}}
  nlohmann::json ToJson() const;
};

// Builds the capability advertisement for a set of catalogs.
// Returns std::nullopt with `err` set to "capability negotiation: ..." when
// `handling` is kNone and a catalog has no id.
std::optional<ClientCapabilities> BuildClientCapabilities(const std::vector<CatalogDescriptor>& catalogs,
                                                          InlineCatalogHandling handling,
                                                          std::string* err);

}  // namespace genui
