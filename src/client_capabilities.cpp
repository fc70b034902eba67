#include "client_capabilities.hpp"

#include <utility>

namespace genui {

nlohmann::json CatalogDescriptor::ToCapabilitiesJson(const std::string& fallback_id) const {
  nlohmann::json j;
  j["catalogId"] = catalog_id ? *catalog_id : fallback_id;
  j["components"] = components;
  if (functions.is_array() && !functions.empty()) j["functions"] = functions;
  return j;
}

nlohmann::json ClientCapabilities::ToJson() const {
  nlohmann::json body;
  body["supportedCatalogIds"] = supported_catalog_ids;
  if (inline_catalogs) body["inlineCatalogs"] = *inline_catalogs;
  return {{"v0.9", body}};
}

std::optional<ClientCapabilities> BuildClientCapabilities(const std::vector<CatalogDescriptor>& catalogs,
                                                          InlineCatalogHandling handling,
                                                          std::string* err) {
  ClientCapabilities out;
  std::vector<nlohmann::json> inlined;
  for (size_t i = 0; i < catalogs.size(); i++) {
    const auto& catalog = catalogs[i];
    const std::string fallback_id = "inline_catalog_" + std::to_string(i);
    if (handling == InlineCatalogHandling::kAll) {
      inlined.push_back(catalog.ToCapabilitiesJson(fallback_id));
      continue;
    }
    if (catalog.catalog_id) {
      out.supported_catalog_ids.push_back(*catalog.catalog_id);
      continue;
    }
    if (handling == InlineCatalogHandling::kNone) {
      if (err) *err = "capability negotiation: catalog " + std::to_string(i) + " has no catalogId and inlining is disabled";
      return std::nullopt;
    }
    inlined.push_back(catalog.ToCapabilitiesJson(fallback_id));
  }
  if (!inlined.empty()) out.inline_catalogs = std::move(inlined);
  return out;
}

}  // namespace genui
