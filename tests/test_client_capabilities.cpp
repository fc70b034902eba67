#include <gtest/gtest.h>
#include "client_capabilities.hpp"

#include <string>
#include <vector>

using namespace genui;

class ClientCapabilitiesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    CatalogDescriptor standard;
    standard.catalog_id = "https://example.com/catalogs/standard.json";
    standard.components = {{"Text", {{"type", "object"}}}};
    catalogs.push_back(standard);

    CatalogDescriptor custom;
    custom.components = {{"Chart", {{"type", "object"}}}};
    custom.functions = nlohmann::json::array({{{"name", "sum"}}});
    catalogs.push_back(custom);
  }

  std::vector<CatalogDescriptor> catalogs;
};

TEST_F(ClientCapabilitiesTest, NoneRequiresEveryCatalogId) {
  std::string err;
  EXPECT_FALSE(BuildClientCapabilities(catalogs, InlineCatalogHandling::kNone, &err).has_value());
  EXPECT_EQ(err.rfind("capability negotiation: ", 0), 0u) << err;

  catalogs.pop_back();
  auto caps = BuildClientCapabilities(catalogs, InlineCatalogHandling::kNone, &err);
  ASSERT_TRUE(caps.has_value());
  EXPECT_FALSE(caps->inline_catalogs.has_value());
  EXPECT_EQ(caps->ToJson(),
            nlohmann::json::parse(R"({"v0.9": {"supportedCatalogIds": ["https://example.com/catalogs/standard.json"]}})"));
}

TEST_F(ClientCapabilitiesTest, MissingIdsInlinesOnlyAnonymousCatalogs) {
  std::string err;
  auto caps = BuildClientCapabilities(catalogs, InlineCatalogHandling::kMissingIds, &err);
  ASSERT_TRUE(caps.has_value()) << err;
  EXPECT_EQ(caps->supported_catalog_ids, (std::vector<std::string>{"https://example.com/catalogs/standard.json"}));
  ASSERT_TRUE(caps->inline_catalogs.has_value());
  ASSERT_EQ(caps->inline_catalogs->size(), 1u);
  const auto& inlined = (*caps->inline_catalogs)[0];
  EXPECT_EQ(inlined["catalogId"], "inline_catalog_1");
  EXPECT_TRUE(inlined["components"].contains("Chart"));
  EXPECT_EQ(inlined["functions"][0]["name"], "sum");
}

TEST_F(ClientCapabilitiesTest, AllInlinesEverything) {
  std::string err;
  auto caps = BuildClientCapabilities(catalogs, InlineCatalogHandling::kAll, &err);
  ASSERT_TRUE(caps.has_value()) << err;
  EXPECT_TRUE(caps->supported_catalog_ids.empty());
  ASSERT_EQ(caps->inline_catalogs->size(), 2u);
  EXPECT_EQ((*caps->inline_catalogs)[0]["catalogId"], "https://example.com/catalogs/standard.json");
  EXPECT_FALSE((*caps->inline_catalogs)[0].contains("functions"));
  EXPECT_TRUE(caps->ToJson()["v0.9"].contains("inlineCatalogs"));
}
