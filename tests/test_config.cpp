#include <gtest/gtest.h>
#include "config.hpp"

#include <cstdlib>
#include <string>
#include <vector>

using namespace genui;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* name : {"GENUI_LISTEN_HOST", "GENUI_LISTEN_PORT", "GENUI_MODEL_HOST", "GENUI_MODEL",
                             "GENUI_API_KEY", "GENUI_SYSTEM_PROMPT", "GENUI_MAX_ITERATIONS", "GENUI_ALLOW_CREATE",
                             "GENUI_ALLOW_UPDATE", "GENUI_ALLOW_DELETE", "GENUI_CATALOG_IDS", "GENUI_LOG"}) {
      unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.host, "0.0.0.0");
  EXPECT_EQ(cfg.listen.port, 8090);
  EXPECT_EQ(cfg.model_endpoint.host, "127.0.0.1");
  EXPECT_EQ(cfg.model_endpoint.port, 11434);
  EXPECT_EQ(cfg.max_iterations, 0);
  EXPECT_TRUE(cfg.actions.allow_create);
  EXPECT_TRUE(cfg.actions.allow_delete);
  EXPECT_TRUE(cfg.log_enabled);
}

TEST_F(ConfigTest, ReadsEnvironmentOverrides) {
  setenv("GENUI_LISTEN_PORT", "9000", 1);
  setenv("GENUI_MODEL_HOST", "https://models.internal:8443/api", 1);
  setenv("GENUI_MODEL", "qwen", 1);
  setenv("GENUI_MAX_ITERATIONS", "6", 1);
  setenv("GENUI_ALLOW_DELETE", "false", 1);
  setenv("GENUI_CATALOG_IDS", "a, b,,c", 1);
  setenv("GENUI_LOG", "0", 1);

  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.port, 9000);
  EXPECT_EQ(cfg.model_endpoint.scheme, "https");
  EXPECT_EQ(cfg.model_endpoint.host, "models.internal");
  EXPECT_EQ(cfg.model_endpoint.port, 8443);
  EXPECT_EQ(cfg.model_endpoint.base_path, "/api");
  EXPECT_EQ(cfg.model, "qwen");
  EXPECT_EQ(cfg.max_iterations, 6);
  EXPECT_FALSE(cfg.actions.allow_delete);
  EXPECT_EQ(cfg.catalog_ids, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_FALSE(cfg.log_enabled);
}

TEST(ConfigParseTest, ParsesEndpoints) {
  auto ep = ParseHttpEndpoint("localhost", 80);
  EXPECT_EQ(ep.scheme, "http");
  EXPECT_EQ(ep.host, "localhost");
  EXPECT_EQ(ep.port, 80);
  EXPECT_TRUE(ep.base_path.empty());

  ep = ParseHttpEndpoint("http://10.0.0.2:11434/", 80);
  EXPECT_EQ(ep.host, "10.0.0.2");
  EXPECT_EQ(ep.port, 11434);
  EXPECT_TRUE(ep.base_path.empty());
}
