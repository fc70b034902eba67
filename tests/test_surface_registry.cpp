#include <gtest/gtest.h>
#include "log.hpp"
#include "surface_registry.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace genui;

namespace {

A2uiMessage Parse(const char* text) {
  std::string err;
  auto m = ParseMessage(nlohmann::json::parse(text), &err);
  EXPECT_TRUE(m.has_value()) << err;
  return *m;
}

}  // namespace

class SurfaceTest : public ::testing::Test {
 protected:
  void SetUp() override { SetLogEnabled(false); }
};

TEST_F(SurfaceTest, UpdatesUpsertComponentsIntoNewSnapshots) {
  Surface surface("s1", nullptr);
  EXPECT_EQ(surface.Definition(), nullptr);

  ASSERT_TRUE(surface.Apply(Parse(R"({"surfaceUpdate": {"surfaceId": "s1", "components": [
      {"id": "a", "component": {"Text": {"text": "one"}}},
      {"id": "b", "component": {"Text": {"text": "two"}}}]}})")));
  auto first = surface.Definition();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->components.size(), 2u);
  EXPECT_FALSE(first->root_component_id.has_value());

  ASSERT_TRUE(surface.Apply(Parse(R"({"surfaceUpdate": {"surfaceId": "s1", "components": [
      {"id": "a", "component": {"Text": {"text": "uno"}}}]}})")));
  ASSERT_TRUE(surface.Apply(Parse(R"({"beginRendering": {"surfaceId": "s1", "root": "a"}})")));

  auto second = surface.Definition();
  EXPECT_NE(first, second);
  EXPECT_EQ(first->FindComponent("a")->component["Text"]["text"], "one");
  EXPECT_EQ(second->FindComponent("a")->component["Text"]["text"], "uno");
  EXPECT_NE(second->FindComponent("b"), nullptr);
  EXPECT_EQ(*second->root_component_id, "a");
}

TEST_F(SurfaceTest, RejectsMessagesForOtherSurfaces) {
  Surface surface("s1", nullptr);
  std::string err;
  EXPECT_FALSE(surface.Apply(Parse(R"({"beginRendering": {"surfaceId": "s2", "root": "a"}})"), &err));
  EXPECT_EQ(err, "routing mismatch: expected s1, got s2");
  EXPECT_EQ(surface.Definition(), nullptr);

  err.clear();
  EXPECT_FALSE(surface.Apply(SurfaceDeletion{"s2"}, &err));
  EXPECT_EQ(err, "routing mismatch: expected s1, got s2");
  EXPECT_TRUE(surface.Apply(SurfaceDeletion{"s1"}));
}

TEST_F(SurfaceTest, DataModelUpdateDefaultsToRoot) {
  Surface surface("s1", nullptr);
  ASSERT_TRUE(surface.Apply(Parse(R"({"dataModelUpdate": {"surfaceId": "s1", "contents": {"title": "Hi"}}})")));
  ASSERT_TRUE(surface.Apply(Parse(R"({"dataModelUpdate": {"surfaceId": "s1", "path": "/count", "contents": 2}})")));
  EXPECT_EQ(*surface.Model().Get(DataPath("/title")), "Hi");
  EXPECT_EQ(*surface.Model().Get(DataPath("/count")), 2);

  std::string err;
  EXPECT_FALSE(
      surface.Apply(Parse(R"({"dataModelUpdate": {"surfaceId": "s1", "path": "/title/x", "contents": 1}})"), &err));
  EXPECT_EQ(err.rfind("structural conflict", 0), 0u);
}

TEST_F(SurfaceTest, WatchDefinitionSeesEverySnapshot) {
  Surface surface("s1", nullptr);
  std::vector<std::shared_ptr<const UiDefinition>> seen;
  auto watch = surface.WatchDefinition([&](const std::shared_ptr<const UiDefinition>& d) { seen.push_back(d); });
  ASSERT_TRUE(watch.has_value());
  ASSERT_TRUE(surface.Apply(Parse(R"({"beginRendering": {"surfaceId": "s1", "root": "r"}})")));
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0], surface.Definition());
}

TEST_F(SurfaceTest, DisposedSurfaceFails) {
  bool forwarded = false;
  Surface surface("s1", [&](const UiEvent&) { forwarded = true; });
  surface.Dispose();
  surface.Dispose();
  std::string err;
  EXPECT_FALSE(surface.Apply(Parse(R"({"beginRendering": {"surfaceId": "s1", "root": "r"}})"), &err));
  EXPECT_EQ(err, "surface disposed: s1");
  EXPECT_FALSE(surface.WatchDefinition([](const std::shared_ptr<const UiDefinition>&) {}).has_value());
  EXPECT_TRUE(surface.Model().Disposed());
  UiEvent e;
  e.surface_id = "s1";
  e.name = "click";
  surface.DispatchUiEvent(e);
  EXPECT_FALSE(forwarded);
}

class SurfaceRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    SetLogEnabled(false);
    lifecycle_sub = registry.SurfaceUpdates().Subscribe([this](const SurfaceLifecycleEvent& e) {
      changes.push_back((e.change == SurfaceChange::kAdded ? "+" : "-") + e.surface_id);
    });
    messages_sub = registry.UserMessages().Subscribe([this](const ChatMessage& m) { messages.push_back(m); });
  }

  SurfaceRegistry registry;
  std::vector<std::string> changes;
  std::vector<ChatMessage> messages;
  Subscription lifecycle_sub;
  Subscription messages_sub;
};

TEST_F(SurfaceRegistryTest, DispatchCreatesAndDeletesSurfaces) {
  ASSERT_TRUE(registry.Dispatch(Parse(R"({"beginRendering": {"surfaceId": "a", "root": "r"}})")));
  ASSERT_TRUE(registry.Dispatch(Parse(R"({"beginRendering": {"surfaceId": "a", "root": "r2"}})")));
  ASSERT_TRUE(registry.Dispatch(Parse(R"({"dataModelUpdate": {"surfaceId": "b", "contents": {}}})")));
  EXPECT_EQ(registry.SurfaceIds(), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(*registry.Find("a")->Definition()->root_component_id, "r2");

  auto a = registry.Find("a");
  ASSERT_TRUE(registry.Dispatch(Parse(R"({"surfaceDeletion": {"surfaceId": "a"}})")));
  EXPECT_FALSE(registry.Contains("a"));
  EXPECT_TRUE(a->Disposed());
  // Deleting an unknown surface is not an error.
  EXPECT_TRUE(registry.Dispatch(Parse(R"({"surfaceDeletion": {"surfaceId": "zzz"}})")));

  EXPECT_EQ(changes, (std::vector<std::string>{"+a", "+b", "-a"}));
}

TEST_F(SurfaceRegistryTest, SurfaceEventsBecomeUserActions) {
  auto surface = registry.GetOrCreate("s");
  ASSERT_NE(surface, nullptr);
  UiEvent e;
  e.surface_id = "s";
  e.name = "submit";
  e.source_component_id = "button";
  e.timestamp = "2024-01-01T00:00:00.000Z";
  e.is_action = true;
  e.context = {{"email", "ada@example.com"}};
  surface->DispatchUiEvent(e);

  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].role, "user");
  EXPECT_TRUE(messages[0].ui_interaction);
  auto payload = nlohmann::json::parse(messages[0].content);
  const auto& action = payload["userAction"];
  EXPECT_EQ(action["surfaceId"], "s");
  EXPECT_EQ(action["name"], "submit");
  EXPECT_EQ(action["sourceComponentId"], "button");
  EXPECT_EQ(action["timestamp"], "2024-01-01T00:00:00.000Z");
  EXPECT_EQ(action["isAction"], true);
  EXPECT_EQ(action["context"]["email"], "ada@example.com");
}

TEST_F(SurfaceRegistryTest, NonActionEventsAreIgnored) {
  UiEvent e;
  e.surface_id = "s";
  e.name = "focus";
  e.is_action = false;
  std::string err;
  EXPECT_FALSE(registry.HandleInteraction(e, &err));
  EXPECT_TRUE(err.empty());
  EXPECT_TRUE(messages.empty());
}

TEST_F(SurfaceRegistryTest, DisposeClosesChannelsAndSurfaces) {
  auto s = registry.GetOrCreate("s");
  int done = 0;
  auto sub = registry.UserMessages().Subscribe([](const ChatMessage&) {}, [&]() { done++; });
  registry.Dispose();
  registry.Dispose();
  EXPECT_EQ(done, 1);
  EXPECT_TRUE(s->Disposed());
  EXPECT_TRUE(registry.SurfaceIds().empty());

  std::string err;
  EXPECT_EQ(registry.GetOrCreate("t", &err), nullptr);
  EXPECT_EQ(err, "registry disposed");
  err.clear();
  EXPECT_FALSE(registry.Dispatch(Parse(R"({"beginRendering": {"surfaceId": "t", "root": "r"}})"), &err));
  EXPECT_EQ(err, "registry disposed");
}

TEST_F(SurfaceRegistryTest, AddedEventPrecedesFirstDefinition) {
  std::vector<std::string> order;
  Subscription watch;
  auto sub = registry.SurfaceUpdates().Subscribe([&](const SurfaceLifecycleEvent& e) {
    order.push_back("added");
    auto w = e.surface->WatchDefinition([&](const std::shared_ptr<const UiDefinition>&) { order.push_back("defined"); });
    if (w) watch = std::move(*w);
  });
  ASSERT_TRUE(registry.Dispatch(Parse(R"({"surfaceUpdate": {"surfaceId": "n", "components": []}})")));
  EXPECT_EQ(order, (std::vector<std::string>{"added", "defined"}));
}

TEST_F(SurfaceRegistryTest, DataModelUpdatesThroughRegistry) {
  ASSERT_TRUE(registry.Dispatch(Parse(R"({"dataModelUpdate": {"surfaceId": "s1", "contents": {"a": {"b": 1}}}})")));
  ASSERT_TRUE(registry.Dispatch(Parse(R"({"dataModelUpdate": {"surfaceId": "s1", "path": "/a/b", "contents": 2}})")));
  EXPECT_EQ(*registry.Find("s1")->Model().Get(DataPath::Root()), nlohmann::json::parse(R"({"a": {"b": 2}})"));

  ASSERT_TRUE(registry.Dispatch(Parse(R"({"dataModelUpdate": {"surfaceId": "s2", "path": "/a[0]/b", "contents": "hello"}})")));
  EXPECT_EQ(*registry.Find("s2")->Model().Get(DataPath::Root()), nlohmann::json::parse(R"({"a": [{"b": "hello"}]})"));
}
