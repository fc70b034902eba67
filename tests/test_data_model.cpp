#include <gtest/gtest.h>
#include "data_model.hpp"
#include "log.hpp"

#include <vector>

using namespace genui;

class DataModelTest : public ::testing::Test {
 protected:
  void SetUp() override { SetLogEnabled(false); }

  DataModel model;
};

TEST_F(DataModelTest, UpdateCreatesIntermediateContainers) {
  ASSERT_TRUE(model.Update(DataPath("/user/tags[1]"), "b"));
  auto user = model.Get(DataPath("/user"));
  ASSERT_TRUE(user.has_value());
  EXPECT_EQ(*user, nlohmann::json::parse(R"({"tags": [null, "b"]})"));
}

TEST_F(DataModelTest, MissingValuesReadAsNull) {
  auto v = model.Get(DataPath("/nothing/here"));
  ASSERT_TRUE(v.has_value());
  EXPECT_TRUE(v->is_null());
}

TEST_F(DataModelTest, RootUpdateReplacesDocument) {
  ASSERT_TRUE(model.Update(DataPath::Root(), {{"a", 1}}));
  EXPECT_EQ(*model.Get(DataPath("/a")), 1);
  ASSERT_TRUE(model.Update(DataPath("/"), {{"b", 2}}));
  EXPECT_TRUE(model.Get(DataPath("/a"))->is_null());
}

TEST_F(DataModelTest, StructuralConflictLeavesDocumentUntouched) {
  ASSERT_TRUE(model.Update(DataPath("/name"), "Ada"));
  std::string err;
  EXPECT_FALSE(model.Update(DataPath("/name/first"), "A", &err));
  EXPECT_EQ(err.rfind("structural conflict", 0), 0u) << err;
  EXPECT_EQ(*model.Get(DataPath("/name")), "Ada");

  err.clear();
  EXPECT_FALSE(model.Get(DataPath("/name[0]"), &err).has_value());
  EXPECT_EQ(err.rfind("structural conflict", 0), 0u) << err;
}

TEST_F(DataModelTest, IndexIntoMapIsConflict) {
  ASSERT_TRUE(model.Update(DataPath("/items"), {{"k", 1}}));
  std::string err;
  EXPECT_FALSE(model.Update(DataPath("/items[0]"), 1, &err));
  EXPECT_NE(err.find("sequence"), std::string::npos);
}

TEST_F(DataModelTest, WatchEmitsCurrentValueThenChanges) {
  ASSERT_TRUE(model.Update(DataPath("/count"), 1));
  std::vector<nlohmann::json> seen;
  auto sub = model.Watch(DataPath("/count")).Listen([&](const nlohmann::json& v) { seen.push_back(v); });
  ASSERT_TRUE(model.Update(DataPath("/count"), 2));
  ASSERT_TRUE(model.Update(DataPath("/count"), 2));
  ASSERT_TRUE(model.Update(DataPath("/other"), 9));
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], 1);
  EXPECT_EQ(seen[1], 2);
}

TEST_F(DataModelTest, AncestorAndDescendantWritesNotifyWatchers) {
  std::vector<nlohmann::json> leaf;
  std::vector<nlohmann::json> parent;
  auto s1 = model.Watch(DataPath("/user/name")).Listen([&](const nlohmann::json& v) { leaf.push_back(v); });
  auto s2 = model.Watch(DataPath("/user")).Listen([&](const nlohmann::json& v) { parent.push_back(v); });

  ASSERT_TRUE(model.Update(DataPath("/user"), {{"name", "Ada"}}));
  ASSERT_TRUE(model.Update(DataPath("/user/name"), "Grace"));

  ASSERT_EQ(leaf.size(), 3u);
  EXPECT_EQ(leaf[1], "Ada");
  EXPECT_EQ(leaf[2], "Grace");
  ASSERT_EQ(parent.size(), 3u);
  EXPECT_EQ(parent[2], nlohmann::json({{"name", "Grace"}}));
}

TEST_F(DataModelTest, CancelledWatchStopsReceiving) {
  int calls = 0;
  auto sub = model.Watch(DataPath("/x")).Listen([&](const nlohmann::json&) { calls++; });
  EXPECT_EQ(model.ObserverCount(), 1u);
  sub.Cancel();
  EXPECT_EQ(model.ObserverCount(), 0u);
  ASSERT_TRUE(model.Update(DataPath("/x"), 1));
  EXPECT_EQ(calls, 1);
}

TEST_F(DataModelTest, DisposedModelRejectsOperations) {
  model.Dispose();
  model.Dispose();
  EXPECT_TRUE(model.Disposed());
  std::string err;
  EXPECT_FALSE(model.Update(DataPath("/a"), 1, &err));
  EXPECT_EQ(err, "data model disposed");
  EXPECT_FALSE(model.Get(DataPath("/a")).has_value());

  std::string stream_err;
  auto sub = model.Watch(DataPath("/a")).Listen([](const nlohmann::json&) {},
                                                [&](const std::string& e) { stream_err = e; });
  EXPECT_EQ(stream_err, "data model disposed");
}

TEST_F(DataModelTest, IndexWritesBeyondTheEndPadWithNull) {
  ASSERT_TRUE(model.Update(DataPath("/list"), nlohmann::json::array({"a"})));
  ASSERT_TRUE(model.Update(DataPath("/list[3]"), "d"));
  EXPECT_EQ(*model.Get(DataPath("/list")), nlohmann::json::parse(R"(["a", null, null, "d"])"));
}

TEST_F(DataModelTest, IndexFarPastTheEndIsRejected) {
  ASSERT_TRUE(model.Update(DataPath("/list"), nlohmann::json::array({"a"})));
  std::string err;
  EXPECT_FALSE(model.Update(DataPath("/list[50000000]"), 1, &err));
  EXPECT_EQ(err.rfind("structural conflict:", 0), 0u) << err;
  EXPECT_EQ(*model.Get(DataPath("/list")), nlohmann::json::array({"a"}));

  err.clear();
  EXPECT_FALSE(model.Update(DataPath("/fresh/items[999999999]/name"), "x", &err));
  EXPECT_EQ(err.rfind("structural conflict:", 0), 0u) << err;
  EXPECT_TRUE(model.Get(DataPath("/fresh"))->is_null());

  ASSERT_TRUE(model.Update(DataPath("/list[1025]"), "z"));
  EXPECT_EQ(model.Get(DataPath("/list"))->size(), 1026u);
}

TEST_F(DataModelTest, AutoCreatesMapsAndSequences) {
  ASSERT_TRUE(model.Update(DataPath("/a/b/c"), 1));
  ASSERT_TRUE(model.Update(DataPath("/x[0]/y"), 2));
  EXPECT_EQ(*model.Get(DataPath::Root()), nlohmann::json::parse(R"({"a": {"b": {"c": 1}}, "x": [{"y": 2}]})"));
}
