#include <gtest/gtest.h>
#include "tooling.hpp"

#include <stdexcept>
#include <string>

using namespace genui;

class ToolRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ToolSchema echo;
    echo.name = "echo";
    echo.description = "Echo the text back.";
    echo.parameters = {{"type", "object"},
                       {"properties", {{"text", {{"type", "string"}}}, {"times", {{"type", "integer"}}}}},
                       {"required", {"text"}}};
    registry.RegisterTool(echo, [](const std::string& id, const nlohmann::json& args) {
      ToolResult r;
      r.tool_call_id = id;
      r.result = {{"text", args["text"]}};
      return r;
    });

    ToolSchema fail;
    fail.name = "fail";
    fail.parameters = {{"type", "object"}};
    registry.RegisterTool(fail, [](const std::string&, const nlohmann::json&) -> ToolResult {
      throw std::runtime_error("disk full");
    });
  }

  ToolRegistry registry;
};

TEST_F(ToolRegistryTest, ListsSchemasByName) {
  auto names = ExtractToolNames(registry.ListSchemas());
  EXPECT_EQ(names, (std::vector<std::string>{"echo", "fail"}));
  EXPECT_FALSE(registry.GetSchema("nope").has_value());
  EXPECT_EQ(registry.GetSchema("echo")->description, "Echo the text back.");
}

TEST_F(ToolRegistryTest, ExecutesValidCall) {
  auto r = ExecuteToolCall(registry, {"call_1", "echo", R"({"text": "hi", "times": 2})"});
  EXPECT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.tool_call_id, "call_1");
  EXPECT_EQ(r.name, "echo");
  EXPECT_EQ(r.result["text"], "hi");
}

TEST_F(ToolRegistryTest, ReportsFailuresAsResults) {
  auto missing = ExecuteToolCall(registry, {"c1", "nope", "{}"});
  EXPECT_FALSE(missing.ok);
  EXPECT_EQ(missing.error, "tool not found");

  auto bad_json = ExecuteToolCall(registry, {"c2", "echo", "not json"});
  EXPECT_FALSE(bad_json.ok);
  EXPECT_EQ(bad_json.error, "invalid tool arguments json");

  auto bad_args = ExecuteToolCall(registry, {"c3", "echo", R"({"times": 1})"});
  EXPECT_FALSE(bad_args.ok);
  EXPECT_EQ(bad_args.error, "invalid tool arguments: missing required field: text");

  auto thrown = ExecuteToolCall(registry, {"c4", "fail", "{}"});
  EXPECT_FALSE(thrown.ok);
  EXPECT_EQ(thrown.error, "tool failed: disk full");
  EXPECT_EQ(thrown.result["ok"], false);
}

TEST(ToolingTest, ValidateSchemaLooseChecksTypes) {
  nlohmann::json schema = {{"type", "object"},
                           {"properties", {{"n", {{"type", "integer"}}}, {"tags", {{"type", "array"}}}}},
                           {"required", {"n"}}};
  std::string err;
  EXPECT_TRUE(ValidateSchemaLoose(schema, {{"n", 3}, {"extra", true}}, &err));
  EXPECT_TRUE(ValidateSchemaLoose(schema, {{"n", 3.0}}, &err));
  EXPECT_FALSE(ValidateSchemaLoose(schema, {{"n", 3.5}}, &err));
  EXPECT_EQ(err, "field type mismatch: n");
  EXPECT_FALSE(ValidateSchemaLoose(schema, {{"n", 1}, {"tags", "a"}}, &err));
  EXPECT_FALSE(ValidateSchemaLoose(schema, nlohmann::json::array(), &err));
  EXPECT_EQ(err, "arguments type mismatch: expected object");
  EXPECT_TRUE(ValidateSchemaLoose(nullptr, 5, &err));
}

TEST(ToolingTest, ParseJsonLooseStripsFencesAndProse) {
  auto fenced = ParseJsonLoose("```json\n{\"a\": 1}\n```");
  ASSERT_TRUE(fenced.has_value());
  EXPECT_EQ((*fenced)["a"], 1);

  auto prose = ParseJsonLoose("Sure! Here it is: {\"b\": \"}\"} thanks");
  ASSERT_TRUE(prose.has_value());
  EXPECT_EQ((*prose)["b"], "}");

  EXPECT_FALSE(ParseJsonLoose("no json here").has_value());
  EXPECT_FALSE(ParseJsonLoose("   ").has_value());
}

TEST(ToolingTest, RecoversToolCallsFromText) {
  auto tagged = ParseToolCallsFromAssistantText(
      "<tool_call>{\"name\": \"surfaceUpdate\", \"arguments\": {\"surfaceId\": \"s\"}}</tool_call>"
      "<TOOL_CALL>{\"name\": \"beginRendering\", \"arguments\": \"{\\\"root\\\": \\\"r\\\"}\"}</TOOL_CALL>");
  ASSERT_TRUE(tagged.has_value());
  ASSERT_EQ(tagged->size(), 2u);
  EXPECT_EQ((*tagged)[0].name, "surfaceUpdate");
  EXPECT_EQ(nlohmann::json::parse((*tagged)[0].arguments_json)["surfaceId"], "s");
  EXPECT_EQ((*tagged)[1].name, "beginRendering");
  EXPECT_EQ(nlohmann::json::parse((*tagged)[1].arguments_json)["root"], "r");

  auto array = ParseToolCallsFromAssistantText(R"({"tool_calls": [
      {"id": "x1", "function": {"name": "deleteSurface", "arguments": {"surfaceId": "s"}}},
      {"name": "dataModelUpdate", "arguments": null}]})");
  ASSERT_TRUE(array.has_value());
  ASSERT_EQ(array->size(), 2u);
  EXPECT_EQ((*array)[0].id, "x1");
  EXPECT_EQ((*array)[0].name, "deleteSurface");
  EXPECT_EQ((*array)[1].arguments_json, "{}");

  auto single = ParseToolCallsFromAssistantText(R"({"toolCall": {"tool": "echo", "args": {"text": "a"}}})");
  ASSERT_TRUE(single.has_value());
  EXPECT_EQ((*single)[0].name, "echo");
  EXPECT_FALSE((*single)[0].id.empty());

  EXPECT_FALSE(ParseToolCallsFromAssistantText("Just a normal answer.").has_value());
  EXPECT_FALSE(ParseToolCallsFromAssistantText(R"({"answer": 42})").has_value());
}
