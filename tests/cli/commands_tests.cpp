#include <gtest/gtest.h>

#include "tests/cli/cli_test_fixture.hpp"

namespace witkit::test {
namespace {

class CommandsTest : public CliTestFixture {
 protected:
  void SetUp() override {
    CliTestFixture::SetUp();
    CopyData("shopping_cart.yaml");
  }
};

// =============================================================================
// exports
// =============================================================================

TEST_F(CommandsTest, ExportsListsLatestVersion) {
  auto result = Run({"exports", "--metadata", "shopping_cart.yaml"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("golem:it/api  addItem(item: record) => void"))
      << result.output;
  EXPECT_TRUE(result.Contains("checkout() => variant"));
  EXPECT_TRUE(result.Contains("getCartContents() => list<record>"));
  EXPECT_TRUE(result.Contains(
      "setTags(tags: list<string>, status: enum, note: option<string>) => "
      "void"));
}

TEST_F(CommandsTest, ExportsSearchFiltersByName) {
  auto result = Run(
      {"exports", "--metadata", "shopping_cart.yaml", "--search", "ITEM"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("addItem("));
  EXPECT_TRUE(result.Contains("removeItem("));
  EXPECT_TRUE(result.Contains("updateItemQuantity("));
  EXPECT_FALSE(result.Contains("checkout("));
}

TEST_F(CommandsTest, ExportsSearchWithoutMatches) {
  auto result = Run(
      {"exports", "--metadata", "shopping_cart.yaml", "--search", "zzz"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("No exports found."));
}

TEST_F(CommandsTest, ExportsSelectsRequestedVersion) {
  auto result = Run(
      {"exports", "--metadata", "shopping_cart.yaml", "--component-version",
       "0"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("initializeCart(user-id: string) => void"));
  EXPECT_FALSE(result.Contains("addItem("));
}

TEST_F(CommandsTest, MissingVersionIsReported) {
  auto result = Run(
      {"exports", "--metadata", "shopping_cart.yaml", "--component-version",
       "9"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("component 'shopping-cart' has no version 9"))
      << result.output;
}

TEST_F(CommandsTest, MissingMetadataIsReported) {
  auto result = Run({"exports"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("no component metadata file")) << result.output;
}

TEST_F(CommandsTest, UnreadableMetadataIsReported) {
  auto result = Run({"exports", "--metadata", "missing.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("metadata file not found")) << result.output;
}

TEST_F(CommandsTest, MalformedMetadataShowsLocation) {
  WriteFile("bad.yaml", "versions:\n  - version: 1\n    extra: true\n");
  auto result = Run({"exports", "--metadata", "bad.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("bad.yaml:3: unknown field 'extra' in version"))
      << result.output;
}

// =============================================================================
// show
// =============================================================================

TEST_F(CommandsTest, ShowPrintsFullTypes) {
  auto result = Run({"show", "checkout", "--metadata", "shopping_cart.yaml"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("golem:it/api.{checkout}"));
  EXPECT_TRUE(result.Contains("=> enum {\n  Error(String),\n  Success("))
      << result.output;
}

TEST_F(CommandsTest, ShowAcceptsDisplayName) {
  auto result = Run({"show", "addItem", "--metadata", "shopping_cart.yaml"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_TRUE(result.Contains("item: {\n  \"product-id\": \"String\","))
      << result.output;
  EXPECT_TRUE(result.Contains("=> void"));
}

TEST_F(CommandsTest, UnknownFunctionIsReported) {
  auto result = Run({"show", "nope", "--metadata", "shopping_cart.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("no exported function 'nope' in version 1"))
      << result.output;
}

// =============================================================================
// skeleton
// =============================================================================

TEST_F(CommandsTest, SkeletonForRecordArgument) {
  auto result = Run(
      {"skeleton", "add-item", "--metadata", "shopping_cart.yaml",
       "--compact"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(
      result.output,
      "[{\"product-id\":\"\",\"name\":\"\",\"price\":0,\"quantity\":0}]\n");
}

TEST_F(CommandsTest, SkeletonForMixedArguments) {
  auto result = Run(
      {"skeleton", "set-tags", "--metadata", "shopping_cart.yaml",
       "--compact"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "[[],\"\",null]\n");
}

TEST_F(CommandsTest, SkeletonIsPrettyByDefault) {
  auto result =
      Run({"skeleton", "remove-item", "--metadata", "shopping_cart.yaml"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "[\n  \"\"\n]\n");
}

// =============================================================================
// encode
// =============================================================================

TEST_F(CommandsTest, EncodeFromFile) {
  WriteFile("args.json", R"(["p1", 3])");
  auto result = Run(
      {"encode", "update-item-quantity", "args.json", "--metadata",
       "shopping_cart.yaml", "--compact"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(
      result.output,
      "{\"params\":[{\"value\":\"p1\",\"typ\":{\"type\":\"Str\"}},"
      "{\"value\":3,\"typ\":{\"type\":\"U32\"}}]}\n");
}

TEST_F(CommandsTest, EncodeRejectsOptionParameter) {
  auto result = RunWithStdin(
      R"(["only-one"])",
      {"encode", "set-tags", "-", "--metadata", "shopping_cart.yaml",
       "--compact"});

  // set-tags ends with an option parameter
  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("Unsupported type: Option")) << result.output;
}

TEST_F(CommandsTest, EncodeRejectsInvalidJson) {
  WriteFile("args.json", "[nope]");
  auto result = Run(
      {"encode", "remove-item", "args.json", "--metadata",
       "shopping_cart.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("invalid literal")) << result.output;
}

TEST_F(CommandsTest, EncodeRequiresArray) {
  WriteFile("args.json", R"({"product-id": "p1"})");
  auto result = Run(
      {"encode", "remove-item", "args.json", "--metadata",
       "shopping_cart.yaml"});

  EXPECT_FALSE(result.Success());
  EXPECT_TRUE(result.Contains("arguments must be a JSON array"))
      << result.output;
}

// =============================================================================
// format
// =============================================================================

TEST_F(CommandsTest, FormatPrettyPrintsJson) {
  auto result = RunWithStdin(R"({"a":[1,true]})", {"format", "-"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "{\n  \"a\": [\n    1,\n    true\n  ]\n}\n");
}

TEST_F(CommandsTest, FormatKeepsInvalidText) {
  WriteFile("draft.json", "{\"a\": ");
  auto result = Run({"format", "draft.json"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, "{\"a\": ");
}

TEST_F(CommandsTest, FormatEchoesNearJsonTextUnchanged) {
  const std::string draft = "[\"line\nbreak\", 'x',]\n";
  auto result = RunWithStdin(draft, {"format", "-"});

  EXPECT_TRUE(result.Success()) << result.output;
  EXPECT_EQ(result.output, draft);
}

TEST_F(CommandsTest, NoSubcommandPrintsHelp) {
  auto result = Run({});

  EXPECT_TRUE(result.Success());
  EXPECT_TRUE(result.Contains("exports"));
}

}  // namespace
}  // namespace witkit::test
