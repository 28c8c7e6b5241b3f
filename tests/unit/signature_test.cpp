#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "witkit/common/typ.hpp"
#include "witkit/metadata/component.hpp"
#include "witkit/render/signature.hpp"

namespace witkit::render {
namespace {

class SignatureTest : public ::testing::Test {
 protected:
  static auto Function(
      std::string name, std::vector<metadata::Parameter> params,
      std::vector<metadata::FunctionResult> results = {})
      -> metadata::ExportedFunction {
    return metadata::ExportedFunction{
        .name = std::move(name),
        .parameters = std::move(params),
        .results = std::move(results),
    };
  }
};

// =============================================================================
// Primitive Rendering
// =============================================================================

TEST_F(SignatureTest, PrimitivesShortEqualsFull) {
  struct Row {
    Typ typ;
    const char* expected;
  };
  std::vector<Row> cases = {
      {Typ::Bool(), "bool"}, {Typ::S8(), "i8"},   {Typ::S16(), "i16"},
      {Typ::S32(), "i32"},   {Typ::S64(), "i64"}, {Typ::U8(), "u8"},
      {Typ::U16(), "u16"},   {Typ::U32(), "u32"}, {Typ::U64(), "u64"},
      {Typ::F32(), "f32"},   {Typ::F64(), "f64"}, {Typ::Char(), "char"},
  };
  for (const auto& c : cases) {
    auto rendered = RenderType(c.typ);
    EXPECT_EQ(rendered.short_form, c.expected) << c.typ.TagName();
    EXPECT_EQ(rendered.full, c.expected) << c.typ.TagName();
  }
}

TEST_F(SignatureTest, StrHasDistinctFullName) {
  auto rendered = RenderType(Typ::Str());
  EXPECT_EQ(rendered.short_form, "string");
  EXPECT_EQ(rendered.full, "String");
}

// =============================================================================
// Generic Containers
// =============================================================================

TEST_F(SignatureTest, List) {
  auto rendered = RenderType(Typ::List(Typ::Str()));
  EXPECT_EQ(rendered.short_form, "list<string>");
  EXPECT_EQ(rendered.full, "list<String>");
}

TEST_F(SignatureTest, OptionOfList) {
  auto rendered = RenderType(Typ::Option(Typ::List(Typ::U8())));
  EXPECT_EQ(rendered.short_form, "option<list<u8>>");
  EXPECT_EQ(rendered.full, "Option<list<u8>>");
}

TEST_F(SignatureTest, Result) {
  auto rendered = RenderType(Typ::Result(Typ::Str(), Typ::U32()));
  EXPECT_EQ(rendered.short_form, "result<string, u32>");
  EXPECT_EQ(rendered.full, "Result<String, u32>");
}

TEST_F(SignatureTest, ResultWithAbsentSide) {
  auto rendered = RenderType(Typ::Result(nullptr, MakeTypPtr(Typ::Str())));
  EXPECT_EQ(rendered.short_form, "result<null, string>");
  EXPECT_EQ(rendered.full, "Result<null, String>");
}

TEST_F(SignatureTest, Tuple) {
  auto rendered = RenderType(Typ::Tuple({Typ::Str(), Typ::Bool()}));
  EXPECT_EQ(rendered.short_form, "tuple<string, bool>");
  EXPECT_EQ(rendered.full, "(String, bool)");
}

TEST_F(SignatureTest, EmptyTuple) {
  auto rendered = RenderType(Typ::Tuple({}));
  EXPECT_EQ(rendered.short_form, "tuple<>");
  EXPECT_EQ(rendered.full, "()");
}

TEST_F(SignatureTest, ChangingSiblingLeavesNodeUnchanged) {
  auto first = RenderType(Typ::Tuple({Typ::List(Typ::Str()), Typ::U8()}));
  auto second = RenderType(Typ::Tuple({Typ::List(Typ::Str()), Typ::F64()}));
  auto inner = RenderType(Typ::List(Typ::Str()));
  EXPECT_TRUE(first.short_form.starts_with("tuple<" + inner.short_form + ","));
  EXPECT_TRUE(second.short_form.starts_with("tuple<" + inner.short_form + ","));
  EXPECT_TRUE(first.full.starts_with("(" + inner.full + ","));
  EXPECT_TRUE(second.full.starts_with("(" + inner.full + ","));
}

// =============================================================================
// Nominal Types
// =============================================================================

TEST_F(SignatureTest, RecordShortNeverExpands) {
  auto rendered = RenderType(
      Typ::Record({Field("a", Typ::Str()), Field("b", Typ::U32())}));
  EXPECT_EQ(rendered.short_form, "record");
}

TEST_F(SignatureTest, RecordFullIsOneFieldPerLine) {
  auto rendered = RenderType(
      Typ::Record({Field("a", Typ::Str()), Field("b", Typ::U32())}));
  EXPECT_EQ(rendered.full, "{\n  \"a\": \"String\",\n  \"b\": \"u32\"\n}");
}

TEST_F(SignatureTest, NestedRecordIsEmbeddedAsString) {
  auto rendered = RenderType(
      Typ::Record({Field("inner", Typ::Record({Field("x", Typ::Bool())}))}));
  EXPECT_EQ(rendered.full, R"({
  "inner": "{\n  \"x\": \"bool\"\n}"
})");
}

TEST_F(SignatureTest, EmptyRecord) {
  auto rendered = RenderType(Typ::Record({}));
  EXPECT_EQ(rendered.short_form, "record");
  EXPECT_EQ(rendered.full, "{}");
}

TEST_F(SignatureTest, VariantCapitalizesCases) {
  auto rendered = RenderType(Typ::Variant({Case("ok", Typ::Str())}));
  EXPECT_EQ(rendered.short_form, "variant");
  EXPECT_NE(rendered.full.find("Ok(String)"), std::string::npos);
}

TEST_F(SignatureTest, VariantFullForm) {
  auto rendered = RenderType(
      Typ::Variant(
          {Case("error", Typ::Str()), Case("none"),
           Case("Count", Typ::List(Typ::U8()))}));
  EXPECT_EQ(
      rendered.full,
      "enum {\n  Error(String),\n  None(),\n  Count(list<u8>)\n}");
}

TEST_F(SignatureTest, EmptyVariant) {
  EXPECT_EQ(RenderType(Typ::Variant({})).full, "enum {}");
}

TEST_F(SignatureTest, EnumCapitalizesCases) {
  auto rendered = RenderType(Typ::Enum({"pending", "done"}));
  EXPECT_EQ(rendered.short_form, "enum");
  EXPECT_EQ(rendered.full, "enum (\n  Pending,\n  Done\n)");
  EXPECT_EQ(rendered.full.find("pending"), std::string::npos);
}

TEST_F(SignatureTest, EmptyEnum) {
  EXPECT_EQ(RenderType(Typ::Enum({})).full, "enum ()");
}

// =============================================================================
// Fallbacks
// =============================================================================

TEST_F(SignatureTest, AbsentTypeRendersNull) {
  auto rendered = RenderType(static_cast<const Typ*>(nullptr));
  EXPECT_EQ(rendered.short_form, "null");
  EXPECT_EQ(rendered.full, "null");
}

TEST_F(SignatureTest, UnrecognizedTagRendersUnknown) {
  auto rendered = RenderType(Typ::List(Typ::Unknown("Handle")));
  EXPECT_EQ(rendered.short_form, "list<unknown>");
  EXPECT_EQ(RenderType(Typ::Unknown("Handle")).full, "unknown");
}

// =============================================================================
// Function Signatures
// =============================================================================

TEST_F(SignatureTest, FormatSignatureWithResult) {
  auto fn = Function(
      "add-item",
      {{.name = "item", .typ = Typ::Record({Field("id", Typ::Str())})},
       {.name = "count", .typ = Typ::U32()}},
      {{.name = std::nullopt, .typ = Typ::Result(Typ::Str(), Typ::Str())}});
  auto sig = RenderFunction("golem:it/api", fn);

  EXPECT_EQ(sig.package, "golem:it/api");
  EXPECT_EQ(sig.display_name, "addItem");
  EXPECT_EQ(sig.wit_name, "add-item");
  EXPECT_EQ(
      FormatSignature(sig),
      "addItem(item: record, count: u32) => result<string, string>");
}

TEST_F(SignatureTest, FormatSignatureWithoutResult) {
  auto sig = RenderFunction("api", Function("reset", {}));
  EXPECT_FALSE(sig.result.has_value());
  EXPECT_EQ(FormatSignature(sig), "reset() => void");
}

TEST_F(SignatureTest, OnlyFirstResultIsShown) {
  auto fn = Function(
      "pair", {},
      {{.name = "a", .typ = Typ::U8()}, {.name = "b", .typ = Typ::Str()}});
  EXPECT_EQ(FormatSignature(RenderFunction("api", fn)), "pair() => u8");
}

TEST_F(SignatureTest, RenderExportsInDocumentOrder) {
  metadata::ComponentVersion version{
      .version = 1,
      .exports =
          {{.name = "a", .functions = {Function("one", {}), Function("two", {})}},
           {.name = "b", .functions = {Function("three", {})}}},
  };
  auto sigs = RenderExports(version);
  ASSERT_EQ(sigs.size(), 3U);
  EXPECT_EQ(sigs[0].wit_name, "one");
  EXPECT_EQ(sigs[1].wit_name, "two");
  EXPECT_EQ(sigs[2].package, "b");
}

TEST_F(SignatureTest, FilterIsCaseInsensitiveOnDisplayName) {
  std::vector<FunctionSignature> sigs = {
      RenderFunction("api", Function("add-item", {})),
      RenderFunction("api", Function("remove-item", {})),
      RenderFunction("api", Function("checkout", {})),
  };
  auto matches = FilterSignatures(sigs, "ITEM");
  ASSERT_EQ(matches.size(), 2U);
  EXPECT_EQ(matches[0].display_name, "addItem");
  EXPECT_EQ(matches[1].display_name, "removeItem");

  EXPECT_EQ(FilterSignatures(sigs, "").size(), 3U);
  EXPECT_TRUE(FilterSignatures(sigs, "missing").empty());
}

}  // namespace
}  // namespace witkit::render
