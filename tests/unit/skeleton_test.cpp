#include <gtest/gtest.h>

#include <string>

#include "witkit/common/indent.hpp"
#include "witkit/common/typ.hpp"
#include "witkit/common/value.hpp"
#include "witkit/metadata/component.hpp"
#include "witkit/skeleton/skeleton.hpp"
#include "witkit/wire/json.hpp"

namespace witkit::skeleton {
namespace {

class SkeletonTest : public ::testing::Test {
 protected:
  static auto Json(const Typ& typ) -> std::string {
    return wire::ToJson(BuildSkeleton(typ), common::FormatMode::kCompact);
  }
};

TEST_F(SkeletonTest, Primitives) {
  EXPECT_EQ(Json(Typ::Str()), R"("")");
  EXPECT_EQ(Json(Typ::Char()), R"("")");
  EXPECT_EQ(Json(Typ::Bool()), "false");
  EXPECT_EQ(Json(Typ::S8()), "0");
  EXPECT_EQ(Json(Typ::U64()), "0");
  EXPECT_EQ(Json(Typ::F32()), "0");
  EXPECT_EQ(Json(Typ::F64()), "0");
}

TEST_F(SkeletonTest, RecordPreservesFieldOrder) {
  auto value = BuildSkeleton(
      Typ::Record({Field("a", Typ::Str()), Field("b", Typ::U32())}));
  EXPECT_TRUE(
      value ==
      MakeMapping({{"a", MakeString("")}, {"b", MakeInteger(0)}}));
  EXPECT_EQ(
      Json(Typ::Record({Field("b", Typ::U32()), Field("a", Typ::Str())})),
      R"({"b":0,"a":""})");
}

TEST_F(SkeletonTest, Tuple) {
  EXPECT_TRUE(
      BuildSkeleton(Typ::Tuple({Typ::Str(), Typ::Bool()})) ==
      MakeSequence({MakeString(""), MakeBool(false)}));
  EXPECT_EQ(Json(Typ::Tuple({})), "[]");
}

TEST_F(SkeletonTest, ListIsAlwaysEmpty) {
  EXPECT_EQ(Json(Typ::List(Typ::Str())), "[]");
  EXPECT_EQ(Json(Typ::List(Typ::Record({Field("a", Typ::Str())}))), "[]");
}

TEST_F(SkeletonTest, OptionIsNull) {
  EXPECT_TRUE(IsNull(BuildSkeleton(Typ::Option(Typ::Str()))));
}

TEST_F(SkeletonTest, EnumHasNoPreselectedCase) {
  EXPECT_EQ(Json(Typ::Enum({"pending", "done"})), R"("")");
  EXPECT_EQ(Json(Typ::Enum({})), R"("")");
}

TEST_F(SkeletonTest, UnsupportedShapesAreNull) {
  EXPECT_EQ(Json(Typ::Result(Typ::Str(), Typ::Str())), "null");
  EXPECT_EQ(Json(Typ::Variant({Case("a", Typ::Str())})), "null");
  EXPECT_EQ(Json(Typ::Variant({})), "null");
  EXPECT_EQ(Json(Typ::Unknown("Handle")), "null");
}

TEST_F(SkeletonTest, EmptyRecord) {
  EXPECT_EQ(Json(Typ::Record({})), "{}");
}

TEST_F(SkeletonTest, NestedComposites) {
  auto typ = Typ::Record(
      {Field("id", Typ::U64()),
       Field("pos", Typ::Tuple({Typ::F32(), Typ::F32()})),
       Field("tags", Typ::List(Typ::Str())),
       Field("owner", Typ::Record({Field("name", Typ::Str())})),
       Field("note", Typ::Option(Typ::Str()))});
  EXPECT_EQ(
      Json(typ),
      R"({"id":0,"pos":[0,0],"tags":[],"owner":{"name":""},"note":null})");
}

TEST_F(SkeletonTest, IsDeterministic) {
  auto typ = Typ::Record(
      {Field("a", Typ::Tuple({Typ::Str(), Typ::Bool()})),
       Field("b", Typ::Enum({"x"}))});
  EXPECT_TRUE(BuildSkeleton(typ) == BuildSkeleton(typ));
}

TEST_F(SkeletonTest, ArgumentSkeletonFollowsParameterOrder) {
  metadata::ExportedFunction fn{
      .name = "update-item-quantity",
      .parameters =
          {{.name = "product-id", .typ = Typ::Str()},
           {.name = "quantity", .typ = Typ::U32()},
           {.name = "tags", .typ = Typ::List(Typ::Str())}},
      .results = {},
  };
  auto args = BuildArgumentSkeleton(fn);
  ASSERT_EQ(args.size(), 3U);
  EXPECT_TRUE(args[0] == MakeString(""));
  EXPECT_TRUE(args[1] == MakeInteger(0));
  EXPECT_TRUE(args[2] == MakeSequence({}));
}

TEST_F(SkeletonTest, NoParametersGivesEmptyArguments) {
  metadata::ExportedFunction fn{.name = "checkout", .parameters = {}, .results = {}};
  EXPECT_TRUE(BuildArgumentSkeleton(fn).empty());
}

}  // namespace
}  // namespace witkit::skeleton
