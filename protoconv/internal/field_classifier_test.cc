// Copyright 2025 The protoconv Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "protoconv/internal/field_classifier.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "protoconv/internal/field_shape.h"
#include "protoconv/testdata/cases.pb.h"

namespace protoconv::internal {
namespace {

using ::testing::HasSubstr;
using testdata::AllKindsRecord;
using testdata::AllKindsView;
using testdata::BoxedRecord;
using testdata::BoxedView;
using testdata::ChoiceRecord;
using testdata::ChoiceView;
using testdata::MismatchRecord;
using testdata::MismatchView;
using testdata::ToppingRecord;
using testdata::ToppingView;
using testdata::UnboxedView;

const google::protobuf::FieldDescriptor* fieldOf(
    const google::protobuf::Descriptor* desc, const std::string& name) {
  const auto* field = desc->FindFieldByName(name);
  EXPECT_NE(field, nullptr) << desc->full_name() << " has no field " << name;
  return field;
}

FieldClassification classify(
    const google::protobuf::Descriptor* source,
    const google::protobuf::Descriptor* dest,
    const std::string& name,
    const absl::flat_hash_set<std::string>& ignored = {},
    const absl::flat_hash_set<std::string>& handled = {}) {
  return ClassifyField(fieldOf(source, name), dest, ignored, handled);
}

TEST(FieldShapeTest, Kinds) {
  const auto* desc = AllKindsRecord::descriptor();
  FieldShape text(fieldOf(desc, "text"));
  EXPECT_EQ(text.value_kind(), ValueKind::kScalar);
  EXPECT_EQ(text.cardinality(), Cardinality::kSingular);

  FieldShape colors(fieldOf(desc, "colors"));
  EXPECT_EQ(colors.value_kind(), ValueKind::kEnum);
  EXPECT_EQ(colors.cardinality(), Cardinality::kRepeated);

  FieldShape byId(fieldOf(desc, "toppings_by_id"));
  EXPECT_EQ(byId.value_kind(), ValueKind::kMessage);
  EXPECT_EQ(byId.cardinality(), Cardinality::kMap);
  EXPECT_EQ(byId.key()->type(), google::protobuf::FieldDescriptor::TYPE_INT32);
  EXPECT_EQ(byId.message_type(), testdata::Topping::descriptor());
  EXPECT_EQ(byId.DebugString(), "map<int32, message protoconv.testdata.Topping>");

  FieldShape boxed(fieldOf(BoxedRecord::descriptor(), "boxed_map"));
  EXPECT_EQ(boxed.value_kind(), ValueKind::kDynamicAny);
  EXPECT_EQ(boxed.cardinality(), Cardinality::kMap);
}

TEST(FieldShapeTest, ProtoThreeOptionalIsNotOneofMember) {
  FieldShape note(fieldOf(AllKindsRecord::descriptor(), "note"));
  EXPECT_FALSE(note.in_oneof());
  FieldShape a(fieldOf(ChoiceRecord::descriptor(), "a"));
  ASSERT_TRUE(a.in_oneof());
  EXPECT_EQ(a.oneof()->name(), "choice");
}

TEST(FieldClassifierTest, IdenticalFieldsAreAuto) {
  const auto* source = AllKindsRecord::descriptor();
  for (int i = 0; i < source->field_count(); i++) {
    auto result = ClassifyField(source->field(i), AllKindsView::descriptor(), {}, {});
    EXPECT_EQ(result.fieldClass, FieldClass::kAuto) << source->field(i)->name() << ": "
                                                    << result.reason;
    EXPECT_EQ(result.mode, CopyMode::kCopy) << source->field(i)->name();
  }
}

TEST(FieldClassifierTest, IgnoreTakesPriority) {
  auto result = classify(
      AllKindsRecord::descriptor(), AllKindsView::descriptor(), "text", {"text"}, {"text"});
  EXPECT_EQ(result.fieldClass, FieldClass::kIgnored);
  EXPECT_EQ(result.mode, CopyMode::kNone);
}

TEST(FieldClassifierTest, HandledBeforeCompatibility) {
  auto result =
      classify(MismatchRecord::descriptor(), MismatchView::descriptor(), "width", {}, {"width"});
  EXPECT_EQ(result.fieldClass, FieldClass::kHandled);
}

TEST(FieldClassifierTest, OneofMemberIsNeverAuto) {
  auto result = classify(ChoiceRecord::descriptor(), ChoiceView::descriptor(), "b");
  EXPECT_EQ(result.fieldClass, FieldClass::kUnresolved);
  EXPECT_THAT(result.reason, HasSubstr("oneof \"choice\""));
  ASSERT_NE(result.dest, nullptr);
  EXPECT_TRUE(CheckCompatibility(result.source, result.dest).ok());
}

TEST(FieldClassifierTest, MissingDestinationField) {
  auto result = classify(ChoiceRecord::descriptor(), ChoiceView::descriptor(), "a", {}, {});
  // Oneof membership is reported before the missing counterpart.
  EXPECT_EQ(result.fieldClass, FieldClass::kUnresolved);

  result = classify(
      testdata::TeaWithSellerRecord::descriptor(),
      testdata::TeaWithSellerView::descriptor(),
      "seller");
  EXPECT_EQ(result.fieldClass, FieldClass::kUnresolved);
  EXPECT_EQ(result.dest, nullptr);
  EXPECT_THAT(result.reason, HasSubstr("no field \"seller\""));
}

TEST(FieldClassifierTest, Mismatches) {
  const auto* source = MismatchRecord::descriptor();
  const auto* dest = MismatchView::descriptor();
  struct Case {
    std::string field;
    std::string reason;
  };
  std::vector<Case> cases = {
      {"width", "type mismatch: int32 != sint32"},
      {"labels", "cardinality mismatch: repeated != singular"},
      {"color", "enum type mismatch"},
      {"topping", "message type mismatch"},
      {"counts", "map key type mismatch: string != int64"},
      {"sizes", "type mismatch: int64 != string"},
  };
  for (const auto& tc : cases) {
    auto result = classify(source, dest, tc.field);
    EXPECT_EQ(result.fieldClass, FieldClass::kUnresolved) << tc.field;
    EXPECT_THAT(result.reason, HasSubstr(tc.reason)) << tc.field;
  }
}

TEST(FieldClassifierTest, MessageIntoAnyPacks) {
  for (const auto* name : {"topping", "toppings", "toppings_by_name"}) {
    auto result = classify(ToppingRecord::descriptor(), ToppingView::descriptor(), name);
    EXPECT_EQ(result.fieldClass, FieldClass::kAuto) << name << ": " << result.reason;
    EXPECT_EQ(result.mode, CopyMode::kPackAny) << name;
  }
}

TEST(FieldClassifierTest, AnyIntoAnyPassesThrough) {
  for (const auto* name : {"boxed", "boxed_list", "boxed_map"}) {
    auto result = classify(BoxedRecord::descriptor(), BoxedView::descriptor(), name);
    EXPECT_EQ(result.fieldClass, FieldClass::kAuto) << name << ": " << result.reason;
    EXPECT_EQ(result.mode, CopyMode::kPassThroughAny) << name;
  }
}

TEST(FieldClassifierTest, AnyIntoConcreteIsUnresolved) {
  for (const auto* name : {"boxed", "boxed_list", "boxed_map"}) {
    auto result = classify(BoxedRecord::descriptor(), UnboxedView::descriptor(), name);
    EXPECT_EQ(result.fieldClass, FieldClass::kUnresolved) << name;
    EXPECT_THAT(result.reason, HasSubstr("never converted automatically")) << name;
  }
}

TEST(FieldClassifierTest, PackRequiresSameCardinality) {
  auto result = classify(
      ToppingRecord::descriptor(), testdata::RepeatedToppingView::descriptor(), "toppings");
  EXPECT_EQ(result.fieldClass, FieldClass::kUnresolved);
  EXPECT_THAT(result.reason, HasSubstr("cardinality mismatch"));
}

TEST(FieldClassifierTest, ConcreteIntoAnyIsNotReversible) {
  auto result = classify(ToppingView::descriptor(), ToppingRecord::descriptor(), "topping");
  EXPECT_EQ(result.fieldClass, FieldClass::kUnresolved);
}

} // namespace
} // namespace protoconv::internal
