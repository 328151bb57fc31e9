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

#include "protoconv/internal/conversion_rules.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "google/protobuf/any.pb.h"
#include "gtest/gtest.h"
#include "protoconv/errors.h"
#include "protoconv/testdata/cases.pb.h"

namespace protoconv::internal {
namespace {

using ::testing::ElementsAre;
using testdata::AllKindsRecord;
using testdata::AllKindsView;

class FieldCopyRuleTest : public testing::Test {
 protected:
  std::unique_ptr<FieldCopyRule> rule(
      const google::protobuf::Descriptor* source,
      const google::protobuf::Descriptor* dest,
      const std::string& name,
      CopyMode mode = CopyMode::kCopy) {
    return std::make_unique<FieldCopyRule>(
        source->FindFieldByName(name), dest->FindFieldByName(name), mode);
  }
};

TEST_F(FieldCopyRuleTest, SingularScalar) {
  AllKindsRecord record;
  record.set_dbl(0.5);
  AllKindsView view;
  auto copy = rule(AllKindsRecord::descriptor(), AllKindsView::descriptor(), "dbl");
  ASSERT_TRUE(copy->Apply(record, &view).ok());
  EXPECT_EQ(view.dbl(), 0.5);
  EXPECT_EQ(copy->Describe(), "dbl (copy)");
}

TEST_F(FieldCopyRuleTest, RepeatedKeepsOrderAndAppends) {
  AllKindsRecord record;
  record.add_tags("z");
  record.add_tags("y");
  AllKindsView view;
  view.add_tags("existing");
  auto copy = rule(AllKindsRecord::descriptor(), AllKindsView::descriptor(), "tags");
  ASSERT_TRUE(copy->Apply(record, &view).ok());
  EXPECT_THAT(view.tags(), ElementsAre("existing", "z", "y"));
}

TEST_F(FieldCopyRuleTest, OpenEnumKeepsUnknownValues) {
  AllKindsRecord record;
  record.set_color(static_cast<testdata::Color>(42));
  record.add_colors(static_cast<testdata::Color>(43));
  AllKindsView view;
  ASSERT_TRUE(rule(AllKindsRecord::descriptor(), AllKindsView::descriptor(), "color")
                  ->Apply(record, &view)
                  .ok());
  ASSERT_TRUE(rule(AllKindsRecord::descriptor(), AllKindsView::descriptor(), "colors")
                  ->Apply(record, &view)
                  .ok());
  EXPECT_EQ(view.color(), 42);
  ASSERT_EQ(view.colors_size(), 1);
  EXPECT_EQ(view.colors(0), 43);
}

TEST_F(FieldCopyRuleTest, MapCopiesEveryEntry) {
  AllKindsRecord record;
  for (int i = 0; i < 10; i++) {
    (*record.mutable_toppings_by_id())[i].set_calories(i * 10);
  }
  AllKindsView view;
  auto copy = rule(AllKindsRecord::descriptor(), AllKindsView::descriptor(), "toppings_by_id");
  ASSERT_TRUE(copy->Apply(record, &view).ok());
  ASSERT_EQ(view.toppings_by_id().size(), 10);
  for (int i = 0; i < 10; i++) {
    EXPECT_EQ(view.toppings_by_id().at(i).calories(), i * 10);
  }
}

TEST_F(FieldCopyRuleTest, AbsentSingularIsSkipped) {
  AllKindsRecord record;
  AllKindsView view;
  auto copy = rule(AllKindsRecord::descriptor(), AllKindsView::descriptor(), "topping");
  ASSERT_TRUE(copy->Apply(record, &view).ok());
  EXPECT_FALSE(view.has_topping());
}

TEST_F(FieldCopyRuleTest, PackAnyMapValues) {
  testdata::ToppingRecord record;
  (*record.mutable_toppings_by_name())["a"].set_name("jelly");
  testdata::ToppingView view;
  auto copy = rule(
      testdata::ToppingRecord::descriptor(),
      testdata::ToppingView::descriptor(),
      "toppings_by_name",
      CopyMode::kPackAny);
  ASSERT_TRUE(copy->Apply(record, &view).ok());
  testdata::Topping unpacked;
  ASSERT_TRUE(view.toppings_by_name().at("a").UnpackTo(&unpacked));
  EXPECT_EQ(unpacked.name(), "jelly");
  EXPECT_EQ(copy->Describe(), "toppings_by_name (pack_any)");
}

TEST_F(FieldCopyRuleTest, ErrorsNameTheField) {
  // Packing needs an Any destination; AllKindsView.topping is a plain Topping.
  testdata::ToppingRecord record;
  record.mutable_topping()->set_name("jelly");
  AllKindsView view;
  FieldCopyRule copy(
      testdata::ToppingRecord::descriptor()->FindFieldByName("topping"),
      AllKindsView::descriptor()->FindFieldByName("topping"),
      CopyMode::kPackAny);
  auto status = copy.Apply(record, &view);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(std::string(status.message()), ::testing::StartsWith("topping (pack_any): "));
  EXPECT_THAT(status.message(), ::testing::HasSubstr("expected google.protobuf.Any"));
}

TEST(HandlerRuleTest, TagsErrors) {
  HandlerRule rule(FieldHandler{
      {"name", "price"},
      [](const google::protobuf::Message&, google::protobuf::Message*) {
        return absl::InternalError("boom");
      }});
  testdata::TeaRecord tea;
  testdata::TeaView view;
  auto status = rule.Apply(tea, &view);
  EXPECT_EQ(status.code(), absl::StatusCode::kInternal);
  EXPECT_EQ(status.message(), "boom");
  EXPECT_THAT(HandlerFieldsOf(status), ElementsAre("name", "price"));
  EXPECT_EQ(rule.Describe(), "handler [name, price]");
}

TEST(HandlerRuleTest, TypedHandlerRejectsWrongTypes) {
  auto handler = MakeHandler<testdata::TeaRecord, testdata::TeaView>(
      {"price"}, [](const testdata::TeaRecord&, testdata::TeaView*) {});
  testdata::TeaView wrongSource;
  testdata::TeaView view;
  auto status = handler.function(wrongSource, &view);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
}

} // namespace
} // namespace protoconv::internal
