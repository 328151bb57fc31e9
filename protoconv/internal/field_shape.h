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

#pragma once

#include <string>

#include "absl/strings/string_view.h"
#include "google/protobuf/descriptor.h"

namespace protoconv::internal {

inline constexpr absl::string_view kAnyFullName = "google.protobuf.Any";

enum class ValueKind {
  kScalar,
  kEnum,
  kMessage,
  kDynamicAny,
};

enum class Cardinality {
  kSingular,
  kRepeated,
  kMap,
};

absl::string_view ValueKindName(ValueKind kind);

absl::string_view CardinalityName(Cardinality cardinality);

/// FieldShape projects a protobuf field descriptor onto the properties the classifier compares:
/// value kind, cardinality, type identity and oneof membership. For map fields, the value kind and
/// type identity describe the map value, and key() / value() give the entry's own fields.
class FieldShape {
 public:
  explicit FieldShape(const google::protobuf::FieldDescriptor* descriptor);

  [[nodiscard]] const google::protobuf::FieldDescriptor* descriptor() const { return descriptor_; }

  [[nodiscard]] const std::string& name() const { return descriptor_->name(); }

  [[nodiscard]] ValueKind value_kind() const { return valueKind_; }

  [[nodiscard]] Cardinality cardinality() const { return cardinality_; }

  /// The oneof this field is a member of, or nullptr. Synthetic oneofs generated for proto3
  /// `optional` fields are not unions and are not reported.
  [[nodiscard]] const google::protobuf::OneofDescriptor* oneof() const {
    return descriptor_->real_containing_oneof();
  }

  [[nodiscard]] bool in_oneof() const { return oneof() != nullptr; }

  /// The map entry key field; nullptr unless cardinality() is kMap.
  [[nodiscard]] const google::protobuf::FieldDescriptor* key() const { return key_; }

  /// The field that carries values: the map entry value field for maps, otherwise the field
  /// itself.
  [[nodiscard]] const google::protobuf::FieldDescriptor* value() const { return value_; }

  /// The message type of the value, for kMessage and kDynamicAny values; otherwise nullptr.
  [[nodiscard]] const google::protobuf::Descriptor* message_type() const {
    return value_->message_type();
  }

  /// The enum type of the value, for kEnum values; otherwise nullptr.
  [[nodiscard]] const google::protobuf::EnumDescriptor* enum_type() const {
    return value_->enum_type();
  }

  /// A short description such as "repeated message example.Topping" used in error messages.
  [[nodiscard]] std::string DebugString() const;

 private:
  const google::protobuf::FieldDescriptor* descriptor_;
  const google::protobuf::FieldDescriptor* key_ = nullptr;
  const google::protobuf::FieldDescriptor* value_;
  ValueKind valueKind_;
  Cardinality cardinality_;
};

[[nodiscard]] bool IsAnyType(const google::protobuf::Descriptor* descriptor);

[[nodiscard]] ValueKind ValueKindOf(const google::protobuf::FieldDescriptor* field);

} // namespace protoconv::internal
