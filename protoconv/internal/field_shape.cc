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

#include "protoconv/internal/field_shape.h"

#include "absl/strings/str_cat.h"

namespace protoconv::internal {

absl::string_view ValueKindName(ValueKind kind) {
  switch (kind) {
    case ValueKind::kScalar:
      return "scalar";
    case ValueKind::kEnum:
      return "enum";
    case ValueKind::kMessage:
      return "message";
    case ValueKind::kDynamicAny:
      return "any";
  }
  return "unknown";
}

absl::string_view CardinalityName(Cardinality cardinality) {
  switch (cardinality) {
    case Cardinality::kSingular:
      return "singular";
    case Cardinality::kRepeated:
      return "repeated";
    case Cardinality::kMap:
      return "map";
  }
  return "unknown";
}

bool IsAnyType(const google::protobuf::Descriptor* descriptor) {
  return descriptor != nullptr && descriptor->full_name() == kAnyFullName;
}

ValueKind ValueKindOf(const google::protobuf::FieldDescriptor* field) {
  switch (field->cpp_type()) {
    case google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE:
      return IsAnyType(field->message_type()) ? ValueKind::kDynamicAny : ValueKind::kMessage;
    case google::protobuf::FieldDescriptor::CPPTYPE_ENUM:
      return ValueKind::kEnum;
    default:
      return ValueKind::kScalar;
  }
}

FieldShape::FieldShape(const google::protobuf::FieldDescriptor* descriptor)
    : descriptor_(descriptor), value_(descriptor) {
  if (descriptor->is_map()) {
    cardinality_ = Cardinality::kMap;
    key_ = descriptor->message_type()->map_key();
    value_ = descriptor->message_type()->map_value();
  } else if (descriptor->is_repeated()) {
    cardinality_ = Cardinality::kRepeated;
  } else {
    cardinality_ = Cardinality::kSingular;
  }
  valueKind_ = ValueKindOf(value_);
}

std::string FieldShape::DebugString() const {
  std::string type;
  switch (valueKind_) {
    case ValueKind::kScalar:
      type = value_->type_name();
      break;
    case ValueKind::kEnum:
      type = absl::StrCat("enum ", value_->enum_type()->full_name());
      break;
    case ValueKind::kMessage:
    case ValueKind::kDynamicAny:
      type = absl::StrCat("message ", value_->message_type()->full_name());
      break;
  }
  if (cardinality_ == Cardinality::kMap) {
    return absl::StrCat("map<", key_->type_name(), ", ", type, ">");
  }
  if (cardinality_ == Cardinality::kRepeated) {
    return absl::StrCat("repeated ", type);
  }
  return type;
}

} // namespace protoconv::internal
