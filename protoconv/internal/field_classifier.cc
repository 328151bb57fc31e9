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

#include "absl/strings/str_cat.h"
#include "protoconv/internal/field_shape.h"

namespace protoconv::internal {
namespace {

Compatibility incompatible(std::string reason) {
  return Compatibility{CopyMode::kNone, std::move(reason)};
}

// Compares the value side of two fields of equal cardinality. For maps this is the entry value.
Compatibility checkValue(const FieldShape& source, const FieldShape& dest) {
  ValueKind sourceKind = source.value_kind();
  ValueKind destKind = dest.value_kind();
  if (sourceKind == ValueKind::kDynamicAny && destKind == ValueKind::kDynamicAny) {
    return {CopyMode::kPassThroughAny, ""};
  }
  if (sourceKind == ValueKind::kDynamicAny && destKind == ValueKind::kMessage) {
    // The boxed type is only known at runtime.
    return incompatible(absl::StrCat(
        "google.protobuf.Any is never converted automatically into ",
        dest.message_type()->full_name(),
        "; unpack it in a handler"));
  }
  if (sourceKind == ValueKind::kMessage && destKind == ValueKind::kDynamicAny) {
    return {CopyMode::kPackAny, ""};
  }
  if (sourceKind != destKind) {
    return incompatible(absl::StrCat(
        "kind mismatch: ", ValueKindName(sourceKind), " != ", ValueKindName(destKind)));
  }
  switch (sourceKind) {
    case ValueKind::kScalar:
      if (source.value()->type() != dest.value()->type()) {
        return incompatible(absl::StrCat(
            "type mismatch: ", source.value()->type_name(), " != ", dest.value()->type_name()));
      }
      break;
    case ValueKind::kEnum:
      if (source.enum_type() != dest.enum_type()) {
        return incompatible(absl::StrCat(
            "enum type mismatch: ",
            source.enum_type()->full_name(),
            " != ",
            dest.enum_type()->full_name()));
      }
      break;
    case ValueKind::kMessage:
      if (source.message_type() != dest.message_type()) {
        return incompatible(absl::StrCat(
            "message type mismatch: ",
            source.message_type()->full_name(),
            " != ",
            dest.message_type()->full_name()));
      }
      break;
    case ValueKind::kDynamicAny:
      break;
  }
  return {CopyMode::kCopy, ""};
}

} // namespace

absl::string_view FieldClassName(FieldClass fieldClass) {
  switch (fieldClass) {
    case FieldClass::kAuto:
      return "auto";
    case FieldClass::kHandled:
      return "handled";
    case FieldClass::kIgnored:
      return "ignored";
    case FieldClass::kUnresolved:
      return "unresolved";
  }
  return "unknown";
}

absl::string_view CopyModeName(CopyMode mode) {
  switch (mode) {
    case CopyMode::kNone:
      return "none";
    case CopyMode::kCopy:
      return "copy";
    case CopyMode::kPackAny:
      return "pack_any";
    case CopyMode::kPassThroughAny:
      return "pass_through_any";
  }
  return "unknown";
}

Compatibility CheckCompatibility(
    const google::protobuf::FieldDescriptor* source, const google::protobuf::FieldDescriptor* dest) {
  FieldShape sourceShape(source);
  FieldShape destShape(dest);
  if (sourceShape.cardinality() != destShape.cardinality()) {
    return incompatible(absl::StrCat(
        "cardinality mismatch: ",
        CardinalityName(sourceShape.cardinality()),
        " != ",
        CardinalityName(destShape.cardinality())));
  }
  if (sourceShape.cardinality() == Cardinality::kMap &&
      sourceShape.key()->type() != destShape.key()->type()) {
    return incompatible(absl::StrCat(
        "map key type mismatch: ",
        sourceShape.key()->type_name(),
        " != ",
        destShape.key()->type_name()));
  }
  return checkValue(sourceShape, destShape);
}

FieldClassification ClassifyField(
    const google::protobuf::FieldDescriptor* source,
    const google::protobuf::Descriptor* destSchema,
    const absl::flat_hash_set<std::string>& ignored,
    const absl::flat_hash_set<std::string>& handled) {
  FieldClassification result;
  result.source = source;
  result.dest = destSchema->FindFieldByName(source->name());
  if (ignored.contains(source->name())) {
    result.fieldClass = FieldClass::kIgnored;
    return result;
  }
  if (handled.contains(source->name())) {
    result.fieldClass = FieldClass::kHandled;
    return result;
  }
  if (const auto* oneof = source->real_containing_oneof(); oneof != nullptr) {
    // Which member is set is only known at runtime, so members are never copied silently.
    result.reason = absl::StrCat("member of oneof \"", oneof->name(), "\"");
    return result;
  }
  if (result.dest == nullptr) {
    result.reason = absl::StrCat("no field \"", source->name(), "\" in ", destSchema->full_name());
    return result;
  }
  Compatibility compat = CheckCompatibility(source, result.dest);
  if (!compat.ok()) {
    result.reason = std::move(compat.reason);
    return result;
  }
  result.fieldClass = FieldClass::kAuto;
  result.mode = compat.mode;
  return result;
}

} // namespace protoconv::internal
