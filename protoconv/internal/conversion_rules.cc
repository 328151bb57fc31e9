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

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "protoconv/any.h"
#include "protoconv/errors.h"
#include "protoconv/internal/message_factory.h"
#include "spdlog/spdlog.h"

namespace protoconv::internal {
namespace {

// Reads a value from either a singular field (index == -1) or a repeated element, and writes it
// to either a singular field or a new repeated element.
#define PROTOCONV_COPY_SCALAR(GETTER, REPEATED_GETTER, SETTER, ADDER)             \
  {                                                                               \
    auto value = index < 0 ? srcReflection->GETTER(src, sourceField)              \
                           : srcReflection->REPEATED_GETTER(src, sourceField, index); \
    if (destField->is_repeated()) {                                               \
      destReflection->ADDER(dest, destField, std::move(value));                   \
    } else {                                                                      \
      destReflection->SETTER(dest, destField, std::move(value));                  \
    }                                                                             \
    return absl::OkStatus();                                                      \
  }

google::protobuf::Message* mutableTarget(
    google::protobuf::Message* dest, const google::protobuf::FieldDescriptor* destField) {
  if (destField->is_repeated()) {
    return dest->GetReflection()->AddMessage(dest, destField);
  }
  return dest->GetReflection()->MutableMessage(dest, destField);
}

} // namespace

absl::Status CopyValue(
    const google::protobuf::Message& src,
    const google::protobuf::FieldDescriptor* sourceField,
    int index,
    google::protobuf::Message* dest,
    const google::protobuf::FieldDescriptor* destField,
    CopyMode mode) {
  const auto* srcReflection = src.GetReflection();
  const auto* destReflection = dest->GetReflection();
  switch (sourceField->cpp_type()) {
    case google::protobuf::FieldDescriptor::CPPTYPE_INT32:
      PROTOCONV_COPY_SCALAR(GetInt32, GetRepeatedInt32, SetInt32, AddInt32)
    case google::protobuf::FieldDescriptor::CPPTYPE_INT64:
      PROTOCONV_COPY_SCALAR(GetInt64, GetRepeatedInt64, SetInt64, AddInt64)
    case google::protobuf::FieldDescriptor::CPPTYPE_UINT32:
      PROTOCONV_COPY_SCALAR(GetUInt32, GetRepeatedUInt32, SetUInt32, AddUInt32)
    case google::protobuf::FieldDescriptor::CPPTYPE_UINT64:
      PROTOCONV_COPY_SCALAR(GetUInt64, GetRepeatedUInt64, SetUInt64, AddUInt64)
    case google::protobuf::FieldDescriptor::CPPTYPE_FLOAT:
      PROTOCONV_COPY_SCALAR(GetFloat, GetRepeatedFloat, SetFloat, AddFloat)
    case google::protobuf::FieldDescriptor::CPPTYPE_DOUBLE:
      PROTOCONV_COPY_SCALAR(GetDouble, GetRepeatedDouble, SetDouble, AddDouble)
    case google::protobuf::FieldDescriptor::CPPTYPE_BOOL:
      PROTOCONV_COPY_SCALAR(GetBool, GetRepeatedBool, SetBool, AddBool)
    case google::protobuf::FieldDescriptor::CPPTYPE_STRING:
      PROTOCONV_COPY_SCALAR(GetString, GetRepeatedString, SetString, AddString)
    case google::protobuf::FieldDescriptor::CPPTYPE_ENUM:
      // Enum numbers are copied so that unknown values survive in open enums.
      PROTOCONV_COPY_SCALAR(GetEnumValue, GetRepeatedEnumValue, SetEnumValue, AddEnumValue)
    case google::protobuf::FieldDescriptor::CPPTYPE_MESSAGE: {
      const google::protobuf::Message& value = index < 0
          ? srcReflection->GetMessage(src, sourceField)
          : srcReflection->GetRepeatedMessage(src, sourceField, index);
      google::protobuf::Message* target = mutableTarget(dest, destField);
      switch (mode) {
        case CopyMode::kPackAny:
          return PackAny(value, target);
        case CopyMode::kPassThroughAny:
          CopyAny(value, target);
          return absl::OkStatus();
        case CopyMode::kCopy:
          target->CopyFrom(value);
          return absl::OkStatus();
        case CopyMode::kNone:
          break;
      }
      return absl::InternalError(
          absl::StrCat("no copy mode for message field ", sourceField->full_name()));
    }
  }
  return absl::InternalError(absl::StrCat("unsupported field type: ", sourceField->full_name()));
}

#undef PROTOCONV_COPY_SCALAR

absl::Status FieldCopyRule::Apply(
    const google::protobuf::Message& src, google::protobuf::Message* dest) const {
  auto status = Copy(src, dest);
  if (status.ok()) {
    return status;
  }
  spdlog::debug("protoconv: {} failed: {}", Describe(), status.ToString());
  absl::Status wrapped(status.code(), absl::StrCat(Describe(), ": ", status.message()));
  status.ForEachPayload([&wrapped](absl::string_view url, const absl::Cord& payload) {
    wrapped.SetPayload(url, payload);
  });
  return wrapped;
}

absl::Status FieldCopyRule::Copy(
    const google::protobuf::Message& src, google::protobuf::Message* dest) const {
  if (source_->is_map()) {
    return ApplyMap(src, dest);
  }
  const auto* reflection = src.GetReflection();
  if (!source_->is_repeated()) {
    if (!reflection->HasField(src, source_)) {
      return absl::OkStatus();
    }
    return CopyValue(src, source_, -1, dest, dest_, mode_);
  }
  int size = reflection->FieldSize(src, source_);
  for (int i = 0; i < size; i++) {
    if (auto status = CopyValue(src, source_, i, dest, dest_, mode_); !status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

absl::Status FieldCopyRule::ApplyMap(
    const google::protobuf::Message& src, google::protobuf::Message* dest) const {
  const auto* srcEntryDesc = source_->message_type();
  const auto* destEntryDesc = dest_->message_type();
  const auto* srcKey = srcEntryDesc->map_key();
  const auto* srcValue = srcEntryDesc->map_value();
  const auto* destKey = destEntryDesc->map_key();
  const auto* destValue = destEntryDesc->map_value();
  if (srcKey == nullptr || srcValue == nullptr || destKey == nullptr || destValue == nullptr) {
    return absl::InternalError("map entry missing key or value field");
  }
  const auto* reflection = src.GetReflection();
  int size = reflection->FieldSize(src, source_);
  for (int i = 0; i < size; i++) {
    const auto& srcEntry = reflection->GetRepeatedMessage(src, source_, i);
    google::protobuf::Message* destEntry = dest->GetReflection()->AddMessage(dest, dest_);
    if (auto status = CopyValue(srcEntry, srcKey, -1, destEntry, destKey, CopyMode::kCopy);
        !status.ok()) {
      return status;
    }
    if (auto status = CopyValue(srcEntry, srcValue, -1, destEntry, destValue, mode_);
        !status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

std::string FieldCopyRule::Describe() const {
  return absl::StrCat(source_->name(), " (", CopyModeName(mode_), ")");
}

absl::Status HandlerRule::Apply(
    const google::protobuf::Message& src, google::protobuf::Message* dest) const {
  auto status = handler_.function(src, dest);
  if (!status.ok()) {
    spdlog::debug(
        "protoconv: {} failed converting {}: {}",
        Describe(),
        src.GetDescriptor()->full_name(),
        status.ToString());
    return AnnotateHandlerError(std::move(status), handler_.field_names);
  }
  return absl::OkStatus();
}

std::string HandlerRule::Describe() const {
  return absl::StrCat("handler [", absl::StrJoin(handler_.field_names, ", "), "]");
}

} // namespace protoconv::internal
