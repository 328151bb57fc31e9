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

#include "protoconv/any.h"

#include "absl/strings/str_cat.h"
#include "protoconv/errors.h"
#include "protoconv/internal/field_shape.h"
#include "protoconv/internal/message_factory.h"

namespace protoconv {
namespace {

constexpr char kTypeUrlPrefix[] = "type.googleapis.com/";

struct AnyFields {
  const google::protobuf::FieldDescriptor* typeUrl;
  const google::protobuf::FieldDescriptor* value;
};

absl::Status anyFields(const google::protobuf::Descriptor* desc, AnyFields* fields) {
  if (!internal::IsAnyType(desc)) {
    return absl::InvalidArgumentError(
        absl::StrCat("expected google.protobuf.Any, got ", desc->full_name()));
  }
  fields->typeUrl = desc->FindFieldByNumber(1);
  fields->value = desc->FindFieldByNumber(2);
  if (fields->typeUrl == nullptr || fields->value == nullptr) {
    return absl::InternalError("google.protobuf.Any missing type_url or value field");
  }
  return absl::OkStatus();
}

} // namespace

absl::Status PackAny(const google::protobuf::Message& value, google::protobuf::Message* any) {
  AnyFields fields;
  if (auto status = anyFields(any->GetDescriptor(), &fields); !status.ok()) {
    return status;
  }
  std::string bytes;
  if (!value.SerializePartialToString(&bytes)) {
    return absl::InternalError(
        absl::StrCat("failed to serialize ", value.GetDescriptor()->full_name()));
  }
  const auto* reflection = any->GetReflection();
  reflection->SetString(
      any, fields.typeUrl, absl::StrCat(kTypeUrlPrefix, value.GetDescriptor()->full_name()));
  reflection->SetString(any, fields.value, std::move(bytes));
  return absl::OkStatus();
}

absl::Status UnpackAny(const google::protobuf::Message& any, google::protobuf::Message* out) {
  AnyFields fields;
  if (auto status = anyFields(any.GetDescriptor(), &fields); !status.ok()) {
    return status;
  }
  const auto* reflection = any.GetReflection();
  std::string boxed = internal::TypeNameFromUrl(reflection->GetString(any, fields.typeUrl));
  const std::string& requested = out->GetDescriptor()->full_name();
  if (boxed != requested) {
    return DynamicTypeMismatchError(boxed, requested);
  }
  out->Clear();
  if (!out->ParsePartialFromString(reflection->GetString(any, fields.value))) {
    return absl::InvalidArgumentError(absl::StrCat("could not parse Any value of type ", boxed));
  }
  return absl::OkStatus();
}

} // namespace protoconv
