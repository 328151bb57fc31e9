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

#include "protoconv/errors.h"

#include "absl/strings/cord.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace protoconv {
namespace {

std::vector<std::string> splitPayload(const absl::Status& status, absl::string_view url) {
  auto payload = status.GetPayload(url);
  if (!payload.has_value()) {
    return {};
  }
  return absl::StrSplit(std::string(*payload), ',', absl::SkipEmpty());
}

} // namespace

absl::Status SchemaMismatchError(absl::string_view message, const std::vector<std::string>& fields) {
  absl::Status status = absl::FailedPreconditionError(message);
  status.SetPayload(kSchemaMismatchPayload, absl::Cord(absl::StrJoin(fields, ",")));
  return status;
}

absl::Status DynamicTypeMismatchError(absl::string_view boxedType, absl::string_view requestedType) {
  absl::Status status = absl::InvalidArgumentError(absl::StrCat(
      "cannot unpack Any holding \"", boxedType, "\" into \"", requestedType, "\""));
  status.SetPayload(
      kDynamicTypeMismatchPayload, absl::Cord(absl::StrCat(boxedType, ",", requestedType)));
  return status;
}

bool IsSchemaMismatchError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kFailedPrecondition &&
         status.GetPayload(kSchemaMismatchPayload).has_value();
}

bool IsDynamicTypeMismatchError(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInvalidArgument &&
         status.GetPayload(kDynamicTypeMismatchPayload).has_value();
}

std::vector<std::string> SchemaMismatchFields(const absl::Status& status) {
  if (!IsSchemaMismatchError(status)) {
    return {};
  }
  return splitPayload(status, kSchemaMismatchPayload);
}

std::vector<std::string> HandlerFieldsOf(const absl::Status& status) {
  return splitPayload(status, kHandlerFieldsPayload);
}

namespace internal {

absl::Status AnnotateHandlerError(absl::Status status, const std::vector<std::string>& fields) {
  if (status.ok()) {
    return status;
  }
  // Nested converters may already have tagged the status; the innermost handler wins.
  if (!status.GetPayload(kHandlerFieldsPayload).has_value()) {
    status.SetPayload(kHandlerFieldsPayload, absl::Cord(absl::StrJoin(fields, ",")));
  }
  return status;
}

} // namespace internal

} // namespace protoconv
