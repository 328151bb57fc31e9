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
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace protoconv {

/// Payload type URLs attached to statuses returned by this library. The payload of a
/// SchemaMismatchError holds the offending field names, comma separated. The payload of a
/// DynamicTypeMismatchError holds the boxed type name followed by the requested type name. The
/// HandlerFields payload is attached to errors returned by a handler and holds the field names the
/// handler claims.
inline constexpr absl::string_view kSchemaMismatchPayload = "protoconv.dev/SchemaMismatchError";
inline constexpr absl::string_view kDynamicTypeMismatchPayload =
    "protoconv.dev/DynamicTypeMismatchError";
inline constexpr absl::string_view kHandlerFieldsPayload = "protoconv.dev/HandlerFields";

/// Returns a FAILED_PRECONDITION status describing a construction-time mismatch between the
/// source and destination schemas. `fields` names the fields the caller has to ignore or handle.
absl::Status SchemaMismatchError(absl::string_view message, const std::vector<std::string>& fields);

/// Returns an INVALID_ARGUMENT status for an Any value whose boxed type does not match the type
/// it was unpacked into.
absl::Status DynamicTypeMismatchError(absl::string_view boxedType, absl::string_view requestedType);

[[nodiscard]] bool IsSchemaMismatchError(const absl::Status& status);

[[nodiscard]] bool IsDynamicTypeMismatchError(const absl::Status& status);

/// Returns the field names carried by a SchemaMismatchError, or an empty list for any other
/// status.
[[nodiscard]] std::vector<std::string> SchemaMismatchFields(const absl::Status& status);

/// Returns the claimed field names of the handler that produced `status`, or an empty list if the
/// status did not come from a handler.
[[nodiscard]] std::vector<std::string> HandlerFieldsOf(const absl::Status& status);

namespace internal {

/// Tags an error returned by a handler with the handler's field names. The code and message are
/// kept as returned.
absl::Status AnnotateHandlerError(absl::Status status, const std::vector<std::string>& fields);

} // namespace internal

} // namespace protoconv
