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

#include "absl/container/flat_hash_set.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/descriptor.h"

namespace protoconv::internal {

enum class FieldClass {
  kAuto,
  kHandled,
  kIgnored,
  kUnresolved,
};

/// How an auto-copyable field is copied.
enum class CopyMode {
  kNone,
  /// Same kind, cardinality and type on both sides.
  kCopy,
  /// Concrete message into google.protobuf.Any.
  kPackAny,
  /// google.protobuf.Any into google.protobuf.Any; the boxed type and bytes are kept.
  kPassThroughAny,
};

absl::string_view FieldClassName(FieldClass fieldClass);

absl::string_view CopyModeName(CopyMode mode);

/// The outcome of classifying one source field.
struct FieldClassification {
  const google::protobuf::FieldDescriptor* source = nullptr;
  /// The same-named destination field, when one exists.
  const google::protobuf::FieldDescriptor* dest = nullptr;
  FieldClass fieldClass = FieldClass::kUnresolved;
  CopyMode mode = CopyMode::kNone;
  /// Why the field is unresolved, empty otherwise.
  std::string reason;
};

/// Result of comparing a source field against a destination field for automatic copying.
struct Compatibility {
  CopyMode mode = CopyMode::kNone;
  std::string reason;

  [[nodiscard]] bool ok() const { return mode != CopyMode::kNone; }
};

/// Decides whether `source` can be copied into `dest` without user code. Oneof membership is not
/// considered here.
Compatibility CheckCompatibility(
    const google::protobuf::FieldDescriptor* source, const google::protobuf::FieldDescriptor* dest);

/// Classifies one source field. Rules apply in order: ignored, handled, oneof member (always
/// unresolved), then type compatibility against the destination field of the same name.
FieldClassification ClassifyField(
    const google::protobuf::FieldDescriptor* source,
    const google::protobuf::Descriptor* destSchema,
    const absl::flat_hash_set<std::string>& ignored,
    const absl::flat_hash_set<std::string>& handled);

} // namespace protoconv::internal
