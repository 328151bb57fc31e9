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

#include <memory>
#include <string>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "protoconv/handler.h"
#include "protoconv/internal/conversion_rules.h"
#include "protoconv/internal/field_classifier.h"
#include "protoconv/options.h"

namespace protoconv::internal {

/// The validated configuration of a converter. Every source field is classified as exactly one of
/// auto, handled or ignored. Immutable after construction.
struct ConverterPlan {
  const google::protobuf::Descriptor* source = nullptr;
  const google::protobuf::Descriptor* dest = nullptr;
  const google::protobuf::Message* destPrototype = nullptr;
  std::vector<std::string> ignored;
  /// One entry per source field, in schema order.
  std::vector<FieldClassification> fields;
  /// Auto-copy rules in source schema order.
  std::vector<std::unique_ptr<FieldCopyRule>> copyRules;
  /// Handlers in registration order.
  std::vector<std::unique_ptr<HandlerRule>> handlerRules;
};

/// Validates the configuration and builds the plan. Fails with a SchemaMismatchError if an ignored
/// or handled name does not exist in the source schema, if handlers overlap, if a name is both
/// ignored and handled, or if any source field can be neither copied automatically nor is covered.
absl::StatusOr<std::unique_ptr<const ConverterPlan>> NewConverterPlan(
    const google::protobuf::Descriptor* source,
    const google::protobuf::Descriptor* dest,
    const std::vector<std::string>& ignoredFieldNames,
    std::vector<FieldHandler> handlers,
    const ConverterOptions& options);

/// Checks that the non-ignored members of each oneof in `from` map onto at most one field or
/// oneof of `to`.
absl::Status CheckOneofMapping(
    const google::protobuf::Descriptor* from,
    const google::protobuf::Descriptor* to,
    const absl::flat_hash_set<std::string>& ignored);

} // namespace protoconv::internal
