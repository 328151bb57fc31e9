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
#include <utility>

#include "absl/status/status.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "protoconv/handler.h"
#include "protoconv/internal/field_classifier.h"

namespace protoconv::internal {

/// A single step of a conversion. Rules are immutable once built and may be applied concurrently.
class ConversionRule {
 public:
  ConversionRule() = default;
  virtual ~ConversionRule() = default;

  ConversionRule(const ConversionRule&) = delete;
  void operator=(const ConversionRule&) = delete;

  virtual absl::Status Apply(
      const google::protobuf::Message& src, google::protobuf::Message* dest) const = 0;

  /// A short description used in logs and error messages.
  [[nodiscard]] virtual std::string Describe() const = 0;
};

/// Copies one auto-convertible field. Singular fields are copied only when present, repeated
/// fields element by element in order, and map fields entry by entry. Errors are prefixed with
/// Describe().
class FieldCopyRule final : public ConversionRule {
 public:
  FieldCopyRule(
      const google::protobuf::FieldDescriptor* source,
      const google::protobuf::FieldDescriptor* dest,
      CopyMode mode)
      : source_(source), dest_(dest), mode_(mode) {}

  absl::Status Apply(
      const google::protobuf::Message& src, google::protobuf::Message* dest) const override;

  [[nodiscard]] std::string Describe() const override;

 private:
  const google::protobuf::FieldDescriptor* source_;
  const google::protobuf::FieldDescriptor* dest_;
  CopyMode mode_;

  absl::Status Copy(const google::protobuf::Message& src, google::protobuf::Message* dest) const;

  absl::Status ApplyMap(const google::protobuf::Message& src, google::protobuf::Message* dest) const;
};

/// Invokes a user handler. Errors it returns are tagged with the handler's field names.
class HandlerRule final : public ConversionRule {
 public:
  explicit HandlerRule(FieldHandler handler) : handler_(std::move(handler)) {}

  absl::Status Apply(
      const google::protobuf::Message& src, google::protobuf::Message* dest) const override;

  [[nodiscard]] std::string Describe() const override;

 private:
  FieldHandler handler_;
};

/// Copies a single value: the singular value of `sourceField` when `index` is -1, otherwise the
/// element at `index`. The value is set on `destField` if it is singular, or appended if it is
/// repeated.
absl::Status CopyValue(
    const google::protobuf::Message& src,
    const google::protobuf::FieldDescriptor* sourceField,
    int index,
    google::protobuf::Message* dest,
    const google::protobuf::FieldDescriptor* destField,
    CopyMode mode);

} // namespace protoconv::internal
