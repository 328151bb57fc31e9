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
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"
#include "protoconv/any.h"
#include "protoconv/errors.h"
#include "protoconv/handler.h"
#include "protoconv/internal/converter_plan.h"
#include "protoconv/options.h"

namespace protoconv {

using internal::CopyMode;
using internal::FieldClass;
using internal::FieldClassification;

class Converter;
class ConverterBuilder;

/// Create a converter from `source` to `dest`. This is the only way to obtain a Converter.
///
/// Fails with a SchemaMismatchError (FAILED_PRECONDITION) naming the offending fields if any
/// source field is neither auto-convertible, handled nor ignored, if an ignored or handled name
/// is not a source field, if two handlers claim the same field, if a field is both handled and
/// ignored, or if automatic copies would overwrite each other in a destination oneof.
absl::StatusOr<Converter> NewConverter(
    const google::protobuf::Descriptor* source,
    const google::protobuf::Descriptor* dest,
    const std::vector<std::string>& ignoredFieldNames = {},
    std::vector<FieldHandler> handlers = {},
    const ConverterOptions& options = {});

/// A converter copies a message of one type into a new message of another, mostly identical type.
///
/// Fields with the same name and a compatible type on both sides are copied automatically. Every
/// other source field must be claimed by a handler or ignored, otherwise construction fails. Oneof
/// members are never copied automatically.
///
/// Converters are immutable once built and Convert may be called concurrently from multiple
/// threads, as long as the registered handlers are themselves thread safe.
class Converter {
 public:
  /// Convert a message.
  ///
  /// Returns a new message of the destination type. If a handler fails, or `src` is not of the
  /// source type, the error is returned and no partial result is produced.
  absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Convert(
      const google::protobuf::Message& src) const;

  /// Convert a message into an existing destination message, which is cleared first. Useful from
  /// handlers that delegate a nested field to another converter. On error `dest` is left
  /// partially populated.
  absl::Status ConvertInto(
      const google::protobuf::Message& src, google::protobuf::Message* dest) const;

  [[nodiscard]] const google::protobuf::Descriptor* source_type() const { return plan_->source; }

  [[nodiscard]] const google::protobuf::Descriptor* dest_type() const { return plan_->dest; }

  /// The classification of every source field, in schema order.
  [[nodiscard]] const std::vector<FieldClassification>& fields() const { return plan_->fields; }

  /// The classification of the named source field, or nullptr if there is no such field.
  [[nodiscard]] const FieldClassification* field(const std::string& name) const;

  // Move only.
  Converter(const Converter&) = delete;
  Converter& operator=(const Converter&) = delete;
  Converter(Converter&&) = default;
  Converter& operator=(Converter&&) = default;

 private:
  friend absl::StatusOr<Converter> NewConverter(
      const google::protobuf::Descriptor* source,
      const google::protobuf::Descriptor* dest,
      const std::vector<std::string>& ignoredFieldNames,
      std::vector<FieldHandler> handlers,
      const ConverterOptions& options);

  std::unique_ptr<const internal::ConverterPlan> plan_;

  explicit Converter(std::unique_ptr<const internal::ConverterPlan> plan) noexcept
      : plan_(std::move(plan)) {}

  absl::Status Run(const google::protobuf::Message& src, google::protobuf::Message* dest) const;
};

/// Fluent construction of a Converter.
///
///   auto converter_or = ConverterBuilder(Src::descriptor(), Dst::descriptor())
///                           .Ignore({"seller"})
///                           .Handle({"price"}, priceFn)
///                           .Build();
class ConverterBuilder {
 public:
  ConverterBuilder(const google::protobuf::Descriptor* source, const google::protobuf::Descriptor* dest)
      : source_(source), dest_(dest) {}

  ConverterBuilder& Ignore(std::vector<std::string> fieldNames) {
    for (auto& name : fieldNames) {
      ignored_.push_back(std::move(name));
    }
    return *this;
  }

  ConverterBuilder& Handle(std::vector<std::string> fieldNames, HandlerFunction function) {
    handlers_.push_back(FieldHandler{std::move(fieldNames), std::move(function)});
    return *this;
  }

  ConverterBuilder& Handle(FieldHandler handler) {
    handlers_.push_back(std::move(handler));
    return *this;
  }

  ConverterBuilder& WithOptions(const ConverterOptions& options) {
    options_ = options;
    return *this;
  }

  [[nodiscard]] absl::StatusOr<Converter> Build() {
    return NewConverter(source_, dest_, ignored_, std::move(handlers_), options_);
  }

 private:
  const google::protobuf::Descriptor* source_;
  const google::protobuf::Descriptor* dest_;
  std::vector<std::string> ignored_;
  std::vector<FieldHandler> handlers_;
  ConverterOptions options_;
};

/// A Converter between two generated message types.
template <typename From, typename To>
class TypedConverter {
 public:
  static absl::StatusOr<TypedConverter> New(
      const std::vector<std::string>& ignoredFieldNames = {},
      std::vector<FieldHandler> handlers = {},
      const ConverterOptions& options = {}) {
    auto converter_or = NewConverter(
        From::descriptor(), To::descriptor(), ignoredFieldNames, std::move(handlers), options);
    if (!converter_or.ok()) {
      return converter_or.status();
    }
    return TypedConverter(std::move(converter_or).value());
  }

  absl::StatusOr<To> Convert(const From& src) const {
    To dest;
    if (auto status = converter_.ConvertInto(src, &dest); !status.ok()) {
      return status;
    }
    return dest;
  }

  absl::Status ConvertInto(const From& src, To* dest) const {
    return converter_.ConvertInto(src, dest);
  }

 private:
  Converter converter_;

  explicit TypedConverter(Converter converter) : converter_(std::move(converter)) {}
};

} // namespace protoconv
