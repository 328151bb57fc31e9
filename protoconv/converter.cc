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

#include "protoconv/converter.h"

#include "absl/strings/str_cat.h"

namespace protoconv {

absl::Status Converter::Run(
    const google::protobuf::Message& src, google::protobuf::Message* dest) const {
  if (src.GetDescriptor() != plan_->source) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Provided source type [",
        src.GetDescriptor()->full_name(),
        "] doesn't match the converter's source type [",
        plan_->source->full_name(),
        "]"));
  }
  for (const auto& rule : plan_->copyRules) {
    if (auto status = rule->Apply(src, dest); !status.ok()) {
      return status;
    }
  }
  // Handlers see every automatically copied field already set.
  for (const auto& rule : plan_->handlerRules) {
    if (auto status = rule->Apply(src, dest); !status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<google::protobuf::Message>> Converter::Convert(
    const google::protobuf::Message& src) const {
  std::unique_ptr<google::protobuf::Message> dest(plan_->destPrototype->New());
  if (auto status = Run(src, dest.get()); !status.ok()) {
    return status;
  }
  return dest;
}

absl::Status Converter::ConvertInto(
    const google::protobuf::Message& src, google::protobuf::Message* dest) const {
  if (dest == nullptr) {
    return absl::InvalidArgumentError("destination message is null");
  }
  if (dest->GetDescriptor() != plan_->dest) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Provided destination type [",
        dest->GetDescriptor()->full_name(),
        "] doesn't match the converter's destination type [",
        plan_->dest->full_name(),
        "]"));
  }
  dest->Clear();
  return Run(src, dest);
}

const FieldClassification* Converter::field(const std::string& name) const {
  for (const auto& classification : plan_->fields) {
    if (classification.source->name() == name) {
      return &classification;
    }
  }
  return nullptr;
}

absl::StatusOr<Converter> NewConverter(
    const google::protobuf::Descriptor* source,
    const google::protobuf::Descriptor* dest,
    const std::vector<std::string>& ignoredFieldNames,
    std::vector<FieldHandler> handlers,
    const ConverterOptions& options) {
  auto plan_or =
      internal::NewConverterPlan(source, dest, ignoredFieldNames, std::move(handlers), options);
  if (!plan_or.ok()) {
    return plan_or.status();
  }
  return Converter(std::move(plan_or).value());
}

} // namespace protoconv
