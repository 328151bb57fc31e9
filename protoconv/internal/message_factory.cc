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

#include "protoconv/internal/message_factory.h"

#include "absl/strings/str_cat.h"

namespace protoconv::internal {

absl::StatusOr<const google::protobuf::Message*> FindPrototype(
    google::protobuf::MessageFactory* messageFactory,
    const google::protobuf::Descriptor* descriptor) {
  if (messageFactory == nullptr) {
    messageFactory = google::protobuf::MessageFactory::generated_factory();
  }
  const google::protobuf::Message* prototype = messageFactory->GetPrototype(descriptor);
  if (prototype == nullptr) {
    return absl::FailedPreconditionError(absl::StrCat(
        "no message prototype for ",
        descriptor->full_name(),
        "; set ConverterOptions::message_factory for non-generated types"));
  }
  return prototype;
}

void CopyAny(const google::protobuf::Message& from, google::protobuf::Message* to) {
  const auto* fromDesc = from.GetDescriptor();
  const auto* toDesc = to->GetDescriptor();
  if (fromDesc == toDesc) {
    to->CopyFrom(from);
    return;
  }
  const auto* fromReflection = from.GetReflection();
  const auto* toReflection = to->GetReflection();
  toReflection->SetString(
      to, toDesc->FindFieldByNumber(1), fromReflection->GetString(from, fromDesc->FindFieldByNumber(1)));
  toReflection->SetString(
      to, toDesc->FindFieldByNumber(2), fromReflection->GetString(from, fromDesc->FindFieldByNumber(2)));
}

std::string TypeNameFromUrl(const std::string& typeUrl) {
  auto pos = typeUrl.find_last_of('/');
  if (pos == std::string::npos) {
    return "";
  }
  return typeUrl.substr(pos + 1);
}

} // namespace protoconv::internal
