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

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/message.h"

namespace protoconv::internal {

/// Looks up the prototype used to create zero-valued instances of `descriptor`. A null
/// `messageFactory` selects the generated factory.
absl::StatusOr<const google::protobuf::Message*> FindPrototype(
    google::protobuf::MessageFactory* messageFactory,
    const google::protobuf::Descriptor* descriptor);

/// Copies the boxed type URL and bytes of one Any message into another. Both messages must be
/// google.protobuf.Any, but may come from different descriptor pools.
void CopyAny(const google::protobuf::Message& from, google::protobuf::Message* to);

/// Extracts the fully qualified type name from an Any type URL ("type.googleapis.com/a.B" ->
/// "a.B"). Returns an empty string if the URL holds no '/'.
std::string TypeNameFromUrl(const std::string& typeUrl);

} // namespace protoconv::internal
