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

#include "google/protobuf/message.h"

namespace protoconv {

struct ConverterOptions {
  /// Creates destination instances. Defaults to the generated message factory; set a
  /// google::protobuf::DynamicMessageFactory for descriptors built at runtime. The factory must
  /// outlive the converter.
  google::protobuf::MessageFactory* message_factory = nullptr;

  /// Reject a oneof whose non-ignored members map onto more than one destination field or oneof,
  /// checked in both directions. Automatic copies into a single destination oneof are rejected
  /// regardless.
  bool strict_oneof_mapping = true;
};

} // namespace protoconv
