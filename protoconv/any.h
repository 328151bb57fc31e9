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

#include "absl/status/status.h"
#include "google/protobuf/message.h"

namespace protoconv {

/// Packs `value` into `any`, which must be a google.protobuf.Any message. Works for both generated
/// and dynamic Any messages.
absl::Status PackAny(const google::protobuf::Message& value, google::protobuf::Message* any);

/// Unpacks `any` into `out`. Returns a DynamicTypeMismatchError if the boxed type is not the type
/// of `out`, and INVALID_ARGUMENT if `any` is not an Any or its bytes do not parse.
///
/// This is the building block for handlers of Any -> concrete message fields, which are never
/// converted automatically.
absl::Status UnpackAny(const google::protobuf::Message& any, google::protobuf::Message* out);

} // namespace protoconv
