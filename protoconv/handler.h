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

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/message.h"

namespace protoconv {

/// Converts one or more source fields. Receives the full source message and the destination being
/// built. A non-OK status aborts the conversion and is returned to the caller of Convert.
using HandlerFunction =
    std::function<absl::Status(const google::protobuf::Message&, google::protobuf::Message*)>;

/// A custom conversion for a set of source fields.
///
/// The function is responsible for setting on the destination everything the listed fields
/// contribute. This is not verified after the handler returns. Handlers run once per conversion,
/// after all automatic copies, in the order they were registered.
struct FieldHandler {
  std::vector<std::string> field_names;
  HandlerFunction function;
};

/// Creates a FieldHandler from a function over generated message types. The handler fails with
/// INVALID_ARGUMENT if it is invoked with messages of other types. `fn` may return absl::Status or
/// void.
template <typename From, typename To, typename F>
FieldHandler MakeHandler(std::vector<std::string> fieldNames, F fn) {
  HandlerFunction function = [fn = std::move(fn)](
                                 const google::protobuf::Message& src,
                                 google::protobuf::Message* dest) -> absl::Status {
    const From* typedSrc = google::protobuf::DynamicCastToGenerated<From>(&src);
    To* typedDest = google::protobuf::DynamicCastToGenerated<To>(dest);
    if (typedSrc == nullptr || typedDest == nullptr) {
      return absl::InvalidArgumentError(absl::StrCat(
          "handler expects ",
          From::descriptor()->full_name(),
          " -> ",
          To::descriptor()->full_name(),
          ", got ",
          src.GetDescriptor()->full_name(),
          " -> ",
          dest->GetDescriptor()->full_name()));
    }
    if constexpr (std::is_void_v<std::invoke_result_t<const F&, const From&, To*>>) {
      fn(*typedSrc, typedDest);
      return absl::OkStatus();
    } else {
      return fn(*typedSrc, typedDest);
    }
  };
  return FieldHandler{std::move(fieldNames), std::move(function)};
}

} // namespace protoconv
