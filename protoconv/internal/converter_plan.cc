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

#include "protoconv/internal/converter_plan.h"

#include <algorithm>
#include <set>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "protoconv/errors.h"
#include "protoconv/internal/message_factory.h"
#include "spdlog/spdlog.h"

namespace protoconv::internal {
namespace {

// Appends `name` to `names` unless already present, keeping first-seen order.
void appendUnique(std::vector<std::string>& names, const std::string& name) {
  if (std::find(names.begin(), names.end(), name) == names.end()) {
    names.push_back(name);
  }
}

absl::Status checkIgnored(
    const google::protobuf::Descriptor* source,
    const std::vector<std::string>& ignoredFieldNames,
    absl::flat_hash_set<std::string>& ignored) {
  std::vector<std::string> missing;
  for (const auto& name : ignoredFieldNames) {
    if (source->FindFieldByName(name) == nullptr) {
      appendUnique(missing, name);
      continue;
    }
    ignored.insert(name);
  }
  if (!missing.empty()) {
    return SchemaMismatchError(
        absl::StrCat(
            "ignored fields do not exist in ",
            source->full_name(),
            ": ",
            absl::StrJoin(missing, ", ")),
        missing);
  }
  return absl::OkStatus();
}

absl::Status checkHandlers(
    const google::protobuf::Descriptor* source,
    const std::vector<FieldHandler>& handlers,
    absl::flat_hash_set<std::string>& handled) {
  std::vector<std::string> missing;
  std::vector<std::string> overlapping;
  for (size_t i = 0; i < handlers.size(); i++) {
    const auto& handler = handlers[i];
    if (handler.field_names.empty()) {
      return SchemaMismatchError(absl::StrCat("handler #", i, " claims no fields"), {});
    }
    if (!handler.function) {
      return SchemaMismatchError(
          absl::StrCat(
              "handler #", i, " for [", absl::StrJoin(handler.field_names, ", "), "] has no function"),
          handler.field_names);
    }
    absl::flat_hash_set<std::string> own;
    for (const auto& name : handler.field_names) {
      if (!own.insert(name).second) {
        continue;
      }
      if (source->FindFieldByName(name) == nullptr) {
        appendUnique(missing, name);
        continue;
      }
      if (!handled.insert(name).second) {
        appendUnique(overlapping, name);
      }
    }
  }
  if (!missing.empty()) {
    return SchemaMismatchError(
        absl::StrCat(
            "handled fields do not exist in ",
            source->full_name(),
            ": ",
            absl::StrJoin(missing, ", ")),
        missing);
  }
  if (!overlapping.empty()) {
    return SchemaMismatchError(
        absl::StrCat(
            "fields claimed by more than one handler: ", absl::StrJoin(overlapping, ", ")),
        overlapping);
  }
  return absl::OkStatus();
}

absl::Status checkCollisions(
    const google::protobuf::Descriptor* source,
    const absl::flat_hash_set<std::string>& ignored,
    const absl::flat_hash_set<std::string>& handled) {
  std::vector<std::string> both;
  for (int i = 0; i < source->field_count(); i++) {
    const std::string& name = source->field(i)->name();
    if (ignored.contains(name) && handled.contains(name)) {
      both.push_back(name);
    }
  }
  if (!both.empty()) {
    return SchemaMismatchError(
        absl::StrCat("fields are both ignored and handled: ", absl::StrJoin(both, ", ")), both);
  }
  return absl::OkStatus();
}

// Setting one member of a oneof clears the others, so at most one automatic copy may land in
// each destination oneof.
absl::Status checkAutoCopiesIntoOneof(
    const google::protobuf::Descriptor* dest, const std::vector<FieldClassification>& fields) {
  for (int i = 0; i < dest->real_oneof_decl_count(); i++) {
    const auto* oneof = dest->oneof_decl(i);
    std::vector<std::string> copied;
    for (const auto& classification : fields) {
      if (classification.fieldClass == FieldClass::kAuto &&
          classification.dest->real_containing_oneof() == oneof) {
        copied.push_back(classification.source->name());
      }
    }
    if (copied.size() > 1) {
      return SchemaMismatchError(
          absl::StrCat(
              "fields ",
              absl::StrJoin(copied, ", "),
              " would all be copied into oneof \"",
              oneof->name(),
              "\" of ",
              dest->full_name(),
              "; handle or ignore all but one of them"),
          copied);
    }
  }
  return absl::OkStatus();
}

} // namespace

absl::Status CheckOneofMapping(
    const google::protobuf::Descriptor* from,
    const google::protobuf::Descriptor* to,
    const absl::flat_hash_set<std::string>& ignored) {
  for (int i = 0; i < from->real_oneof_decl_count(); i++) {
    const auto* oneof = from->oneof_decl(i);
    std::set<std::string> targets;
    std::vector<std::string> members;
    for (int j = 0; j < oneof->field_count(); j++) {
      const auto* field = oneof->field(j);
      if (ignored.contains(field->name())) {
        continue;
      }
      const auto* counterpart = to->FindFieldByName(field->name());
      if (counterpart == nullptr) {
        continue;
      }
      members.push_back(field->name());
      if (const auto* destOneof = counterpart->real_containing_oneof(); destOneof != nullptr) {
        targets.insert(destOneof->name());
      } else {
        targets.insert(counterpart->name());
      }
    }
    if (targets.size() > 1) {
      return SchemaMismatchError(
          absl::StrCat(
              "oneof \"",
              oneof->name(),
              "\" in ",
              from->full_name(),
              " maps to more than one field of ",
              to->full_name(),
              " (",
              absl::StrJoin(targets, ", "),
              "); all of its members must be explicitly handled or ignored"),
          members);
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<std::unique_ptr<const ConverterPlan>> NewConverterPlan(
    const google::protobuf::Descriptor* source,
    const google::protobuf::Descriptor* dest,
    const std::vector<std::string>& ignoredFieldNames,
    std::vector<FieldHandler> handlers,
    const ConverterOptions& options) {
  if (source == nullptr || dest == nullptr) {
    return absl::InvalidArgumentError("source and destination descriptors are required");
  }

  absl::flat_hash_set<std::string> ignored;
  if (auto status = checkIgnored(source, ignoredFieldNames, ignored); !status.ok()) {
    return status;
  }
  absl::flat_hash_set<std::string> handled;
  if (auto status = checkHandlers(source, handlers, handled); !status.ok()) {
    return status;
  }
  if (auto status = checkCollisions(source, ignored, handled); !status.ok()) {
    return status;
  }

  auto plan = std::make_unique<ConverterPlan>();
  plan->source = source;
  plan->dest = dest;

  std::vector<std::string> unresolved;
  std::vector<std::string> details;
  for (int i = 0; i < source->field_count(); i++) {
    FieldClassification classification = ClassifyField(source->field(i), dest, ignored, handled);
    spdlog::debug(
        "protoconv: {} -> {}: field {} is {}{}",
        source->full_name(),
        dest->full_name(),
        classification.source->name(),
        std::string(FieldClassName(classification.fieldClass)),
        classification.reason.empty() ? "" : absl::StrCat(" (", classification.reason, ")"));
    if (classification.fieldClass == FieldClass::kUnresolved) {
      unresolved.push_back(classification.source->name());
      details.push_back(absl::StrCat(classification.source->name(), " (", classification.reason, ")"));
    }
    plan->fields.push_back(std::move(classification));
  }
  if (!unresolved.empty()) {
    spdlog::debug(
        "protoconv: {} -> {}: {} unresolved field(s)",
        source->full_name(),
        dest->full_name(),
        unresolved.size());
    return SchemaMismatchError(
        absl::StrCat(
            "fields of ",
            source->full_name(),
            " can't be automatically converted to ",
            dest->full_name(),
            ", must either be explicitly handled or explicitly ignored. Unhandled fields: ",
            absl::StrJoin(details, ", ")),
        unresolved);
  }

  if (auto status = checkAutoCopiesIntoOneof(dest, plan->fields); !status.ok()) {
    return status;
  }
  if (options.strict_oneof_mapping) {
    if (auto status = CheckOneofMapping(source, dest, ignored); !status.ok()) {
      return status;
    }
    if (auto status = CheckOneofMapping(dest, source, ignored); !status.ok()) {
      return status;
    }
  }

  auto prototype_or = FindPrototype(options.message_factory, dest);
  if (!prototype_or.ok()) {
    return prototype_or.status();
  }
  plan->destPrototype = prototype_or.value();

  for (const auto& classification : plan->fields) {
    if (classification.fieldClass == FieldClass::kAuto) {
      plan->copyRules.push_back(std::make_unique<FieldCopyRule>(
          classification.source, classification.dest, classification.mode));
    }
  }
  for (auto& handler : handlers) {
    plan->handlerRules.push_back(std::make_unique<HandlerRule>(std::move(handler)));
  }
  for (const auto& name : ignoredFieldNames) {
    appendUnique(plan->ignored, name);
  }

  spdlog::debug(
      "protoconv: built converter {} -> {} ({} auto, {} handler(s), {} ignored)",
      source->full_name(),
      dest->full_name(),
      plan->copyRules.size(),
      plan->handlerRules.size(),
      plan->ignored.size());
  return std::unique_ptr<const ConverterPlan>(std::move(plan));
}

} // namespace protoconv::internal
