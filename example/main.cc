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

#include <cstring>
#include <iostream>

#include "example/example.pb.h"
#include "protoconv/converter.h"
#include "spdlog/spdlog.h"

using example::v1::GreenTeaMilkTea;
using example::v1::MatchaMilkTea;
using example::v1::Topping;

namespace {

google::protobuf::Any packTopping(const std::string& name) {
  Topping topping;
  topping.set_name(name);
  google::protobuf::Any any;
  any.PackFrom(topping);
  return any;
}

} // namespace

int main(int argc, char** argv) {
  if (argc > 1 && std::strcmp(argv[1], "--verbose") == 0) {
    spdlog::set_level(spdlog::level::debug);
  }

  // Construct a converter: name and price are converted together, topping1 is unpacked from Any,
  // topping2 passes through as Any, topping3 is packed into Any and seller is copied.
  auto converter_or =
      protoconv::TypedConverter<MatchaMilkTea, GreenTeaMilkTea>::New(
          {},
          {protoconv::MakeHandler<MatchaMilkTea, GreenTeaMilkTea>(
               {"name", "price"},
               [](const MatchaMilkTea& src, GreenTeaMilkTea* dest) {
                 dest->set_name(src.name());
                 dest->set_price(static_cast<int64_t>(src.price()));
               }),
           protoconv::MakeHandler<MatchaMilkTea, GreenTeaMilkTea>(
               {"topping1"},
               [](const MatchaMilkTea& src, GreenTeaMilkTea* dest) {
                 return protoconv::UnpackAny(src.topping1(), dest->mutable_topping1());
               })});
  if (!converter_or.ok()) {
    std::cerr << "Failed to build converter: " << converter_or.status() << std::endl;
    return 1;
  }

  MatchaMilkTea matcha;
  matcha.set_name("matcha_milk_tea");
  matcha.set_price(10);
  matcha.set_seller("sellerA");
  *matcha.mutable_topping1() = packTopping("jelly");
  *matcha.mutable_topping2() = packTopping("taro");
  matcha.mutable_topping3()->set_name("chips");

  // Perform conversion
  auto result_or = converter_or->Convert(matcha);
  if (!result_or.ok()) {
    std::cerr << "Failed to convert message: " << result_or.status() << std::endl;
    return 1;
  }
  std::cout << result_or->DebugString() << std::endl;
  return 0;
}
