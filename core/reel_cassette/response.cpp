// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "response.hpp"

#include "cassette_errors.hpp"

namespace reel {
namespace cassette {

Response::Response(std::string type, nlohmann::json result)
    : type_(std::move(type))
    , result_(std::move(result)) {}

Response Response::from_call_result(const transport::Message& result) {
  return Response(result.type, result.body);
}

transport::Message Response::to_call_result() const {
  return transport::Message(type_, result_);
}

Response Response::from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw CorruptCassetteError("response must be an object, got: " + j.dump());
  }
  auto type = j.find("type");
  if (type == j.end() || !type->is_string()) {
    throw CorruptCassetteError("response is missing a string \"type\": " + j.dump());
  }
  auto result = j.find("result");
  if (result == j.end()) {
    throw CorruptCassetteError("response is missing \"result\": " + j.dump());
  }
  return Response(type->get<std::string>(), *result);
}

nlohmann::json Response::to_json() const {
  return {{"type", type_}, {"result", result_}};
}

}  // namespace cassette
}  // namespace reel
