// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "request.hpp"

#include "cassette_errors.hpp"

namespace reel {
namespace cassette {

nlohmann::json strip_ignored(const nlohmann::json& value, const IgnoreSet& ignored) {
  if (value.is_object()) {
    nlohmann::json result = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      if (ignored.count(it.key()) != 0) {
        continue;
      }
      result[it.key()] = strip_ignored(it.value(), ignored);
    }
    return result;
  }

  if (value.is_array()) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& item : value) {
      result.push_back(strip_ignored(item, ignored));
    }
    return result;
  }

  return value;
}

Request::Request(std::string method, nlohmann::json args)
    : method_(std::move(method))
    , args_(std::move(args)) {}

Request Request::from_call(
  const std::string& method, const transport::Message& request,
  const transport::CallOptions& /*options*/
) {
  return Request(method, request.body);
}

Request Request::from_json(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw CorruptCassetteError("request must be an object, got: " + j.dump());
  }
  auto method = j.find("method");
  if (method == j.end() || !method->is_string()) {
    throw CorruptCassetteError("request is missing a string \"method\": " + j.dump());
  }
  auto args = j.find("args");
  if (args == j.end()) {
    throw CorruptCassetteError("request is missing \"args\": " + j.dump());
  }
  return Request(method->get<std::string>(), *args);
}

nlohmann::json Request::to_json() const {
  return {{"method", method_}, {"args", args_}};
}

bool Request::equals(const Request& a, const Request& b, const IgnoreSet& ignored) {
  if (a.method_ != b.method_) {
    return false;
  }
  if (ignored.empty()) {
    return a.args_ == b.args_;
  }
  return strip_ignored(a.args_, ignored) == strip_ignored(b.args_, ignored);
}

bool Request::operator==(const Request& other) const {
  return equals(*this, other, IgnoreSet{});
}

std::string Request::describe() const {
  return method_ + " " + args_.dump();
}

}  // namespace cassette
}  // namespace reel
