// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cassette.hpp"

#include <algorithm>
#include <mutex>

namespace reel {
namespace cassette {

Cassette::Cassette(std::string name, std::string path)
    : name_(std::move(name))
    , path_(std::move(path)) {}

Cassette::Cassette(
  std::string name, std::string path, std::vector<Entry> entries, std::string recorded_at
)
    : name_(std::move(name))
    , path_(std::move(path))
    , entries_(std::move(entries))
    , recorded_at_(std::move(recorded_at)) {}

std::string Cassette::recorded_at() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return recorded_at_;
}

void Cassette::set_recorded_at(std::string recorded_at) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  recorded_at_ = std::move(recorded_at);
}

std::vector<Entry>::const_iterator Cassette::find_locked(
  const Request& request, const IgnoreSet& global_ignored
) const {
  IgnoreSet ignored = global_ignored;
  ignored.insert(session_ignored_.begin(), session_ignored_.end());

  return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& entry) {
    return Request::equals(entry.request, request, ignored);
  });
}

std::optional<Entry> Cassette::lookup(const Request& request, const IgnoreSet& global_ignored) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = find_locked(request, global_ignored);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return *it;
}

bool Cassette::contains(const Request& request, const IgnoreSet& global_ignored) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return find_locked(request, global_ignored) != entries_.end();
}

void Cassette::append(Request request, Response response) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.push_back(Entry{std::move(request), std::move(response)});
}

bool Cassette::append_if_absent(
  Request request, Response response, const IgnoreSet& global_ignored
) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (find_locked(request, global_ignored) != entries_.end()) {
    return false;
  }
  entries_.push_back(Entry{std::move(request), std::move(response)});
  return true;
}

std::vector<Entry> Cassette::entries() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_;
}

size_t Cassette::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

bool Cassette::empty() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.empty();
}

void Cassette::ignore(const std::vector<std::string>& fields) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  session_ignored_.insert(fields.begin(), fields.end());
}

IgnoreSet Cassette::session_ignored() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return session_ignored_;
}

nlohmann::json Cassette::to_document(const std::string& recorded_at) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);

  nlohmann::json reqs = nlohmann::json::array();
  for (const auto& entry : entries_) {
    reqs.push_back(nlohmann::json::array({entry.request.to_json(), entry.response.to_json()}));
  }

  nlohmann::json doc;
  doc["version"] = kCassetteVersion;
  doc["recorded_at"] = recorded_at;
  doc["reqs"] = std::move(reqs);
  return doc;
}

}  // namespace cassette
}  // namespace reel
