// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cassette_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

#include "cassette_errors.hpp"

#define REEL_LOG_COMPONENT "cassette_store"
#include <reel_log_macros.hpp>

namespace reel {
namespace cassette {

namespace fs = std::filesystem;
using logging::kv;

std::string current_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&time, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return ss.str();
}

CassetteStore::CassetteStore(std::string directory, std::string extension)
    : directory_(std::move(directory))
    , extension_(std::move(extension)) {
  if (!extension_.empty() && extension_[0] != '.') {
    extension_.insert(extension_.begin(), '.');
  }
}

std::string CassetteStore::path_for(const std::string& name) const {
  return (fs::path(directory_) / (name + extension_)).string();
}

bool CassetteStore::exists(const std::string& name) const {
  std::error_code ec;
  return fs::is_regular_file(path_for(name), ec);
}

std::shared_ptr<Cassette> CassetteStore::create(const std::string& name) const {
  return std::make_shared<Cassette>(name, path_for(name));
}

std::shared_ptr<Cassette> CassetteStore::load(const std::string& name) const {
  const std::string path = path_for(name);

  if (!exists(name)) {
    throw CassetteNotFoundError("cassette not found: " + path);
  }

  std::ifstream file(path);
  if (!file.good()) {
    throw StorageError("cannot open cassette for reading: " + path);
  }

  nlohmann::json doc;
  try {
    file >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw CorruptCassetteError("cassette is not valid JSON: " + path + ": " + e.what());
  }

  if (!doc.is_object()) {
    throw CorruptCassetteError("cassette document must be an object: " + path);
  }

  auto version = doc.find("version");
  if (version == doc.end() || !version->is_number_integer()) {
    throw CorruptCassetteError("cassette has no integer \"version\": " + path);
  }
  // Read wide; narrowing would let e.g. 2^32 + 2 pass as version 2
  if (version->is_number_unsigned() &&
      version->get<std::uint64_t>() >
        static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw CorruptCassetteError(
      "cassette \"version\" out of range (" + version->dump() + "): " + path
    );
  }
  const auto found = version->get<std::int64_t>();
  if (found != kCassetteVersion) {
    throw VersionMismatchError(path, found, kCassetteVersion);
  }

  auto reqs = doc.find("reqs");
  if (reqs == doc.end() || !reqs->is_array()) {
    throw CorruptCassetteError("cassette has no \"reqs\" array: " + path);
  }

  std::vector<Entry> entries;
  entries.reserve(reqs->size());
  for (const auto& pair : *reqs) {
    if (!pair.is_array() || pair.size() != 2) {
      throw CorruptCassetteError("cassette entry must be a [request, response] pair: " + path);
    }
    entries.push_back(Entry{Request::from_json(pair[0]), Response::from_json(pair[1])});
  }

  std::string recorded_at;
  auto recorded = doc.find("recorded_at");
  if (recorded != doc.end() && recorded->is_string()) {
    recorded_at = recorded->get<std::string>();
  }

  REEL_LOG_DEBUG("cassette loaded" << kv("path", path) << kv("entries", entries.size()));
  return std::make_shared<Cassette>(name, path, std::move(entries), std::move(recorded_at));
}

void CassetteStore::save(Cassette& cassette) const {
  const fs::path target(cassette.path());
  const fs::path temp = target.string() + ".tmp";
  const std::string recorded_at = current_timestamp();

  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      throw StorageError(
        "cannot create cassette directory " + target.parent_path().string() + ": " + ec.message()
      );
    }
  }

  {
    std::ofstream out(temp, std::ios::out | std::ios::trunc);
    if (!out.good()) {
      throw StorageError("cannot open cassette for writing: " + temp.string());
    }
    out << cassette.to_document(recorded_at).dump(2) << '\n';
    out.flush();
    if (!out.good()) {
      out.close();
      fs::remove(temp, ec);
      throw StorageError("failed writing cassette: " + temp.string());
    }
  }

  fs::rename(temp, target, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(temp, cleanup_ec);
    throw StorageError("cannot replace cassette " + target.string() + ": " + ec.message());
  }

  cassette.set_recorded_at(recorded_at);
  REEL_LOG_INFO(
    "cassette saved" << kv("path", target.string()) << kv("entries", cassette.size())
  );
}

std::vector<std::string> CassetteStore::list() const {
  std::vector<std::string> names;

  std::error_code ec;
  if (!fs::is_directory(directory_, ec)) {
    return names;
  }

  for (const auto& entry : fs::directory_iterator(directory_, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == extension_) {
      names.push_back(entry.path().stem().string());
    }
  }
  if (ec) {
    throw StorageError("cannot list cassette directory " + directory_ + ": " + ec.message());
  }

  std::sort(names.begin(), names.end());
  return names;
}

bool CassetteStore::remove(const std::string& name) const {
  std::error_code ec;
  bool removed = fs::remove(path_for(name), ec);
  if (ec) {
    throw StorageError("cannot remove cassette " + path_for(name) + ": " + ec.message());
  }
  return removed;
}

size_t CassetteStore::delete_all() const {
  size_t removed = 0;
  for (const auto& name : list()) {
    if (remove(name)) {
      ++removed;
    }
  }
  REEL_LOG_INFO("deleted cassettes" << kv("dir", directory_) << kv("count", removed));
  return removed;
}

}  // namespace cassette
}  // namespace reel
