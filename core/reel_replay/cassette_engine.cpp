// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cassette_engine.hpp"

#include <cassette_errors.hpp>

#define REEL_LOG_COMPONENT "engine"
#include <reel_log_macros.hpp>

namespace reel {
namespace replay {

using cassette::Cassette;
using cassette::CassetteStore;
using cassette::RunningError;
using logging::kv;

CassetteEngine::CassetteEngine()
    : CassetteEngine(EngineConfig()) {}

CassetteEngine::CassetteEngine(EngineConfig config)
    : config_(std::move(config))
    , binding_(std::make_shared<Binding>()) {
  modes_.register_transition_callback([](Mode from, Mode to) {
    REEL_LOG_DEBUG("mode changed" << kv("from", mode_to_string(from)) << kv("to", mode_to_string(to)));
  });
}

CassetteEngine::~CassetteEngine() {
  if (!modes_.is_active()) {
    return;
  }
  try {
    remove();
  } catch (const std::exception& e) {
    REEL_LOG_ERROR("failed to end cassette session on shutdown" << kv("error", e.what()));
  }
}

// ============================================================================
// Configuration
// ============================================================================

void CassetteEngine::set_cassette_dir(std::string dir) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  ensure_idle("configure the cassette dir");
  config_.set_cassette_dir(std::move(dir));
}

void CassetteEngine::set_extension(std::string extension) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  ensure_idle("configure the cassette extension");
  config_.set_extension(std::move(extension));
}

void CassetteEngine::add_stub(std::shared_ptr<transport::StubHandle> stub) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  ensure_idle("add a stub");
  config_.add_stub(std::move(stub));
}

void CassetteEngine::reset_stubs() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  ensure_idle("reset stubs");
  config_.reset_stubs();
}

void CassetteEngine::ignore(const std::vector<std::string>& fields) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  ensure_idle("change ignored fields");
  config_.ignore(fields);
}

EngineConfig CassetteEngine::config() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return config_;
}

void CassetteEngine::ensure_idle(const char* action) const {
  if (modes_.is_active()) {
    throw RunningError(
      std::string("cannot ") + action + " while " + modes_.get_mode_string() + " a cassette"
    );
  }
}

CassetteStore CassetteEngine::make_store() const {
  return CassetteStore(config_.cassette_dir(), config_.extension());
}

std::shared_ptr<Cassette> CassetteEngine::cassette() const {
  std::lock_guard<std::mutex> lock(binding_->mutex);
  return binding_->cassette;
}

CassetteSource CassetteEngine::source() const {
  std::weak_ptr<Binding> weak = binding_;
  return [weak]() -> std::shared_ptr<Cassette> {
    auto binding = weak.lock();
    if (!binding) {
      return nullptr;
    }
    std::lock_guard<std::mutex> lock(binding->mutex);
    return binding->cassette;
  };
}

// ============================================================================
// Sessions
// ============================================================================

void CassetteEngine::enter_recording(const std::string& name) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  enter_recording_locked(name);
}

void CassetteEngine::exit_recording() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  exit_recording_locked();
}

void CassetteEngine::enter_playing(const std::string& name) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  enter_playing_locked(name);
}

void CassetteEngine::exit_playing() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  exit_playing_locked();
}

void CassetteEngine::insert(const std::string& name) {
  std::lock_guard<std::mutex> lock(session_mutex_);
  ensure_idle(("insert cassette " + name).c_str());

  if (make_store().exists(name)) {
    enter_playing_locked(name);
  } else {
    enter_recording_locked(name);
  }
}

void CassetteEngine::remove() {
  std::lock_guard<std::mutex> lock(session_mutex_);

  switch (modes_.get_mode()) {
    case Mode::RECORDING:
      exit_recording_locked();
      break;
    case Mode::PLAYING:
      exit_playing_locked();
      break;
    case Mode::IDLE:
      REEL_LOG_DEBUG("remove called while idle, nothing to do");
      break;
  }
}

void CassetteEngine::with_cassette(const std::string& name, const std::function<void()>& body) {
  insert(name);

  try {
    body();
  } catch (...) {
    try {
      remove();
    } catch (const std::exception& e) {
      REEL_LOG_ERROR(
        "failed to end cassette session after error" << kv("cassette", name)
                                                     << kv("error", e.what())
      );
    }
    throw;
  }

  remove();
}

size_t CassetteEngine::delete_all_cassettes() {
  std::lock_guard<std::mutex> lock(session_mutex_);
  ensure_idle("delete cassettes");
  return make_store().delete_all();
}

bool CassetteEngine::cassette_exists(const std::string& name) const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return make_store().exists(name);
}

void CassetteEngine::enter_recording_locked(const std::string& name) {
  REEL_LOG_SCOPED_CONTEXT(name, "recording");

  std::string error;
  if (!modes_.transition(Mode::IDLE, Mode::RECORDING, error)) {
    throw RunningError("cannot start recording " + name + ": " + error);
  }
  ModeTransactionGuard guard(modes_, Mode::IDLE);

  auto stubs = config_.stubs();
  auto store = std::make_unique<CassetteStore>(make_store());
  auto fresh = store->create(name);
  const std::string path = fresh->path();

  begin_session(
    std::move(stubs), std::move(store), std::move(fresh),
    std::make_shared<RecordingInterceptor>(source(), config_.ignore_set())
  );
  guard.commit();

  REEL_LOG_INFO(
    "recording started" << kv("path", path) << kv("stubs", session_stubs_.size())
  );
}

void CassetteEngine::enter_playing_locked(const std::string& name) {
  REEL_LOG_SCOPED_CONTEXT(name, "playing");

  std::string error;
  if (!modes_.transition(Mode::IDLE, Mode::PLAYING, error)) {
    throw RunningError("cannot start playing " + name + ": " + error);
  }
  ModeTransactionGuard guard(modes_, Mode::IDLE);

  auto stubs = config_.stubs();
  auto store = std::make_unique<CassetteStore>(make_store());
  auto loaded = store->load(name);
  const size_t entries = loaded->size();

  begin_session(
    std::move(stubs), std::move(store), std::move(loaded),
    std::make_shared<PlayingInterceptor>(source(), config_.ignore_set())
  );
  guard.commit();

  REEL_LOG_INFO(
    "playing started" << kv("entries", entries) << kv("stubs", session_stubs_.size())
  );
}

void CassetteEngine::exit_recording_locked() {
  Mode current = modes_.get_mode();
  if (current == Mode::IDLE) {
    REEL_LOG_INFO("exit_recording called while idle, nothing to do");
    return;
  }
  if (current != Mode::RECORDING) {
    throw RunningError("cannot exit recording while " + mode_to_string(current));
  }

  auto store = std::move(session_store_);
  auto recorded = end_session(Mode::RECORDING);

  REEL_LOG_SCOPED_CONTEXT(recorded->name(), "recording");
  REEL_LOG_INFO("recording stopped" << kv("entries", recorded->size()));

  // Engine is already idle; a StorageError here leaves it that way
  store->save(*recorded);
}

void CassetteEngine::exit_playing_locked() {
  Mode current = modes_.get_mode();
  if (current == Mode::IDLE) {
    REEL_LOG_INFO("exit_playing called while idle, nothing to do");
    return;
  }
  if (current != Mode::PLAYING) {
    throw RunningError("cannot exit playing while " + mode_to_string(current));
  }

  auto played = end_session(Mode::PLAYING);

  REEL_LOG_SCOPED_CONTEXT(played->name(), "playing");
  REEL_LOG_INFO("playing stopped");
}

void CassetteEngine::begin_session(
  std::vector<std::shared_ptr<transport::StubHandle>> stubs,
  std::unique_ptr<CassetteStore> store, std::shared_ptr<Cassette> active,
  const std::shared_ptr<CallInterceptor>& interceptor
) {
  {
    std::lock_guard<std::mutex> lock(binding_->mutex);
    binding_->cassette = std::move(active);
  }
  session_store_ = std::move(store);
  session_stubs_.clear();

  auto wrap = [&interceptor](std::shared_ptr<transport::IClientStub> original) {
    return std::make_shared<InterceptingStub>(std::move(original), interceptor);
  };

  try {
    for (auto& stub : stubs) {
      if (stub->install(wrap)) {
        session_stubs_.push_back(std::move(stub));
      } else {
        REEL_LOG_WARN("stub already intercepted, left as is" << kv("stub", stub->name()));
      }
    }
  } catch (...) {
    end_session(modes_.get_mode());
    throw;
  }
}

std::shared_ptr<Cassette> CassetteEngine::end_session(Mode from) {
  uninstall_all();
  session_store_.reset();

  std::shared_ptr<Cassette> active;
  {
    std::lock_guard<std::mutex> lock(binding_->mutex);
    active = std::move(binding_->cassette);
    binding_->cassette.reset();
  }

  std::string error;
  if (from != Mode::IDLE && !modes_.transition(from, Mode::IDLE, error)) {
    REEL_LOG_ERROR("forcing engine idle" << kv("error", error));
    modes_.reset();
  }
  return active;
}

void CassetteEngine::uninstall_all() {
  for (const auto& stub : session_stubs_) {
    stub->uninstall();
  }
  session_stubs_.clear();
}

// ============================================================================
// ScopedCassette
// ============================================================================

ScopedCassette::ScopedCassette(CassetteEngine& engine, const std::string& name)
    : engine_(engine)
    , finished_(false) {
  engine_.insert(name);
}

ScopedCassette::~ScopedCassette() {
  if (finished_) {
    return;
  }
  try {
    engine_.remove();
  } catch (const std::exception& e) {
    REEL_LOG_ERROR("failed to end scoped cassette session" << kv("error", e.what()));
  }
}

void ScopedCassette::finish() {
  finished_ = true;
  engine_.remove();
}

}  // namespace replay
}  // namespace reel
