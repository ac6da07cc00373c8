// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_REPLAY_CASSETTE_ENGINE_HPP
#define REEL_REPLAY_CASSETTE_ENGINE_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <cassette.hpp>
#include <cassette_store.hpp>
#include <stub_handle.hpp>

#include "call_interceptor.hpp"
#include "engine_config.hpp"
#include "mode_manager.hpp"

namespace reel {
namespace replay {

/**
 * CassetteEngine runs record/replay sessions over a set of client stubs.
 *
 * At most one cassette is bound at a time. A session starts from IDLE and
 * returns to IDLE:
 *
 *   enter_recording(name)  bind an empty cassette, install recording on every stub
 *   exit_recording()       uninstall, return to IDLE, then save the cassette
 *   enter_playing(name)    load the cassette, bind it, install replay on every stub
 *   exit_playing()         uninstall, return to IDLE; nothing is written
 *
 * insert()/remove() and with_cassette() pick playing when the cassette file
 * exists and recording otherwise.
 *
 * Error behavior:
 * - entering while a session is active throws RunningError
 * - exiting while idle is a no-op; exiting the other kind of session throws
 *   RunningError
 * - a failed enter leaves the engine IDLE with every stub plain
 * - a failed save throws StorageError with the engine already IDLE
 * - configuration setters throw RunningError while a session is active
 *
 * Thread Safety:
 * - Session entry and exit are serialized by a session mutex
 * - Intercepted calls may run concurrently with each other and with exit;
 *   a call that reaches a recording interceptor after exit fails with
 *   NoActiveCassetteError
 * - Interceptors see the bound cassette through a weak reference, so a
 *   wrapper kept past the engine's lifetime fails the same way instead of
 *   touching the destroyed engine
 */
class CassetteEngine {
public:
  CassetteEngine();
  explicit CassetteEngine(EngineConfig config);

  /**
   * Ends an active session; errors are logged.
   */
  ~CassetteEngine();

  // Non-copyable
  CassetteEngine(const CassetteEngine&) = delete;
  CassetteEngine& operator=(const CassetteEngine&) = delete;

  // ==========================================================================
  // Configuration (RunningError while a session is active)
  // ==========================================================================

  void set_cassette_dir(std::string dir);
  void set_extension(std::string extension);
  void add_stub(std::shared_ptr<transport::StubHandle> stub);
  void reset_stubs();
  void ignore(const std::vector<std::string>& fields);

  /**
   * Snapshot of the current configuration.
   */
  EngineConfig config() const;

  // ==========================================================================
  // Sessions
  // ==========================================================================

  void enter_recording(const std::string& name);
  void exit_recording();

  void enter_playing(const std::string& name);
  void exit_playing();

  /**
   * Start a session: playing if the cassette exists, recording otherwise.
   */
  void insert(const std::string& name);

  /**
   * End whichever session is active. No-op when idle.
   */
  void remove();

  /**
   * Run `body` inside a session chosen as insert() does. The engine is back
   * to IDLE when this returns or throws. An exception from `body` propagates;
   * if ending the session also fails during that unwinding, the second error
   * is logged and the body's exception wins.
   */
  void with_cassette(const std::string& name, const std::function<void()>& body);

  /**
   * Remove every cassette file in the configured directory.
   *
   * @return Number of cassettes removed
   * @throws RunningError while a session is active
   */
  size_t delete_all_cassettes();

  bool cassette_exists(const std::string& name) const;

  Mode mode() const {
    return modes_.get_mode();
  }

  /**
   * The bound cassette, or nullptr when idle.
   */
  std::shared_ptr<cassette::Cassette> cassette() const;

private:
  // The *_locked methods and helpers below expect session_mutex_ held
  void enter_recording_locked(const std::string& name);
  void enter_playing_locked(const std::string& name);
  void exit_recording_locked();
  void exit_playing_locked();

  cassette::CassetteStore make_store() const;
  void ensure_idle(const char* action) const;
  void begin_session(
    std::vector<std::shared_ptr<transport::StubHandle>> stubs,
    std::unique_ptr<cassette::CassetteStore> store, std::shared_ptr<cassette::Cassette> active,
    const std::shared_ptr<CallInterceptor>& interceptor
  );
  std::shared_ptr<cassette::Cassette> end_session(Mode from);
  void uninstall_all();

  CassetteSource source() const;

  ModeManager modes_;

  mutable std::mutex session_mutex_;
  EngineConfig config_;
  std::vector<std::shared_ptr<transport::StubHandle>> session_stubs_;
  std::unique_ptr<cassette::CassetteStore> session_store_;

  // Read by interceptors on calling threads
  struct Binding {
    std::mutex mutex;
    std::shared_ptr<cassette::Cassette> cassette;
  };
  std::shared_ptr<Binding> binding_;
};

/**
 * RAII session: insert() on construction, remove() on destruction.
 * Errors during destruction are logged, not thrown.
 *
 * Usage:
 *   {
 *     ScopedCassette session(engine, "library/get_book");
 *     client.GetBook(...);
 *   }  // recorded cassette saved here
 */
class ScopedCassette {
public:
  ScopedCassette(CassetteEngine& engine, const std::string& name);
  ~ScopedCassette();

  // Non-copyable, non-movable
  ScopedCassette(const ScopedCassette&) = delete;
  ScopedCassette& operator=(const ScopedCassette&) = delete;
  ScopedCassette(ScopedCassette&&) = delete;
  ScopedCassette& operator=(ScopedCassette&&) = delete;

  /**
   * End the session now, letting errors (e.g. StorageError) propagate.
   */
  void finish();

private:
  CassetteEngine& engine_;
  bool finished_;
};

}  // namespace replay
}  // namespace reel

#endif  // REEL_REPLAY_CASSETTE_ENGINE_HPP
