// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_REPLAY_MODE_MANAGER_HPP
#define REEL_REPLAY_MODE_MANAGER_HPP

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace reel {
namespace replay {

/**
 * Mode represents what the engine does with intercepted calls.
 *
 * Mode transitions:
 * - IDLE -> RECORDING: a cassette is bound for recording
 * - IDLE -> PLAYING: a cassette is loaded and bound for replay
 * - RECORDING -> IDLE: interceptors removed, cassette saved
 * - PLAYING -> IDLE: interceptors removed
 */
enum class Mode {
  IDLE,       // No cassette bound, calls go to the live stubs
  RECORDING,  // Calls go to the live stubs and are recorded
  PLAYING     // Calls are answered from the cassette
};

/**
 * Convert Mode to string representation.
 */
inline std::string mode_to_string(Mode mode) {
  switch (mode) {
    case Mode::IDLE:
      return "idle";
    case Mode::RECORDING:
      return "recording";
    case Mode::PLAYING:
      return "playing";
    default:
      return "unknown";
  }
}

/**
 * Parse string to Mode.
 */
inline Mode string_to_mode(const std::string& str) {
  if (str == "idle") return Mode::IDLE;
  if (str == "recording") return Mode::RECORDING;
  if (str == "playing") return Mode::PLAYING;
  return Mode::IDLE;  // Default
}

/**
 * ModeTransitionCallback is called when a mode transition occurs.
 * Parameters: (from_mode, to_mode)
 */
using ModeTransitionCallback = std::function<void(Mode, Mode)>;

/**
 * ModeManager holds the engine mode and enforces the valid transitions.
 *
 * Callbacks are invoked after the transition, outside the internal lock,
 * so a callback may query the manager.
 */
class ModeManager {
public:
  ModeManager();

  // Non-copyable
  ModeManager(const ModeManager&) = delete;
  ModeManager& operator=(const ModeManager&) = delete;

  Mode get_mode() const;

  std::string get_mode_string() const;

  bool is_mode(Mode mode) const;

  /**
   * Check if a cassette session is active (RECORDING or PLAYING).
   */
  bool is_active() const;

  /**
   * Attempt a mode transition.
   *
   * @param to The target mode
   * @param error_msg Output error message if transition fails
   * @return true if transition was successful
   */
  bool transition_to(Mode to, std::string& error_msg);

  /**
   * Attempt a mode transition from a specific mode.
   * Verifies the current mode before transitioning.
   *
   * @param from Expected current mode
   * @param to Target mode
   * @param error_msg Output error message if transition fails
   * @return true if transition was successful
   */
  bool transition(Mode from, Mode to, std::string& error_msg);

  bool is_valid_transition(Mode from, Mode to) const;

  /**
   * Get list of valid transitions from the current mode.
   */
  std::vector<Mode> get_valid_transitions() const;

  /**
   * Register a callback invoked after each successful transition.
   */
  void register_transition_callback(ModeTransitionCallback callback);

  /**
   * Force the mode back to IDLE without notifying callbacks.
   */
  void reset();

private:
  void build_transition_map();

  void notify_transition(Mode from, Mode to);

  mutable std::mutex mutex_;
  Mode current_mode_;
  std::vector<ModeTransitionCallback> callbacks_;

  // from_mode -> [to_modes]
  std::unordered_map<Mode, std::vector<Mode>> valid_transitions_;
};

/**
 * ModeTransactionGuard rolls a mode transition back unless committed.
 *
 * Usage:
 *   if (!modes.transition(Mode::IDLE, Mode::PLAYING, error)) {
 *       throw RunningError(error);
 *   }
 *   ModeTransactionGuard guard(modes, Mode::IDLE);
 *   load_and_install();  // throws -> guard reverts to IDLE
 *   guard.commit();
 *
 * Thread Safety:
 * - The guard should be used from a single thread
 * - The underlying ModeManager is thread-safe
 */
class ModeTransactionGuard {
public:
  /**
   * @param mode_manager Reference to the mode manager
   * @param rollback_mode Mode to revert to if not committed
   */
  ModeTransactionGuard(ModeManager& mode_manager, Mode rollback_mode)
      : mode_manager_(mode_manager)
      , rollback_mode_(rollback_mode)
      , committed_(false) {}

  ~ModeTransactionGuard() {
    if (!committed_) {
      std::string error;
      if (!mode_manager_.transition_to(rollback_mode_, error)) {
        mode_manager_.reset();
      }
    }
  }

  void commit() {
    committed_ = true;
  }

  bool is_committed() const {
    return committed_;
  }

  Mode get_rollback_mode() const {
    return rollback_mode_;
  }

  // Non-copyable, non-movable
  ModeTransactionGuard(const ModeTransactionGuard&) = delete;
  ModeTransactionGuard& operator=(const ModeTransactionGuard&) = delete;
  ModeTransactionGuard(ModeTransactionGuard&&) = delete;
  ModeTransactionGuard& operator=(ModeTransactionGuard&&) = delete;

private:
  ModeManager& mode_manager_;
  Mode rollback_mode_;
  bool committed_;
};

}  // namespace replay
}  // namespace reel

#endif  // REEL_REPLAY_MODE_MANAGER_HPP
