// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "mode_manager.hpp"

#include <algorithm>

namespace reel {
namespace replay {

ModeManager::ModeManager()
    : current_mode_(Mode::IDLE) {
  build_transition_map();
}

void ModeManager::build_transition_map() {
  // A session always starts and ends at IDLE; there is no direct
  // RECORDING <-> PLAYING switch.
  valid_transitions_[Mode::IDLE] = {Mode::RECORDING, Mode::PLAYING};

  valid_transitions_[Mode::RECORDING] = {Mode::IDLE};

  valid_transitions_[Mode::PLAYING] = {Mode::IDLE};
}

Mode ModeManager::get_mode() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_mode_;
}

std::string ModeManager::get_mode_string() const {
  return mode_to_string(get_mode());
}

bool ModeManager::is_mode(Mode mode) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_mode_ == mode;
}

bool ModeManager::is_active() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_mode_ != Mode::IDLE;
}

bool ModeManager::is_valid_transition(Mode from, Mode to) const {
  auto it = valid_transitions_.find(from);
  if (it == valid_transitions_.end()) {
    return false;
  }

  const auto& valid_targets = it->second;
  return std::find(valid_targets.begin(), valid_targets.end(), to) != valid_targets.end();
}

bool ModeManager::transition_to(Mode to, std::string& error_msg) {
  Mode from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = current_mode_;

    if (!is_valid_transition(from, to)) {
      error_msg = "ERR_INVALID_STATE: Cannot transition from " + mode_to_string(from) + " to " +
                  mode_to_string(to);
      return false;
    }

    current_mode_ = to;
  }

  notify_transition(from, to);
  error_msg.clear();
  return true;
}

bool ModeManager::transition(Mode from, Mode to, std::string& error_msg) {
  {
    std::lock_guard<std::mutex> lock(mutex_);

    if (current_mode_ != from) {
      error_msg = "ERR_INVALID_STATE: Expected mode " + mode_to_string(from) +
                  " but current is " + mode_to_string(current_mode_);
      return false;
    }

    if (!is_valid_transition(from, to)) {
      error_msg = "ERR_INVALID_STATE: Cannot transition from " + mode_to_string(from) + " to " +
                  mode_to_string(to);
      return false;
    }

    current_mode_ = to;
  }

  notify_transition(from, to);
  error_msg.clear();
  return true;
}

std::vector<Mode> ModeManager::get_valid_transitions() const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = valid_transitions_.find(current_mode_);
  if (it == valid_transitions_.end()) {
    return {};
  }
  return it->second;
}

void ModeManager::register_transition_callback(ModeTransitionCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ModeManager::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  current_mode_ = Mode::IDLE;
}

void ModeManager::notify_transition(Mode from, Mode to) {
  std::vector<ModeTransitionCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = callbacks_;
  }
  for (const auto& callback : callbacks) {
    callback(from, to);
  }
}

}  // namespace replay
}  // namespace reel
