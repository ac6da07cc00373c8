// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_LOG_MACROS_HPP
#define REEL_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

#include "reel_log_severity.hpp"

namespace reel {
namespace logging {

// Global severity logger type
typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Get the global logger instance.
 * Defined in reel_log_init.cpp
 */
logger_type& get_logger();

/**
 * Simple key-value formatter for structured logging.
 * Usage: REEL_LOG_INFO("cassette saved" << kv("entries", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

// Strings are quoted
template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace reel

// =============================================================================
// Component identification
// Define REEL_LOG_COMPONENT before including this header:
//
//   #define REEL_LOG_COMPONENT "cassette_store"
//   #include <reel_log_macros.hpp>
// =============================================================================
#ifndef REEL_LOG_COMPONENT
#define REEL_LOG_COMPONENT "reel"
#endif

// DEBUG logs are compiled out in release builds
#ifdef NDEBUG
#define REEL_LOG_ENABLE_DEBUG 0
#else
#define REEL_LOG_ENABLE_DEBUG 1
#endif

// =============================================================================
// Stream-based logging macros, component added as a message prefix.
// Usage: REEL_LOG_INFO("message" << kv("key", value));
// =============================================================================

#define REEL_LOG_DEBUG(msg)                                                                    \
  do {                                                                                         \
    if (REEL_LOG_ENABLE_DEBUG) {                                                               \
      BOOST_LOG_SEV(::reel::logging::get_logger(), ::reel::logging::severity_level::debug)     \
        << "[" << REEL_LOG_COMPONENT << "] " << msg;                                           \
    }                                                                                          \
  } while (0)

#define REEL_LOG_INFO(msg)                                                                     \
  do {                                                                                         \
    BOOST_LOG_SEV(::reel::logging::get_logger(), ::reel::logging::severity_level::info)        \
      << "[" << REEL_LOG_COMPONENT << "] " << msg;                                             \
  } while (0)

#define REEL_LOG_WARN(msg)                                                                     \
  do {                                                                                         \
    BOOST_LOG_SEV(::reel::logging::get_logger(), ::reel::logging::severity_level::warn)        \
      << "[" << REEL_LOG_COMPONENT << "] " << msg;                                             \
  } while (0)

#define REEL_LOG_ERROR(msg)                                                                    \
  do {                                                                                         \
    BOOST_LOG_SEV(::reel::logging::get_logger(), ::reel::logging::severity_level::error)       \
      << "[" << REEL_LOG_COMPONENT << "] " << msg;                                             \
  } while (0)

// =============================================================================
// Session context as scoped thread attributes, cleared when the scope exits.
// Usage: REEL_LOG_SCOPED_CONTEXT("get_book", "recording");
// =============================================================================
#define REEL_LOG_SCOPED_CONTEXT(cassette_val, mode_val)                                   \
  ::boost::log::scoped_attribute _reel_log_cassette_ctx = ::boost::log::add_scoped_thread_attribute( \
    "Cassette", ::boost::log::attributes::constant<std::string>(cassette_val)             \
  );                                                                                      \
  ::boost::log::scoped_attribute _reel_log_mode_ctx = ::boost::log::add_scoped_thread_attribute(     \
    "Mode", ::boost::log::attributes::constant<std::string>(mode_val)                     \
  );                                                                                      \
  (void)_reel_log_cassette_ctx;                                                           \
  (void)_reel_log_mode_ctx

// =============================================================================
// Count-based sampling: log the 1st, (n+1)th, (2n+1)th... occurrence at a call site.
// Usage: REEL_LOG_DEBUG_EVERY_N(100, "replayed" << kv("method", method));
// =============================================================================
#define REEL_LOG_DEBUG_EVERY_N(n, msg)                    \
  do {                                                    \
    static std::atomic<uint64_t> _reel_log_counter{0};    \
    if ((++_reel_log_counter % (n)) == 1) {               \
      REEL_LOG_DEBUG(msg);                                \
    }                                                     \
  } while (0)

#endif  // REEL_LOG_MACROS_HPP
