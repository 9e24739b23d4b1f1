// Copyright (c) 2025 <Your Name>
/**
 * @file error.hpp
 * @brief Error codes reported by the codec, transports and the sync engine.
 */
#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace ntpsync {

/** Failure categories. */
enum class ErrorCode {
  kNone,               ///< No error
  kMalformedPacket,    ///< Response shorter than the 48-byte header
  kServerRejected,     ///< Stratum 0 (kiss-of-death)
  kTimeout,            ///< No response within the configured timeout
  kHostUnresolvable,   ///< DNS resolution failed
  kIoError,            ///< Socket / HTTP / parse failure
  kNotInitialized,     ///< Global clock used before Initialize()
};

/** Returns a stable lowercase name for the code (for logging). */
const char* ToString(ErrorCode code);

/**
 * Error value: a code plus a human-readable message.
 */
struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;

  Error() = default;
  Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

  bool ok() const { return code == ErrorCode::kNone; }
};

inline bool operator==(const Error& a, const Error& b) {
  return a.code == b.code && a.message == b.message;
}

inline bool operator!=(const Error& a, const Error& b) { return !(a == b); }

/** Stream formatter for logging: "<code>: <message>". */
std::ostream& operator<<(std::ostream& os, const Error& e);

/** Stores an error into an optional out-parameter. */
inline void SetError(Error* err, ErrorCode code, const std::string& msg) {
  if (err) *err = Error(code, msg);
}

}  // namespace ntpsync
