// Copyright (c) 2025 <Your Name>
#include "ntpsync/error.hpp"

namespace ntpsync {

const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNone:
      return "none";
    case ErrorCode::kMalformedPacket:
      return "malformed_packet";
    case ErrorCode::kServerRejected:
      return "server_rejected";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kHostUnresolvable:
      return "host_unresolvable";
    case ErrorCode::kIoError:
      return "io_error";
    case ErrorCode::kNotInitialized:
      return "not_initialized";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Error& e) {
  os << ToString(e.code);
  if (!e.message.empty()) os << ": " << e.message;
  return os;
}

}  // namespace ntpsync
