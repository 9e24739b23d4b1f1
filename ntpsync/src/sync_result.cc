// Copyright (c) 2025 <Your Name>
#include "ntpsync/sync_result.hpp"

#include <utility>

namespace ntpsync {

SyncResult SyncResult::Success(std::chrono::milliseconds offset,
                               std::chrono::milliseconds round_trip_delay,
                               std::string server_address) {
  SyncResult r;
  r.kind_ = Kind::kSuccess;
  r.offset_ = offset;
  r.round_trip_delay_ = round_trip_delay;
  r.server_address_ = std::move(server_address);
  return r;
}

SyncResult SyncResult::Failure(std::string error, std::optional<Error> cause) {
  SyncResult r;
  r.kind_ = Kind::kFailure;
  r.error_ = std::move(error);
  r.cause_ = std::move(cause);
  return r;
}

std::ostream& operator<<(std::ostream& os, const SyncResult& r) {
  if (r.IsSuccess()) {
    os << "success server=" << r.ServerAddress()
       << ", offset=" << r.Offset().count()
       << "ms, rtt=" << r.RoundTripDelay().count() << "ms";
  } else {
    os << "failure '" << r.ErrorMessage() << "'";
    if (r.Cause()) os << ", cause='" << *r.Cause() << "'";
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, const TimeSnapshot& s) {
  os << "now=" << s.epoch_millis << ", offset=" << s.offset.count()
     << "ms, sync=" << (s.synced ? "true" : "false");
  if (s.last_sync_time_millis) os << ", last_sync=" << *s.last_sync_time_millis;
  return os;
}

}  // namespace ntpsync
