#pragma once

#include <stdexcept>
#include <string>

namespace dca {

// -----------------------------------------------------------------------------
// ErrorCode — every reason an engine operation can be refused
// -----------------------------------------------------------------------------
//
// @details
// Each operation checks its preconditions in a fixed order and throws
// OrderError with the first failing code. Nothing has been mutated when
// the exception leaves the engine, so callers may simply retry later for
// the retryable codes (see isRetryable()).
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidSchedule,        // Zero amount/duration, empty schedule, bad bounds
  InvalidConfiguration,   // Empty identities, bad pair, missing oracle
  OrderNotFound,
  NotOrderOwner,
  TooEarly,               // Frequency interval not yet elapsed
  PeriodEnded,            // now > end_time
  PriceBelowMinimum,
  PriceAboveMaximum,
  InsufficientBalance,
  CustodyTransferFailed,
  AlreadyInitialized,
  Unauthorized,           // Caller is not the agent / admin
  InsufficientFee,
  NotInitialized,
  ExchangeRejected,
  NothingToClaim,
};

const char* errorCodeToString(ErrorCode code);

// True when the same call may succeed later without any change by the
// caller (time passes, price moves, custody or exchange recovers).
bool isRetryable(ErrorCode code);

// -----------------------------------------------------------------------------
// OrderError
// -----------------------------------------------------------------------------
// Exception thrown by the order components and DcaEngine. what() carries a
// human-readable message; code() carries the machine-readable reason.
// -----------------------------------------------------------------------------
class OrderError : public std::runtime_error {
 public:
  OrderError(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

}  // namespace dca
