#include "dca/domain/error.hpp"

namespace dca {

// -----------------------------------------------------------------------------
// errorCodeToString: wire names used in IPC replies and telemetry
// -----------------------------------------------------------------------------
const char* errorCodeToString(ErrorCode code) {
  using E = ErrorCode;
  switch (code) {
    case E::InvalidSchedule:       return "InvalidSchedule";
    case E::InvalidConfiguration:  return "InvalidConfiguration";
    case E::OrderNotFound:         return "OrderNotFound";
    case E::NotOrderOwner:         return "NotOrderOwner";
    case E::TooEarly:              return "TooEarly";
    case E::PeriodEnded:           return "PeriodEnded";
    case E::PriceBelowMinimum:     return "PriceBelowMinimum";
    case E::PriceAboveMaximum:     return "PriceAboveMaximum";
    case E::InsufficientBalance:   return "InsufficientBalance";
    case E::CustodyTransferFailed: return "CustodyTransferFailed";
    case E::AlreadyInitialized:    return "AlreadyInitialized";
    case E::Unauthorized:          return "Unauthorized";
    case E::InsufficientFee:       return "InsufficientFee";
    case E::NotInitialized:        return "NotInitialized";
    case E::ExchangeRejected:      return "ExchangeRejected";
    case E::NothingToClaim:        return "NothingToClaim";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// isRetryable
// -----------------------------------------------------------------------------
bool isRetryable(ErrorCode code) {
  using E = ErrorCode;
  switch (code) {
    case E::TooEarly:
    case E::PriceBelowMinimum:
    case E::PriceAboveMaximum:
    case E::ExchangeRejected:
    case E::CustodyTransferFailed:
      return true;

    case E::InvalidSchedule:
    case E::InvalidConfiguration:
    case E::OrderNotFound:
    case E::NotOrderOwner:
    case E::PeriodEnded:
    case E::InsufficientBalance:
    case E::AlreadyInitialized:
    case E::Unauthorized:
    case E::InsufficientFee:
    case E::NotInitialized:
    case E::NothingToClaim:
      return false;
  }
  return false;
}

}  // namespace dca
