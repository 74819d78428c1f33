#include "smartpark/errors.h"

namespace smartpark {

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NoCapacity:         return "NoCapacity";
    case ErrorKind::SlotUnavailable:    return "SlotUnavailable";
    case ErrorKind::SlotNotOccupied:    return "SlotNotOccupied";
    case ErrorKind::InvalidTransaction: return "InvalidTransaction";
    case ErrorKind::NotFound:           return "NotFound";
    case ErrorKind::NegativeDuration:   return "NegativeDuration";
    case ErrorKind::InvalidInput:       return "InvalidInput";
    case ErrorKind::AlreadyParked:      return "AlreadyParked";
    case ErrorKind::StorageFailure:     return "StorageFailure";
    case ErrorKind::ConfigError:        return "ConfigError";
  }
  return "Unknown";
}

} // namespace smartpark
