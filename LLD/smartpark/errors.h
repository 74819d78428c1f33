#ifndef SMARTPARK_ERRORS_H
#define SMARTPARK_ERRORS_H

#include <stdexcept>
#include <string>

namespace smartpark {

// Every failure the engine reports is local and recoverable; the caller
// decides how to present it.
enum class ErrorKind {
  NoCapacity,
  SlotUnavailable,
  SlotNotOccupied,
  InvalidTransaction,
  NotFound,
  NegativeDuration,
  InvalidInput,
  AlreadyParked,
  StorageFailure,
  ConfigError
};

const char* toString(ErrorKind kind);

class ParkingError : public std::runtime_error {
public:
  ParkingError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace smartpark

#endif // SMARTPARK_ERRORS_H
