#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

enum class ErrorKind {
  INSUFFICIENT_DATA,
  INVALID_PROFILE,
  CONFIGURATION,
  SIMULATION_ABORTED
};

std::string to_string(ErrorKind kind);

// Which entity, which scope, what failed.
struct ErrorPayload {
  int entity_id = -1;
  std::string scope;
  std::string detail;
};

class HockeyError : public std::runtime_error {
public:
  HockeyError(ErrorKind kind, ErrorPayload payload);

  ErrorKind kind() const { return error_kind; }
  const ErrorPayload &payload() const { return error_payload; }

private:
  ErrorKind error_kind;
  ErrorPayload error_payload;
};

class InsufficientDataError : public HockeyError {
public:
  enum class Reason {
    EMPTY_SCOPE,  // the scoped population has records, this entity has none
    UNKNOWN_SCOPE // no records exist for the scope at all
  };

  InsufficientDataError(Reason reason, ErrorPayload payload);

  Reason reason() const { return data_reason; }

private:
  Reason data_reason;
};

class InvalidProfileError : public HockeyError {
public:
  explicit InvalidProfileError(ErrorPayload payload);
};

class ConfigurationError : public HockeyError {
public:
  explicit ConfigurationError(ErrorPayload payload);
  explicit ConfigurationError(const std::string &detail);
};

class SimulationAbortedError : public HockeyError {
public:
  SimulationAbortedError(int completed_trials, int requested_trials);

  int completed() const { return completed_trials; }
  int requested() const { return requested_trials; }

private:
  int completed_trials;
  int requested_trials;
};

#endif
