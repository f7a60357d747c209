#include "../include/errors.h"
#include <sstream>
#include <utility>

namespace {

std::string compose_message(ErrorKind kind, const ErrorPayload &payload) {
  std::stringstream ss;
  ss << to_string(kind);
  if (payload.entity_id >= 0)
    ss << " [entity " << payload.entity_id << "]";
  if (!payload.scope.empty())
    ss << " [" << payload.scope << "]";
  if (!payload.detail.empty())
    ss << ": " << payload.detail;
  return ss.str();
}

} // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::INSUFFICIENT_DATA:
    return "InsufficientDataError";
  case ErrorKind::INVALID_PROFILE:
    return "InvalidProfileError";
  case ErrorKind::CONFIGURATION:
    return "ConfigurationError";
  case ErrorKind::SIMULATION_ABORTED:
    return "SimulationAbortedError";
  }
  return "HockeyError";
}

HockeyError::HockeyError(ErrorKind kind, ErrorPayload payload)
    : std::runtime_error(compose_message(kind, payload)), error_kind(kind),
      error_payload(std::move(payload)) {}

InsufficientDataError::InsufficientDataError(Reason reason,
                                             ErrorPayload payload)
    : HockeyError(ErrorKind::INSUFFICIENT_DATA, std::move(payload)),
      data_reason(reason) {}

InvalidProfileError::InvalidProfileError(ErrorPayload payload)
    : HockeyError(ErrorKind::INVALID_PROFILE, std::move(payload)) {}

ConfigurationError::ConfigurationError(ErrorPayload payload)
    : HockeyError(ErrorKind::CONFIGURATION, std::move(payload)) {}

ConfigurationError::ConfigurationError(const std::string &detail)
    : HockeyError(ErrorKind::CONFIGURATION, ErrorPayload{-1, "", detail}) {}

SimulationAbortedError::SimulationAbortedError(int completed, int requested)
    : HockeyError(ErrorKind::SIMULATION_ABORTED,
                  ErrorPayload{-1, "simulation",
                               "aborted after " + std::to_string(completed) +
                                   " of " + std::to_string(requested) +
                                   " trials"}),
      completed_trials(completed), requested_trials(requested) {}
