#include "mfg-core/src/Errors/EngineError.hpp"

#include <utility>

#include <fmt/format.h>

namespace mfg_core
{

const char* toString(ErrorKind kind)
{
  switch (kind)
  {
    case ErrorKind::ValidationFailed:
      return "ValidationFailed";
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::Conflict:
      return "Conflict";
    case ErrorKind::InvalidTransition:
      return "InvalidTransition";
    case ErrorKind::Authorization:
      return "AuthorizationError";
  }
  return "Unknown";
}

EngineError EngineError::notFound(const std::string& entity, EntityId id)
{
  EngineError error;
  error.kind = ErrorKind::NotFound;
  error.message = fmt::format("{} {} not found", entity, id);
  return error;
}

EngineError EngineError::conflict(std::string message)
{
  EngineError error;
  error.kind = ErrorKind::Conflict;
  error.message = std::move(message);
  return error;
}

EngineError EngineError::authorization(std::string message)
{
  EngineError error;
  error.kind = ErrorKind::Authorization;
  error.message = std::move(message);
  return error;
}

EngineError EngineError::validationFailed(std::vector<ValidationIssue> errors)
{
  EngineError error;
  error.kind = ErrorKind::ValidationFailed;
  error.message = fmt::format("Configuration failed {} blocking rule(s)",
                              errors.size());
  if (!errors.empty())
  {
    error.ruleName = errors.front().ruleName;
    error.field = errors.front().field;
  }
  error.violations = std::move(errors);
  return error;
}

EngineError EngineError::invalidTransition(OrderPhase current,
                                           OrderPhase requested)
{
  EngineError error;
  error.kind = ErrorKind::InvalidTransition;
  error.message = fmt::format(
    "No transition from {} to {}", toString(current), toString(requested));
  error.currentPhase = current;
  error.requestedPhase = requested;
  return error;
}

std::string describe(const EngineError& error)
{
  std::string text = fmt::format("[{}] {}", toString(error.kind), error.message);
  if (!error.ruleName.empty())
  {
    text += fmt::format(" (rule {}", error.ruleName);
    if (!error.field.empty())
    {
      text += fmt::format(", field {}", error.field);
    }
    text += ")";
  }
  if (error.currentPhase && error.requestedPhase)
  {
    text += fmt::format(" [{} -> {}]",
                        toString(*error.currentPhase),
                        toString(*error.requestedPhase));
  }
  return text;
}

}  // namespace mfg_core
