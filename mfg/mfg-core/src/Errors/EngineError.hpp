#ifndef MFG_CORE_ERRORS_ENGINE_ERROR_HPP
#define MFG_CORE_ERRORS_ENGINE_ERROR_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mfg-catalog/src/AssemblyGraph.hpp"
#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"

namespace mfg_core
{

/// Cyclic or dangling catalog reference. Thrown, never returned.
using DataIntegrityError = mfg_catalog::DataIntegrityError;

/**
 * @brief Category of an expected business-rule failure
 *
 * InvalidTransition is a specialization of Conflict; isConflict() reports
 * both.
 */
enum class ErrorKind : uint8_t
{
  ValidationFailed,
  NotFound,
  Conflict,
  InvalidTransition,
  Authorization
};

const char* toString(ErrorKind kind);

/**
 * @brief One failing rule reported by configuration validation
 */
struct ValidationIssue
{
  std::string ruleName;
  std::string field;
  std::string message;
};

/**
 * @brief Structured failure returned inside every engine result
 *
 * Carries enough context (rule, field, phases) for the caller to act without
 * reading logs.
 */
struct EngineError
{
  ErrorKind kind{ErrorKind::Conflict};
  std::string message;
  std::string ruleName;
  std::string field;
  std::optional<OrderPhase> currentPhase;
  std::optional<OrderPhase> requestedPhase;
  std::vector<ValidationIssue> violations;

  [[nodiscard]] bool isConflict() const
  {
    return kind == ErrorKind::Conflict || kind == ErrorKind::InvalidTransition;
  }

  static EngineError notFound(const std::string& entity, EntityId id);
  static EngineError conflict(std::string message);
  static EngineError authorization(std::string message);
  static EngineError validationFailed(std::vector<ValidationIssue> errors);
  static EngineError invalidTransition(OrderPhase current, OrderPhase requested);
};

/// Single-line rendering for logs and CLI output
std::string describe(const EngineError& error);

}  // namespace mfg_core

#endif  // MFG_CORE_ERRORS_ENGINE_ERROR_HPP
