// Ticket: 0004_configuration_rules

#ifndef MFG_CORE_CONFIGURATION_CONFIGURATION_RULE_HPP
#define MFG_CORE_CONFIGURATION_CONFIGURATION_RULE_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>

#include "mfg-core/src/Configuration/Configuration.hpp"

namespace mfg_core
{

enum class RuleKind : uint8_t
{
  Validation,
  ComponentSelection,
  Pricing,
  Compatibility
};

const char* toString(RuleKind kind);

// ============================================================================
// Rule predicates
// ============================================================================

/**
 * @brief Numeric parameter must lie within [min, max]
 *
 * Either bound may be open. An absent parameter passes unless required.
 */
struct RangeRule
{
  std::string parameter;
  std::optional<double> min;
  std::optional<double> max;
  bool required{false};
};

/**
 * @brief Numeric parameter must be a whole number within [min, max]
 */
struct CountRule
{
  std::string parameter;
  int64_t min{0};
  int64_t max{0};
  bool required{false};
};

/**
 * @brief When a feature is enabled, a parameter must lie within bounds
 *
 * e.g. lifter enabled requires basinCount <= 2. Passes when the feature is
 * absent or disabled, or when the parameter is absent.
 */
struct CompatibilityRule
{
  std::string feature;
  std::string parameter;
  std::optional<double> min;
  std::optional<double> max;
};

/**
 * @brief Enumerated option must take one of a fixed set of values
 */
struct AllowedValuesRule
{
  std::string option;
  std::set<std::string> allowed;
  bool required{false};
};

using RulePredicate =
  std::variant<RangeRule, CountRule, CompatibilityRule, AllowedValuesRule>;

/**
 * @brief Outcome of one predicate against one configuration
 */
struct RuleOutcome
{
  bool passed{true};
  std::string field;
  std::string detail;  // Generated description of the failure
};

RuleOutcome evaluate(const RulePredicate& predicate,
                     const ConfigurationSelection& selection);

// ============================================================================
// Rule
// ============================================================================

/**
 * @brief Applicability of a rule
 *
 * A rule with neither field set is global. Otherwise every set field must
 * match the configuration.
 */
struct RuleScope
{
  std::optional<std::string> assemblyId;
  std::optional<std::string> categoryId;

  [[nodiscard]] bool matches(const std::string& assembly,
                             const std::string& category) const;
};

struct ConfigurationRule
{
  std::string name;
  RuleKind kind{RuleKind::Validation};
  RuleScope scope;
  int priority{100};
  int executionOrder{0};
  bool isBlocking{true};
  bool isActive{true};
  RulePredicate predicate;
  std::string message;  // Overrides the generated detail when non-empty
};

}  // namespace mfg_core

#endif  // MFG_CORE_CONFIGURATION_CONFIGURATION_RULE_HPP
