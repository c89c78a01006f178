// Ticket: 0004_configuration_rules

#ifndef MFG_CORE_CONFIGURATION_CONFIGURATION_VALIDATOR_HPP
#define MFG_CORE_CONFIGURATION_CONFIGURATION_VALIDATOR_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "mfg-core/src/Configuration/Configuration.hpp"
#include "mfg-core/src/Configuration/ConfigurationRule.hpp"

namespace mfg_core
{

/**
 * @brief Evaluates the ordered rule set against a configuration
 *
 * Applicable rules are the active rules whose scope matches the
 * configuration's assembly and category, run in ascending
 * (priority, executionOrder, name). Every applicable rule is evaluated; a
 * failure never stops the rest. Failing blocking rules go to errors and make
 * the result invalid; failing non-blocking rules go to warnings only.
 *
 * validate() depends only on its input and the rule set, so identical input
 * against an unchanged rule set yields an identical result.
 *
 * Thread Safety:
 *   validate() may run concurrently with addRule().
 */
class ConfigurationValidator
{
public:
  explicit ConfigurationValidator(
    std::vector<ConfigurationRule> rules = {},
    std::shared_ptr<spdlog::logger> logger = nullptr);

  ConfigurationValidator(const ConfigurationValidator&) = delete;
  ConfigurationValidator& operator=(const ConfigurationValidator&) = delete;

  /**
   * @brief Add a rule
   * @throws std::invalid_argument if a rule with the same name exists
   */
  void addRule(ConfigurationRule rule);

  /**
   * @brief Deactivate or reactivate a rule by name
   * @return false if no rule has that name
   */
  bool setRuleActive(const std::string& name, bool active);

  [[nodiscard]] ValidationResult validate(
    const Configuration& configuration) const;

  /// Rules that validate() would run for a scope, in evaluation order
  [[nodiscard]] std::vector<ConfigurationRule> applicableRules(
    const std::string& assemblyId,
    const std::string& categoryId) const;

  [[nodiscard]] size_t ruleCount() const;

private:
  mutable std::mutex mutex_;
  std::vector<ConfigurationRule> rules_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_CONFIGURATION_CONFIGURATION_VALIDATOR_HPP
