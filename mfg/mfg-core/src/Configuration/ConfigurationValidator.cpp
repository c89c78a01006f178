// Ticket: 0004_configuration_rules

#include "mfg-core/src/Configuration/ConfigurationValidator.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

#include "mfg-core/src/Logging.hpp"

namespace mfg_core
{

ConfigurationValidator::ConfigurationValidator(
  std::vector<ConfigurationRule> rules,
  std::shared_ptr<spdlog::logger> logger)
  : logger_{logger ? std::move(logger) : defaultLogger()}
{
  for (auto& rule : rules)
  {
    addRule(std::move(rule));
  }
}

void ConfigurationValidator::addRule(ConfigurationRule rule)
{
  std::lock_guard<std::mutex> lock{mutex_};
  auto duplicate = std::find_if(rules_.begin(),
                                rules_.end(),
                                [&rule](const ConfigurationRule& existing)
                                { return existing.name == rule.name; });
  if (duplicate != rules_.end())
  {
    throw std::invalid_argument("Duplicate configuration rule: " + rule.name);
  }
  rules_.push_back(std::move(rule));
}

bool ConfigurationValidator::setRuleActive(const std::string& name,
                                           bool active)
{
  std::lock_guard<std::mutex> lock{mutex_};
  for (auto& rule : rules_)
  {
    if (rule.name == name)
    {
      rule.isActive = active;
      return true;
    }
  }
  return false;
}

std::vector<ConfigurationRule> ConfigurationValidator::applicableRules(
  const std::string& assemblyId,
  const std::string& categoryId) const
{
  std::vector<ConfigurationRule> applicable;
  {
    std::lock_guard<std::mutex> lock{mutex_};
    for (const auto& rule : rules_)
    {
      if (rule.isActive && rule.scope.matches(assemblyId, categoryId))
      {
        applicable.push_back(rule);
      }
    }
  }

  // Names are unique, so this is a total order
  std::sort(applicable.begin(),
            applicable.end(),
            [](const ConfigurationRule& a, const ConfigurationRule& b)
            {
              return std::tie(a.priority, a.executionOrder, a.name) <
                     std::tie(b.priority, b.executionOrder, b.name);
            });
  return applicable;
}

ValidationResult ConfigurationValidator::validate(
  const Configuration& configuration) const
{
  ValidationResult result;

  for (const auto& rule :
       applicableRules(configuration.assemblyId, configuration.categoryId))
  {
    auto outcome = evaluate(rule.predicate, configuration.selection);
    if (outcome.passed)
    {
      continue;
    }

    ValidationIssue issue{rule.name,
                          outcome.field,
                          rule.message.empty() ? outcome.detail : rule.message};
    if (rule.isBlocking)
    {
      result.isValid = false;
      result.errors.push_back(std::move(issue));
    }
    else
    {
      result.warnings.push_back(std::move(issue));
    }
  }

  logger_->debug("Configuration {} v{}: {} error(s), {} warning(s)",
                 configuration.configurationId,
                 configuration.version,
                 result.errors.size(),
                 result.warnings.size());
  return result;
}

size_t ConfigurationValidator::ruleCount() const
{
  std::lock_guard<std::mutex> lock{mutex_};
  return rules_.size();
}

}  // namespace mfg_core
