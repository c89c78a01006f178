// Ticket: 0004_configuration_rules

#include "mfg-core/src/Configuration/ConfigurationRule.hpp"

#include <cmath>

#include <fmt/format.h>

namespace mfg_core
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::optional<double> lookup(const std::map<std::string, double>& values,
                             const std::string& key)
{
  auto it = values.find(key);
  if (it == values.end())
  {
    return std::nullopt;
  }
  return it->second;
}

bool withinBounds(double value,
                  const std::optional<double>& min,
                  const std::optional<double>& max)
{
  return (!min || value >= *min) && (!max || value <= *max);
}

std::string describeBounds(const std::optional<double>& min,
                           const std::optional<double>& max)
{
  if (min && max)
  {
    return fmt::format("[{}, {}]", *min, *max);
  }
  if (min)
  {
    return fmt::format(">= {}", *min);
  }
  if (max)
  {
    return fmt::format("<= {}", *max);
  }
  return "any value";
}

RuleOutcome missing(const std::string& field)
{
  return RuleOutcome{false, field, fmt::format("{} is required", field)};
}

}  // namespace

const char* toString(RuleKind kind)
{
  switch (kind)
  {
    case RuleKind::Validation:
      return "VALIDATION";
    case RuleKind::ComponentSelection:
      return "COMPONENT_SELECTION";
    case RuleKind::Pricing:
      return "PRICING";
    case RuleKind::Compatibility:
      return "COMPATIBILITY";
  }
  return "UNKNOWN";
}

bool RuleScope::matches(const std::string& assembly,
                        const std::string& category) const
{
  if (assemblyId && *assemblyId != assembly)
  {
    return false;
  }
  if (categoryId && *categoryId != category)
  {
    return false;
  }
  return true;
}

RuleOutcome evaluate(const RulePredicate& predicate,
                     const ConfigurationSelection& selection)
{
  return std::visit(
    Overloaded{
      [&selection](const RangeRule& rule) -> RuleOutcome
      {
        auto value = lookup(selection.parameters, rule.parameter);
        if (!value)
        {
          return rule.required ? missing(rule.parameter)
                               : RuleOutcome{true, rule.parameter, {}};
        }
        if (withinBounds(*value, rule.min, rule.max))
        {
          return RuleOutcome{true, rule.parameter, {}};
        }
        return RuleOutcome{false,
                           rule.parameter,
                           fmt::format("{} = {} must be {}",
                                       rule.parameter,
                                       *value,
                                       describeBounds(rule.min, rule.max))};
      },
      [&selection](const CountRule& rule) -> RuleOutcome
      {
        auto value = lookup(selection.parameters, rule.parameter);
        if (!value)
        {
          return rule.required ? missing(rule.parameter)
                               : RuleOutcome{true, rule.parameter, {}};
        }
        bool const whole = std::floor(*value) == *value;
        auto const min = static_cast<double>(rule.min);
        auto const max = static_cast<double>(rule.max);
        if (whole && *value >= min && *value <= max)
        {
          return RuleOutcome{true, rule.parameter, {}};
        }
        return RuleOutcome{false,
                           rule.parameter,
                           fmt::format("{} = {} must be a whole number in "
                                       "[{}, {}]",
                                       rule.parameter,
                                       *value,
                                       rule.min,
                                       rule.max)};
      },
      [&selection](const CompatibilityRule& rule) -> RuleOutcome
      {
        auto feature = selection.features.find(rule.feature);
        if (feature == selection.features.end() || !feature->second)
        {
          return RuleOutcome{true, rule.feature, {}};
        }
        auto value = lookup(selection.parameters, rule.parameter);
        if (!value || withinBounds(*value, rule.min, rule.max))
        {
          return RuleOutcome{true, rule.feature, {}};
        }
        return RuleOutcome{false,
                           rule.feature,
                           fmt::format("{} requires {} {} (got {})",
                                       rule.feature,
                                       rule.parameter,
                                       describeBounds(rule.min, rule.max),
                                       *value)};
      },
      [&selection](const AllowedValuesRule& rule) -> RuleOutcome
      {
        auto option = selection.options.find(rule.option);
        if (option == selection.options.end())
        {
          return rule.required ? missing(rule.option)
                               : RuleOutcome{true, rule.option, {}};
        }
        if (rule.allowed.count(option->second) > 0)
        {
          return RuleOutcome{true, rule.option, {}};
        }
        return RuleOutcome{
          false,
          rule.option,
          fmt::format("{} = '{}' is not an allowed value",
                      rule.option,
                      option->second)};
      }},
    predicate);
}

}  // namespace mfg_core
