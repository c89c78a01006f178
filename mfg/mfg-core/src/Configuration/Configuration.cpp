#include "mfg-core/src/Configuration/Configuration.hpp"

namespace mfg_core
{

void ConfigurationSelection::merge(const ConfigurationSelection& changes)
{
  for (const auto& [key, value] : changes.parameters)
  {
    parameters[key] = value;
  }
  for (const auto& [key, value] : changes.features)
  {
    features[key] = value;
  }
  for (const auto& [key, value] : changes.options)
  {
    options[key] = value;
  }
}

void Configuration::recordValidation(const ValidationResult& result,
                                     TimePoint at)
{
  isValidated = true;
  isValid = result.isValid;
  errors = result.errors;
  warnings = result.warnings;
  validatedAt = at;
}

}  // namespace mfg_core
