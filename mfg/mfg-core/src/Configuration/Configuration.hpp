#ifndef MFG_CORE_CONFIGURATION_CONFIGURATION_HPP
#define MFG_CORE_CONFIGURATION_CONFIGURATION_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"
#include "mfg-core/src/Errors/EngineError.hpp"

namespace mfg_core
{

/**
 * @brief Option set chosen for one order item
 *
 * Numeric parameters (sinkLength, basinCount), boolean features (lifter) and
 * enumerated options (pegboardSize) are kept in separate maps so rules can
 * address them without parsing.
 */
struct ConfigurationSelection
{
  std::map<std::string, double> parameters;
  std::map<std::string, bool> features;
  std::map<std::string, std::string> options;

  /// Overwrite every key present in changes, keep the rest
  void merge(const ConfigurationSelection& changes);
};

/**
 * @brief Outcome of evaluating the rule set against one configuration
 */
struct ValidationResult
{
  bool isValid{true};
  std::vector<ValidationIssue> errors;
  std::vector<ValidationIssue> warnings;
};

/**
 * @brief Versioned configuration of an order item's target assembly
 *
 * A revision is a new Configuration with version + 1 and parentConfigurationId
 * set; earlier versions are kept unchanged. The last validation result is
 * recorded on the entity.
 */
struct Configuration
{
  EntityId configurationId{0};
  EntityId orderItemId{0};
  std::string assemblyId;
  std::string categoryId;
  uint32_t version{1};
  std::optional<EntityId> parentConfigurationId;

  ConfigurationSelection selection;

  bool isValidated{false};
  bool isValid{false};
  std::vector<ValidationIssue> errors;
  std::vector<ValidationIssue> warnings;
  std::optional<TimePoint> validatedAt;

  std::string createdBy;
  TimePoint createdAt{};
  uint64_t revision{0};

  void recordValidation(const ValidationResult& result, TimePoint at);
};

}  // namespace mfg_core

#endif  // MFG_CORE_CONFIGURATION_CONFIGURATION_HPP
