#ifndef MFG_CORE_BOM_BOM_HPP
#define MFG_CORE_BOM_BOM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mfg-catalog/src/CatalogTypes.hpp"
#include "mfg-core/src/Configuration/Configuration.hpp"
#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"
#include "mfg-core/src/Errors/EngineError.hpp"

namespace mfg_core
{

/**
 * @brief One costed line of a BOM
 *
 * adjustedQuantity = baseQuantity * (1 + wasteFactor)
 * extendedCost = adjustedQuantity * unitCost
 */
struct BomLineItem
{
  uint32_t lineNumber{0};
  std::string componentId;
  mfg_catalog::ComponentType componentType{mfg_catalog::ComponentType::Part};
  double baseQuantity{0.0};
  double wasteFactor{0.0};
  double adjustedQuantity{0.0};
  double unitCost{0.0};      // [USD]
  double extendedCost{0.0};  // [USD]
  double unitWeightKg{0.0};  // [kg]
  bool isCustom{false};
  bool isOptional{false};
  std::optional<std::string> substituteGroup;
};

/**
 * @brief Bill of materials generated for one configuration version
 *
 * Lines are never modified after commit. status and isLocked are the only
 * header fields that change afterwards.
 */
struct Bom
{
  EntityId bomId{0};
  std::string bomNumber;
  EntityId configurationId{0};
  uint32_t configurationVersion{0};
  EntityId orderItemId{0};
  std::string assemblyId;
  BomStatus status{BomStatus::Draft};
  BomType bomType{BomType::Standard};
  bool isLocked{false};

  uint32_t totalParts{0};
  uint32_t uniqueParts{0};
  uint32_t customPartsCount{0};
  double totalCost{0.0};      // [USD]
  double totalWeightKg{0.0};  // [kg]
  double generationTimeMs{0.0};

  std::string createdBy;
  TimePoint createdAt{};
  std::vector<BomLineItem> lines;
  uint64_t revision{0};
};

/**
 * @brief Result of a BOM generation request
 *
 * On failure no BOM is persisted; error is set and validation carries the
 * itemized rule results when the failure is ValidationFailed.
 */
struct BomResult
{
  bool success{false};
  std::optional<EntityId> bomId;
  std::string bomNumber;
  uint32_t totalParts{0};
  uint32_t customPartsCount{0};
  double totalCost{0.0};
  double totalWeight{0.0};
  double generationTimeMs{0.0};
  std::optional<EngineError> error;
  std::optional<ValidationResult> validation;

  static BomResult failure(EngineError error)
  {
    BomResult result;
    result.error = std::move(error);
    return result;
  }
};

}  // namespace mfg_core

#endif  // MFG_CORE_BOM_BOM_HPP
