// Ticket: 0006_bom_synthesis

#include "mfg-core/src/Bom/BomSynthesizer.hpp"

#include <chrono>
#include <set>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "mfg-catalog/src/AssemblyGraph.hpp"
#include "mfg-core/src/Logging.hpp"

namespace mfg_core
{

namespace
{

BomLineItem makeLine(const std::string& componentId,
                     mfg_catalog::ComponentType type,
                     double baseQuantity,
                     double wasteFactor,
                     const mfg_catalog::ComponentCost& cost)
{
  BomLineItem line;
  line.componentId = componentId;
  line.componentType = type;
  line.baseQuantity = baseQuantity;
  line.wasteFactor = wasteFactor;
  line.adjustedQuantity = baseQuantity * (1.0 + wasteFactor);
  line.unitCost = cost.unitCost;
  line.extendedCost = line.adjustedQuantity * cost.unitCost;
  line.unitWeightKg = cost.weightKg;
  line.isCustom = cost.isCustom;
  return line;
}

}  // namespace

BomSynthesizer::BomSynthesizer(const mfg_catalog::CatalogStore& catalog,
                               CustomPartNumbering& numbering,
                               DocumentNumbering& documents,
                               const SinkSet& sinks,
                               std::shared_ptr<spdlog::logger> logger,
                               Clock clock)
  : catalog_{catalog},
    numbering_{numbering},
    documents_{documents},
    sinks_{sinks},
    logger_{logger ? std::move(logger) : defaultLogger()},
    clock_{clock ? std::move(clock) : systemClock()}
{
}

BomResult BomSynthesizer::generate(UnitOfWork& uow,
                                   EntityId configurationId,
                                   const Actor& actor,
                                   bool administrativeOverride)
{
  auto const started = std::chrono::steady_clock::now();

  // ========== Preconditions ==========

  auto configuration = uow.find<Configuration>(configurationId);
  if (!configuration)
  {
    return BomResult::failure(
      EngineError::notFound("Configuration", configurationId));
  }
  auto item = uow.find<OrderItem>(configuration->orderItemId);
  if (!item)
  {
    return BomResult::failure(
      EngineError::notFound("OrderItem", configuration->orderItemId));
  }
  auto order = uow.find<Order>(item->orderId);
  if (!order)
  {
    return BomResult::failure(EngineError::notFound("Order", item->orderId));
  }

  if (!isMutablePhase(order->currentPhase) && !administrativeOverride)
  {
    auto error = EngineError::conflict(
      fmt::format("Order {} is in {}; BOM regeneration requires an "
                  "administrative override",
                  order->orderNumber,
                  toString(order->currentPhase)));
    error.currentPhase = order->currentPhase;
    return BomResult::failure(std::move(error));
  }

  if (!configuration->isValidated || !configuration->isValid)
  {
    auto error = EngineError::validationFailed(configuration->errors);
    if (!configuration->isValidated)
    {
      error.message = "Configuration has not been validated";
    }
    auto result = BomResult::failure(std::move(error));
    result.validation =
      ValidationResult{false, configuration->errors, configuration->warnings};
    return result;
  }

  // ========== Header ==========

  auto const now = clock_();

  Bom bom;
  bom.bomId = uow.nextId();
  bom.configurationId = configuration->configurationId;
  bom.configurationVersion = configuration->version;
  bom.orderItemId = item->orderItemId;
  bom.assemblyId = configuration->assemblyId;
  bom.status = BomStatus::Draft;
  bom.createdBy = actor.actorId;
  bom.createdAt = now;
  uow.put(bom);

  // ========== Catalog components ==========

  mfg_catalog::AssemblyGraph::verify(catalog_, configuration->assemblyId);

  std::vector<BomLineItem> catalogLines;
  for (const auto& component : catalog_.expand(configuration->assemblyId, now))
  {
    auto cost = catalog_.unitCost(component.componentId, component.type);
    if (!cost)
    {
      throw DataIntegrityError(
        fmt::format("No cost for {} {} in assembly {}",
                    mfg_catalog::toString(component.type),
                    component.componentId,
                    configuration->assemblyId),
        {configuration->assemblyId, component.componentId});
    }

    auto line = makeLine(component.componentId,
                         component.type,
                         component.baseQuantity,
                         component.wasteFactor,
                         *cost);
    line.isOptional = component.optional;
    line.substituteGroup = component.substituteGroup;
    catalogLines.push_back(std::move(line));
  }

  // ========== Option-driven components ==========

  std::vector<BomLineItem> resolvedLines;
  std::vector<BomLineItem> synthesizedLines;

  for (const auto& [optionKey, optionValue] : configuration->selection.options)
  {
    auto family = catalog_.findOptionFamily(optionKey);
    if (!family)
    {
      continue;
    }

    if (auto part = catalog_.resolveOption(optionKey, optionValue))
    {
      resolvedLines.push_back(
        makeLine(part->partId,
                 mfg_catalog::ComponentType::Part,
                 family->quantity,
                 0.0,
                 mfg_catalog::ComponentCost{
                   part->unitCost, part->weightKg, part->isCustom}));
      continue;
    }

    // No catalog match: the line carries no cost lookup
    auto synthesized = numbering_.synthesize(*family, optionValue);
    if (synthesized.created)
    {
      sinks_.publishCustomPart(synthesized.part);
    }
    synthesizedLines.push_back(
      makeLine(synthesized.part.partId,
               mfg_catalog::ComponentType::Part,
               family->quantity,
               0.0,
               mfg_catalog::ComponentCost{0.0, 0.0, true}));
  }

  // ========== Assemble ==========

  std::set<std::string> distinctComponents;
  uint32_t lineNumber = 0;
  for (auto* group : {&catalogLines, &resolvedLines, &synthesizedLines})
  {
    for (auto& line : *group)
    {
      line.lineNumber = ++lineNumber;
      bom.totalCost += line.extendedCost;
      bom.totalWeightKg += line.adjustedQuantity * line.unitWeightKg;
      if (line.isCustom)
      {
        ++bom.customPartsCount;
      }
      distinctComponents.insert(line.componentId);

      logger_->debug("{} line {}: {} x{} @ {} = {}",
                     configuration->assemblyId,
                     line.lineNumber,
                     line.componentId,
                     line.adjustedQuantity,
                     line.unitCost,
                     line.extendedCost);
      bom.lines.push_back(std::move(line));
    }
  }

  bom.totalParts = static_cast<uint32_t>(bom.lines.size());
  bom.uniqueParts = static_cast<uint32_t>(distinctComponents.size());
  bom.bomType = bom.customPartsCount > 0 ? BomType::Custom : BomType::Standard;
  bom.bomNumber = documents_.nextBomNumber(now);
  bom.generationTimeMs =
    std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() -
                                              started)
      .count();
  uow.put(bom);

  BomResult result;
  result.success = true;
  result.bomId = bom.bomId;
  result.bomNumber = bom.bomNumber;
  result.totalParts = bom.totalParts;
  result.customPartsCount = bom.customPartsCount;
  result.totalCost = bom.totalCost;
  result.totalWeight = bom.totalWeightKg;
  result.generationTimeMs = bom.generationTimeMs;
  result.validation =
    ValidationResult{true, configuration->errors, configuration->warnings};
  return result;
}

}  // namespace mfg_core
