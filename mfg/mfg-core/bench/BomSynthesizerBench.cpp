// Ticket: 0006_bom_synthesis
// Purpose: Profile BOM explosion, rule evaluation and custom part minting

#include <benchmark/benchmark.h>

#include <map>
#include <memory>
#include <string>

#include <fmt/format.h>

#include "mfg-core/src/Bom/BomSynthesizer.hpp"
#include "mfg-core/src/Configuration/ConfigurationValidator.hpp"
#include "mfg-core/src/Store/UnitOfWork.hpp"
#include "mfg-core/src/Store/WorkflowStore.hpp"
#include "mfg-core/test/SinkFixtures.hpp"

using namespace mfg_core;
using namespace mfg_core::test;

// ============================================================================
// Helper Functions
// ============================================================================

namespace
{

// Assembly "WIDE" with componentCount direct part components
void seedWideAssembly(mfg_catalog::CatalogRegistry& catalog,
                      int64_t componentCount)
{
  catalog.addAssembly(mfg_catalog::Assembly{"WIDE", "Wide", "BENCH"});
  for (int64_t i = 0; i < componentCount; ++i)
  {
    auto partId = fmt::format("P-{:05}", i);
    catalog.addPart(mfg_catalog::Part{partId, partId, "BENCH", 1.0 + i, 0.5});

    mfg_catalog::AssemblyComponent c;
    c.assemblyId = "WIDE";
    c.componentId = partId;
    c.baseQuantity = 2.0;
    c.wasteFactor = 0.05;
    c.assemblySequence = static_cast<int>(i);
    catalog.addComponent(c);
  }
}

EntityId seedValidatedConfiguration(WorkflowStore& store,
                                    const std::string& assemblyId)
{
  UnitOfWork uow{store};

  Order order;
  order.orderId = uow.nextId();
  OrderItem item;
  item.orderItemId = uow.nextId();
  item.orderId = order.orderId;
  Configuration config;
  config.configurationId = uow.nextId();
  config.orderItemId = item.orderItemId;
  config.assemblyId = assemblyId;
  config.recordValidation(ValidationResult{}, fixedClock()());
  item.configurationId = config.configurationId;
  order.itemIds.push_back(item.orderItemId);

  uow.put(order);
  uow.put(item);
  uow.put(config);
  (void)uow.commit();
  return config.configurationId;
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief Explosion and costing of a flat assembly, staged and rolled back
 *
 * Range is the number of direct components.
 */
static void BM_BomSynthesizer_Generate(benchmark::State& state)
{
  mfg_catalog::CatalogRegistry catalog;
  seedWideAssembly(catalog, state.range(0));

  auto logger = nullLogger();
  CustomPartNumbering numbering{catalog, {}, {}, logger};
  DocumentNumbering documents{DocumentNumbering::Config{}};
  SinkSet sinks;
  BomSynthesizer synthesizer{
    catalog, numbering, documents, sinks, logger, fixedClock()};

  WorkflowStore store;
  auto configurationId = seedValidatedConfiguration(store, "WIDE");
  Actor actor{"bench", {Role::Admin}};

  for (auto _ : state)
  {
    UnitOfWork uow{store};
    auto result = synthesizer.generate(uow, configurationId, actor);
    benchmark::DoNotOptimize(result);
  }
  state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_BomSynthesizer_Generate)
  ->RangeMultiplier(4)
  ->Range(4, 1024)
  ->Complexity(benchmark::oN);

/**
 * @brief Full rule set over a sink configuration
 */
static void BM_ConfigurationValidator_Validate(benchmark::State& state)
{
  ConfigurationValidator validator{sinkRules(), nullLogger()};

  Configuration config;
  config.assemblyId = kSinkAssembly;
  config.categoryId = "SINKS";
  config.selection.parameters["basinCount"] = 3;
  config.selection.parameters["sinkLength"] = 48;
  config.selection.features["lifter"] = true;
  config.selection.options["pegboardSize"] = "30x30";

  for (auto _ : state)
  {
    auto result = validator.validate(config);
    benchmark::DoNotOptimize(result);
  }
}
BENCHMARK(BM_ConfigurationValidator_Validate);

/**
 * @brief Custom part minting under contention
 */
static void BM_CustomPartNumbering_Mint(benchmark::State& state)
{
  static mfg_catalog::CatalogRegistry catalog;
  static CustomPartNumbering numbering{
    catalog,
    CustomPartNumbering::Series{},
    std::map<std::string, CustomPartNumbering::Series>{},
    nullLogger()};

  for (auto _ : state)
  {
    auto number = numbering.mint("PEGBOARDS");
    benchmark::DoNotOptimize(number);
  }
}
BENCHMARK(BM_CustomPartNumbering_Mint)->Threads(1)->Threads(4);

BENCHMARK_MAIN();
