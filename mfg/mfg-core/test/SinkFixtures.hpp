// Ticket: 0008_workflow_engine
// Test: shared sink catalog and rule set for mfg-core tests

#ifndef MFG_CORE_TEST_SINK_FIXTURES_HPP
#define MFG_CORE_TEST_SINK_FIXTURES_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include "mfg-catalog/src/CatalogRegistry.hpp"
#include "mfg-core/src/Configuration/ConfigurationRule.hpp"
#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"
#include "mfg-core/src/Sinks/Sinks.hpp"

namespace mfg_core::test
{

inline constexpr const char* kSinkAssembly = "T2-48";

// Catalog cost of one T2-48 explosion:
//   FRAME-48   1   x 120   = 120
//   LEG-34     4   x  25   = 100
//   SHEET-304  3.3 x  40   = 132
//   BASIN-20   2   x 180   = 360
//   DRAIN-KIT  1   x  45   =  45
inline constexpr double kSinkCatalogCost = 757.0;
inline constexpr size_t kSinkCatalogLines = 5;

inline constexpr double kBoundPegboardCost = 60.0;

inline std::shared_ptr<spdlog::logger> nullLogger()
{
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>("mfg-test", sink);
}

/// Clock pinned to 2024-03-15 12:00:00 UTC
inline Clock fixedClock()
{
  using namespace std::chrono;
  auto const day = sys_days{year{2024} / March / 15};
  TimePoint const at = time_point_cast<system_clock::duration>(day + hours{12});
  return [at] { return at; };
}

inline mfg_catalog::AssemblyComponent sinkComponent(
  const std::string& componentId,
  int sequence,
  double quantity,
  double wasteFactor = 0.0,
  mfg_catalog::ComponentType type = mfg_catalog::ComponentType::Part)
{
  mfg_catalog::AssemblyComponent c;
  c.assemblyId = kSinkAssembly;
  c.componentId = componentId;
  c.type = type;
  c.baseQuantity = quantity;
  c.wasteFactor = wasteFactor;
  c.assemblySequence = sequence;
  return c;
}

/**
 * @brief Two-basin 48" sink with a pegboard option family
 *
 * Pegboard 24x36 is bound to a catalog part. 700-1024 already exists, so the
 * next custom part minted is 700-1025.
 */
inline void seedSinkCatalog(mfg_catalog::CatalogRegistry& catalog)
{
  using namespace mfg_catalog;

  catalog.addCategory(Category{"SINKS", "Sinks"});
  catalog.addCategory(Category{"PEGBOARDS", "Pegboards"});

  catalog.addPart(Part{"FRAME-48", "Frame 48in", "SINKS", 120.0, 15.0});
  catalog.addPart(Part{"LEG-34", "Leg 34in", "SINKS", 25.0, 2.0});
  catalog.addPart(Part{"SHEET-304", "Sheet 304 SS", "SINKS", 40.0, 5.0});
  catalog.addPart(Part{"BASIN-20", "Basin 20in", "SINKS", 180.0, 8.0});
  catalog.addPart(
    Part{"PEG-24x36", "Pegboard 24x36", "PEGBOARDS", kBoundPegboardCost, 3.0});

  Part legacyCustom{"700-1024", "Pegboard 20x20 (custom)", "PEGBOARDS"};
  legacyCustom.isCustom = true;
  catalog.addPart(legacyCustom);

  catalog.addAssembly(Assembly{"DRAIN-KIT",
                               "Drain kit",
                               "SINKS",
                               AssemblyLevel::SubAssembly,
                               45.0,
                               1.5});
  catalog.addAssembly(
    Assembly{kSinkAssembly, "T2 sink 48in", "SINKS", AssemblyLevel::Assembly});

  catalog.addComponent(sinkComponent("FRAME-48", 10, 1.0));
  catalog.addComponent(sinkComponent("LEG-34", 20, 4.0));
  catalog.addComponent(sinkComponent("SHEET-304", 30, 3.0, 0.1));
  catalog.addComponent(sinkComponent("BASIN-20", 40, 2.0));
  catalog.addComponent(
    sinkComponent("DRAIN-KIT", 50, 1.0, 0.0, ComponentType::Assembly));

  catalog.addOptionFamily(OptionFamily{"pegboardSize", "PEGBOARDS", "Pegboard"});
  catalog.bindOption(OptionBinding{"pegboardSize", "24x36", "PEG-24x36"});
}

inline std::vector<ConfigurationRule> sinkRules()
{
  ConfigurationRule length;
  length.name = "sinkLengthRange";
  length.priority = 10;
  length.predicate = RangeRule{"sinkLength", 12.0, 120.0, true};

  ConfigurationRule basins;
  basins.name = "basinCountRange";
  basins.priority = 20;
  basins.predicate = CountRule{"basinCount", 1, 3, true};

  ConfigurationRule lifter;
  lifter.name = "lifterBasinCompatibility";
  lifter.kind = RuleKind::Compatibility;
  lifter.priority = 30;
  lifter.predicate =
    CompatibilityRule{"lifter", "basinCount", std::nullopt, 2.0};

  ConfigurationRule pegboard;
  pegboard.name = "standardPegboardSize";
  pegboard.kind = RuleKind::ComponentSelection;
  pegboard.priority = 40;
  pegboard.isBlocking = false;
  pegboard.predicate = AllowedValuesRule{"pegboardSize", {"24x36", "36x48"}};

  return {length, basins, lifter, pegboard};
}

/// Record sink that keeps every custom part published to it
class CustomPartCapture : public RecordSink
{
public:
  void onBomCommitted(const Bom&) override
  {
  }

  void onHistoryAppended(const OrderStatusHistory&) override
  {
  }

  void onCustomPartRegistered(const mfg_catalog::Part& part) override
  {
    std::lock_guard<std::mutex> lock{mutex_};
    parts_.push_back(part);
  }

  std::vector<mfg_catalog::Part> parts() const
  {
    std::lock_guard<std::mutex> lock{mutex_};
    return parts_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<mfg_catalog::Part> parts_;
};

}  // namespace mfg_core::test

#endif  // MFG_CORE_TEST_SINK_FIXTURES_HPP
