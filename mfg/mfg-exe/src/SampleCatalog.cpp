#include "mfg-exe/src/SampleCatalog.hpp"

#include <optional>
#include <string>

namespace mfg_exe
{

namespace
{

mfg_catalog::AssemblyComponent component(
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

}  // namespace

void seedSampleCatalog(mfg_catalog::CatalogRegistry& catalog)
{
  using namespace mfg_catalog;

  catalog.addCategory(Category{"SINKS", "Sinks"});
  catalog.addCategory(Category{"PEGBOARDS", "Pegboards"});
  catalog.addCategory(Category{"LIFTERS", "Lifters"});

  catalog.addPart(Part{"FRM-T2", "T2 frame weldment", "SINKS", 185.0, 18.0});
  catalog.addPart(Part{"LEG-34SS", "Leg 34in stainless", "SINKS", 22.5, 1.8});
  catalog.addPart(Part{"FOOT-ADJ", "Adjustable foot", "SINKS", 4.75, 0.2});
  catalog.addPart(Part{"SHT-304-14", "Sheet 304 14ga", "SINKS", 48.0, 6.5});
  catalog.addPart(Part{"BSN-2016", "Basin 20x16", "SINKS", 165.0, 7.0});
  catalog.addPart(
    Part{"PEG-3636", "Pegboard 36x36", "PEGBOARDS", 72.0, 4.0});
  catalog.addPart(
    Part{"PEG-3648", "Pegboard 36x48", "PEGBOARDS", 88.0, 5.2});
  catalog.addPart(Part{"LFT-DL2", "Lifter DL2", "LIFTERS", 640.0, 22.0});

  catalog.addAssembly(Assembly{
    "DRN-ASSY", "Drain assembly", "SINKS", AssemblyLevel::SubAssembly, 58.0, 2.1});
  catalog.addAssembly(Assembly{"FAUCET-KIT",
                               "Faucet kit",
                               "SINKS",
                               AssemblyLevel::SubAssembly,
                               124.0,
                               3.4});
  catalog.addAssembly(
    Assembly{kSinkAssembly, "T2 stainless sink", "SINKS"});

  catalog.addComponent(component("FRM-T2", 10, 1.0));
  catalog.addComponent(component("LEG-34SS", 20, 4.0));
  catalog.addComponent(component("FOOT-ADJ", 30, 4.0));
  catalog.addComponent(component("SHT-304-14", 40, 2.0, 0.12));
  catalog.addComponent(component("BSN-2016", 50, 2.0));
  catalog.addComponent(
    component("DRN-ASSY", 60, 2.0, 0.0, ComponentType::Assembly));

  auto faucet = component("FAUCET-KIT", 70, 1.0, 0.0, ComponentType::Assembly);
  faucet.optional = true;
  catalog.addComponent(faucet);

  catalog.addOptionFamily(
    OptionFamily{"pegboardSize", "PEGBOARDS", "Pegboard"});
  catalog.bindOption(OptionBinding{"pegboardSize", "36x36", "PEG-3636"});
  catalog.bindOption(OptionBinding{"pegboardSize", "36x48", "PEG-3648"});

  catalog.addOptionFamily(OptionFamily{"lifterModel", "LIFTERS", "Lifter"});
  catalog.bindOption(OptionBinding{"lifterModel", "DL2", "LFT-DL2"});
}

std::vector<mfg_core::ConfigurationRule> sampleRules()
{
  using namespace mfg_core;

  ConfigurationRule length;
  length.name = "sinkLengthRange";
  length.priority = 10;
  length.predicate = RangeRule{"sinkLength", 12.0, 120.0, true};
  length.message = "Sink length must be between 12 and 120 inches";

  ConfigurationRule basins;
  basins.name = "basinCountRange";
  basins.priority = 20;
  basins.predicate = CountRule{"basinCount", 1, 3, true};
  basins.message = "Basin count must be 1, 2 or 3";

  ConfigurationRule lifter;
  lifter.name = "lifterBasinCompatibility";
  lifter.kind = RuleKind::Compatibility;
  lifter.priority = 30;
  lifter.predicate =
    CompatibilityRule{"lifter", "basinCount", std::nullopt, 2.0};
  lifter.message = "A lifter cannot be fitted to more than two basins";

  ConfigurationRule pegboard;
  pegboard.name = "standardPegboardSize";
  pegboard.kind = RuleKind::ComponentSelection;
  pegboard.priority = 40;
  pegboard.isBlocking = false;
  pegboard.predicate = AllowedValuesRule{"pegboardSize", {"36x36", "36x48"}};
  pegboard.message = "Non-standard pegboard size will be built as a custom part";

  return {length, basins, lifter, pegboard};
}

}  // namespace mfg_exe
