#ifndef MFG_EXE_SAMPLE_CATALOG_HPP
#define MFG_EXE_SAMPLE_CATALOG_HPP

#include <vector>

#include "mfg-catalog/src/CatalogRegistry.hpp"
#include "mfg-core/src/Configuration/ConfigurationRule.hpp"

namespace mfg_exe
{

inline constexpr const char* kSinkAssembly = "T2-SINK";

/**
 * @brief Stainless sink line: frame, legs, sheet, basins, drain and lifter
 * sub-assemblies, and a pegboard option family with two standard sizes
 */
void seedSampleCatalog(mfg_catalog::CatalogRegistry& catalog);

/// Length, basin count, lifter compatibility and pegboard size rules
std::vector<mfg_core::ConfigurationRule> sampleRules();

}  // namespace mfg_exe

#endif  // MFG_EXE_SAMPLE_CATALOG_HPP
