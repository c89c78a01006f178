// Ticket: 0006_bom_synthesis

#ifndef MFG_CORE_BOM_BOM_SYNTHESIZER_HPP
#define MFG_CORE_BOM_BOM_SYNTHESIZER_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include "mfg-catalog/src/CatalogStore.hpp"
#include "mfg-core/src/Bom/Bom.hpp"
#include "mfg-core/src/Bom/CustomPartNumbering.hpp"
#include "mfg-core/src/Bom/DocumentNumbering.hpp"
#include "mfg-core/src/Sinks/Sinks.hpp"
#include "mfg-core/src/Store/UnitOfWork.hpp"

namespace mfg_core
{

/**
 * @brief Explodes a validated configuration into a costed, flat BOM
 *
 * Explosion is single-level: the target assembly's currently effective
 * direct components become one line each, and a nested assembly is one line
 * costed at its base price and weight. Options whose key is a catalog option
 * family add one line for the bound part, or for a custom part synthesized
 * through CustomPartNumbering when the value has no binding.
 *
 * Line order: catalog components in catalog order, then option-resolved
 * catalog parts by option key, then newly synthesized parts by option key.
 *
 * The new BOM is staged in the caller's unit of work with status Draft. The
 * caller decides its final status and commits; nothing is written to the
 * store here. Custom part registration is the one effect that is not rolled
 * back with the unit of work, so a part is published to the record sinks
 * when this call registers it, not on commit.
 *
 * @ticket 0006_bom_synthesis
 */
class BomSynthesizer
{
public:
  BomSynthesizer(const mfg_catalog::CatalogStore& catalog,
                 CustomPartNumbering& numbering,
                 DocumentNumbering& documents,
                 const SinkSet& sinks,
                 std::shared_ptr<spdlog::logger> logger = nullptr,
                 Clock clock = systemClock());

  /**
   * @brief Build and stage a BOM for a configuration
   *
   * Failures: NotFound if the configuration, its order item or order is
   * missing; Conflict if the order is past Configuration and no override is
   * in effect; ValidationFailed if the configuration's recorded validation is
   * missing or invalid.
   *
   * @param uow Unit of work the BOM header and lines are staged in
   * @param configurationId Configuration to explode
   * @param actor Requesting actor, recorded as creator
   * @param administrativeOverride Skip the order mutability check
   * @return Result carrying the staged BOM's id and totals, or the failure
   * @throws DataIntegrityError on a cyclic or dangling catalog reference
   */
  BomResult generate(UnitOfWork& uow,
                     EntityId configurationId,
                     const Actor& actor,
                     bool administrativeOverride = false);

private:
  const mfg_catalog::CatalogStore& catalog_;
  CustomPartNumbering& numbering_;
  DocumentNumbering& documents_;
  const SinkSet& sinks_;
  std::shared_ptr<spdlog::logger> logger_;
  Clock clock_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_BOM_BOM_SYNTHESIZER_HPP
