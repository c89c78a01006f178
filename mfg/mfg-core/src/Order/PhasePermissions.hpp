// Ticket: 0007_order_lifecycle

#ifndef MFG_CORE_ORDER_PHASE_PERMISSIONS_HPP
#define MFG_CORE_ORDER_PHASE_PERMISSIONS_HPP

#include <map>
#include <set>

#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"

namespace mfg_core
{

/**
 * @brief Role -> target phase authorization map
 *
 * An actor may request a transition if any of its roles grants the target
 * phase. Admin is granted every phase regardless of the map.
 */
class PhasePermissions
{
public:
  PhasePermissions() = default;
  explicit PhasePermissions(std::map<Role, std::set<OrderPhase>> grants);

  /**
   * @brief Production defaults
   *
   * Leaving QualityControl for Packaging is the QC approval and is granted
   * only to QcInspector (and Admin).
   */
  static PhasePermissions defaults();

  void grant(Role role, OrderPhase target);

  [[nodiscard]] bool isAuthorized(const Actor& actor, OrderPhase target) const;

private:
  std::map<Role, std::set<OrderPhase>> grants_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_ORDER_PHASE_PERMISSIONS_HPP
