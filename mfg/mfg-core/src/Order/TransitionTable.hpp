// Ticket: 0007_order_lifecycle

#ifndef MFG_CORE_ORDER_TRANSITION_TABLE_HPP
#define MFG_CORE_ORDER_TRANSITION_TABLE_HPP

#include <optional>
#include <vector>

#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"

namespace mfg_core
{

/**
 * @brief Legal order phase transitions
 *
 * Forward edges:
 *   Draft -> Configuration -> Approval -> Production -> QualityControl
 *   QualityControl -> Packaging (pass) | Production (rework)
 *   Packaging -> Shipping -> Delivered
 *
 * Global edges:
 *   any non-terminal phase -> Cancelled
 *   any non-terminal phase other than OnHold -> OnHold
 *   OnHold -> the phase it was suspended from
 *
 * Delivered and Cancelled are terminal.
 */
class TransitionTable
{
public:
  /**
   * @param from Current phase
   * @param to Requested phase
   * @param suspendedFrom Phase the order was suspended from, when from is
   * OnHold
   */
  static bool isAllowed(OrderPhase from,
                        OrderPhase to,
                        std::optional<OrderPhase> suspendedFrom = std::nullopt);

  /// All phases reachable from a phase in one step
  static std::vector<OrderPhase> targets(
    OrderPhase from,
    std::optional<OrderPhase> suspendedFrom = std::nullopt);

  TransitionTable() = delete;
};

}  // namespace mfg_core

#endif  // MFG_CORE_ORDER_TRANSITION_TABLE_HPP
