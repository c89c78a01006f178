// Ticket: 0007_order_lifecycle

#ifndef MFG_CORE_ORDER_ORDER_LIFECYCLE_MANAGER_HPP
#define MFG_CORE_ORDER_ORDER_LIFECYCLE_MANAGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "mfg-core/src/Bom/Bom.hpp"
#include "mfg-core/src/Errors/EngineError.hpp"
#include "mfg-core/src/Order/Order.hpp"
#include "mfg-core/src/Order/PhasePermissions.hpp"
#include "mfg-core/src/Sinks/Sinks.hpp"
#include "mfg-core/src/Store/UnitOfWork.hpp"

namespace mfg_core
{

struct TransitionResult
{
  bool success{false};
  std::optional<OrderPhase> fromPhase;
  std::optional<OrderPhase> toPhase;
  std::optional<EntityId> historyId;
  std::vector<EntityId> createdTaskIds;
  std::optional<EntityId> checklistId;
  std::optional<EngineError> error;

  static TransitionResult failure(EngineError error)
  {
    TransitionResult result;
    result.error = std::move(error);
    return result;
  }
};

/**
 * @brief Finite state machine over order phases
 *
 * transition() checks the TransitionTable, then the actor's authorization
 * for the target phase, then the side-effect preconditions. Only when all
 * pass does it stage anything: the new phase, the entry side effects and one
 * OrderStatusHistory row. A rejected transition stages nothing.
 *
 * Entry side effects:
 *   Configuration  stamp configuration start
 *   Approval       lock every item's Active BOM, stamp configuration end
 *   Production     tasks from each item's Active BOM (Conflict if an item has
 *                  none); tasks already generated for that BOM are kept, so
 *                  rework never duplicates them
 *   QualityControl new QC checklist instance per entry
 *   Packaging      stamp QC completion
 *   Delivered      stamp actual delivery date
 *
 * Resuming from OnHold restores the suspended phase without re-running its
 * entry side effects.
 *
 * Task sink events, audit events and history records are published after the
 * caller commits the unit of work.
 */
class OrderLifecycleManager
{
public:
  OrderLifecycleManager(PhasePermissions permissions,
                        const SinkSet& sinks,
                        std::shared_ptr<spdlog::logger> logger = nullptr,
                        Clock clock = systemClock());

  /**
   * @brief Stage a phase transition
   *
   * Failures: NotFound (order), InvalidTransition (not in table),
   * Authorization (role lacks target), Conflict (item without Active BOM on
   * entering Production).
   */
  TransitionResult transition(UnitOfWork& uow,
                              EntityId orderId,
                              OrderPhase target,
                              const Actor& actor,
                              const std::string& reason);

  [[nodiscard]] const PhasePermissions& permissions() const
  {
    return permissions_;
  }

private:
  struct ItemBom
  {
    OrderItem item;
    std::optional<Bom> bom;
  };

  std::vector<ItemBom> loadItems(const UnitOfWork& uow,
                                 const Order& order) const;

  void lockBoms(UnitOfWork& uow, const std::vector<ItemBom>& items) const;
  std::vector<EntityId> generateTasks(UnitOfWork& uow,
                                      const std::vector<ItemBom>& items) const;
  EntityId createChecklist(UnitOfWork& uow,
                           const Order& order,
                           const Actor& actor,
                           TimePoint now) const;
  void notifyItems(UnitOfWork& uow,
                   const Order& order,
                   const std::vector<ItemBom>& items,
                   OrderPhase phase,
                   TimePoint now) const;

  PhasePermissions permissions_;
  const SinkSet& sinks_;
  std::shared_ptr<spdlog::logger> logger_;
  Clock clock_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_ORDER_ORDER_LIFECYCLE_MANAGER_HPP
