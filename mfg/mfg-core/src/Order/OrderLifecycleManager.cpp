// Ticket: 0007_order_lifecycle

#include "mfg-core/src/Order/OrderLifecycleManager.hpp"

#include <chrono>

#include <fmt/format.h>

#include "mfg-core/src/Logging.hpp"
#include "mfg-core/src/Order/TransitionTable.hpp"

namespace mfg_core
{

OrderLifecycleManager::OrderLifecycleManager(
  PhasePermissions permissions,
  const SinkSet& sinks,
  std::shared_ptr<spdlog::logger> logger,
  Clock clock)
  : permissions_{std::move(permissions)},
    sinks_{sinks},
    logger_{logger ? std::move(logger) : defaultLogger()},
    clock_{clock ? std::move(clock) : systemClock()}
{
}

TransitionResult OrderLifecycleManager::transition(UnitOfWork& uow,
                                                   EntityId orderId,
                                                   OrderPhase target,
                                                   const Actor& actor,
                                                   const std::string& reason)
{
  auto order = uow.find<Order>(orderId);
  if (!order)
  {
    return TransitionResult::failure(EngineError::notFound("Order", orderId));
  }

  OrderPhase const from = order->currentPhase;

  // ========== Checks (nothing staged yet) ==========

  if (!TransitionTable::isAllowed(from, target, order->suspendedFrom))
  {
    logger_->warn("Order {}: rejected transition {} -> {}",
                  order->orderNumber,
                  toString(from),
                  toString(target));
    return TransitionResult::failure(
      EngineError::invalidTransition(from, target));
  }

  if (!permissions_.isAuthorized(actor, target))
  {
    auto error = EngineError::authorization(
      fmt::format("Actor {} is not authorized to move order {} to {}",
                  actor.actorId,
                  order->orderNumber,
                  toString(target)));
    error.currentPhase = from;
    error.requestedPhase = target;
    logger_->warn("{}", error.message);
    return TransitionResult::failure(std::move(error));
  }

  bool const resuming = from == OrderPhase::OnHold;
  auto items = loadItems(uow, *order);

  if (target == OrderPhase::Production && !resuming)
  {
    for (const auto& entry : items)
    {
      if (!entry.bom || entry.bom->status != BomStatus::Active)
      {
        auto error = EngineError::conflict(
          fmt::format("Order item {} has no Active BOM; cannot enter {}",
                      entry.item.orderItemId,
                      toString(target)));
        error.currentPhase = from;
        error.requestedPhase = target;
        return TransitionResult::failure(std::move(error));
      }
    }
  }

  // ========== Side effects ==========

  auto const now = clock_();
  TransitionResult result;
  result.fromPhase = from;
  result.toPhase = target;

  auto& stamps = order->timestamps;
  if (!resuming)
  {
    switch (target)
    {
      case OrderPhase::Configuration:
        if (!stamps.configurationStartedAt)
        {
          stamps.configurationStartedAt = now;
        }
        break;
      case OrderPhase::Approval:
        stamps.configurationCompletedAt = now;
        lockBoms(uow, items);
        break;
      case OrderPhase::Production:
        if (!stamps.productionStartedAt)
        {
          stamps.productionStartedAt = now;
        }
        result.createdTaskIds = generateTasks(uow, items);
        notifyItems(uow, *order, items, target, now);
        break;
      case OrderPhase::QualityControl:
        stamps.productionCompletedAt = now;
        stamps.qcStartedAt = now;
        result.checklistId = createChecklist(uow, *order, actor, now);
        notifyItems(uow, *order, items, target, now);
        break;
      case OrderPhase::Packaging:
        stamps.qcCompletedAt = now;
        break;
      case OrderPhase::Delivered:
        stamps.actualDeliveryDate = now;
        break;
      default:
        break;
    }
  }

  // ========== Phase change and history ==========

  OrderStatusHistory row;
  row.historyId = uow.nextId();
  row.orderId = order->orderId;
  row.fromPhase = from;
  row.toPhase = target;
  row.actorId = actor.actorId;
  row.timestamp = now;
  row.reason = reason;
  row.durationInPriorPhase =
    std::chrono::duration_cast<std::chrono::milliseconds>(now -
                                                          order->phaseEnteredAt);
  uow.put(row);

  order->suspendedFrom =
    target == OrderPhase::OnHold ? std::optional<OrderPhase>{from}
                                 : std::nullopt;
  order->currentPhase = target;
  order->phaseEnteredAt = now;
  uow.put(*order);

  result.historyId = row.historyId;
  result.success = true;

  AuditEvent audit{actor.actorId,
                   "PHASE_CHANGE",
                   "Order",
                   order->orderId,
                   toString(from),
                   toString(target),
                   now};
  const SinkSet& sinks = sinks_;
  auto logger = logger_;
  auto orderNumber = order->orderNumber;
  uow.onCommit(
    [&sinks, logger, audit, row, orderNumber]
    {
      sinks.publish(audit);
      sinks.publishHistory(row);
      logger->info("Order {}: {} -> {} by {}",
                   orderNumber,
                   toString(row.fromPhase),
                   toString(row.toPhase),
                   row.actorId);
    });

  return result;
}

std::vector<OrderLifecycleManager::ItemBom> OrderLifecycleManager::loadItems(
  const UnitOfWork& uow,
  const Order& order) const
{
  std::vector<ItemBom> items;
  for (EntityId const itemId : order.itemIds)
  {
    auto item = uow.find<OrderItem>(itemId);
    if (!item)
    {
      throw DataIntegrityError(fmt::format(
        "Order {} references missing item {}", order.orderNumber, itemId));
    }
    std::optional<Bom> bom;
    if (item->bomId)
    {
      bom = uow.find<Bom>(*item->bomId);
    }
    items.push_back(ItemBom{std::move(*item), std::move(bom)});
  }
  return items;
}

void OrderLifecycleManager::lockBoms(UnitOfWork& uow,
                                     const std::vector<ItemBom>& items) const
{
  for (const auto& entry : items)
  {
    if (entry.bom && entry.bom->status == BomStatus::Active &&
        !entry.bom->isLocked)
    {
      auto bom = *entry.bom;
      bom.isLocked = true;
      uow.put(std::move(bom));
    }
  }
}

std::vector<EntityId> OrderLifecycleManager::generateTasks(
  UnitOfWork& uow,
  const std::vector<ItemBom>& items) const
{
  std::vector<EntityId> created;
  for (const auto& entry : items)
  {
    const auto& bom = *entry.bom;
    EntityId const itemId = entry.item.orderItemId;
    EntityId const bomId = bom.bomId;

    auto existing = uow.select<ProductionTask>(
      [itemId, bomId](const ProductionTask& task)
      { return task.orderItemId == itemId && task.bomId == bomId; });
    if (!existing.empty())
    {
      logger_->debug("Item {} already has {} task(s) for BOM {}",
                     itemId,
                     existing.size(),
                     bom.bomNumber);
      continue;
    }

    for (const auto& line : bom.lines)
    {
      ProductionTask task;
      task.taskId = uow.nextId();
      task.orderItemId = itemId;
      task.bomId = bomId;
      task.bomLineNumber = line.lineNumber;
      task.componentId = line.componentId;
      task.quantity = line.adjustedQuantity * entry.item.quantity;
      task.description = fmt::format("{} {} x {}",
                                     line.componentType ==
                                         mfg_catalog::ComponentType::Assembly
                                       ? "Build"
                                       : "Fit",
                                     line.componentId,
                                     task.quantity);
      created.push_back(task.taskId);
      uow.put(std::move(task));
    }
  }
  return created;
}

EntityId OrderLifecycleManager::createChecklist(UnitOfWork& uow,
                                                const Order& order,
                                                const Actor& actor,
                                                TimePoint now) const
{
  EntityId const orderId = order.orderId;
  auto previous = uow.select<QcChecklist>([orderId](const QcChecklist& c)
                                          { return c.orderId == orderId; });

  QcChecklist checklist;
  checklist.checklistId = uow.nextId();
  checklist.orderId = orderId;
  checklist.attempt = static_cast<uint32_t>(previous.size()) + 1;
  checklist.orderItemIds = order.itemIds;
  checklist.createdBy = actor.actorId;
  checklist.createdAt = now;

  auto const id = checklist.checklistId;
  uow.put(std::move(checklist));
  return id;
}

void OrderLifecycleManager::notifyItems(UnitOfWork& uow,
                                        const Order& order,
                                        const std::vector<ItemBom>& items,
                                        OrderPhase phase,
                                        TimePoint now) const
{
  std::vector<PhaseEvent> events;
  for (const auto& entry : items)
  {
    PhaseEvent event;
    event.orderId = order.orderId;
    event.orderItemId = entry.item.orderItemId;
    event.phase = phase;
    event.timestamp = now;
    if (entry.bom && entry.bom->status == BomStatus::Active)
    {
      event.activeBomId = entry.bom->bomId;
      event.bomNumber = entry.bom->bomNumber;
    }
    events.push_back(std::move(event));
  }

  const SinkSet& sinks = sinks_;
  uow.onCommit(
    [&sinks, events = std::move(events)]
    {
      for (const auto& event : events)
      {
        sinks.publish(event);
      }
    });
}

}  // namespace mfg_core
