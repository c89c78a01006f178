// Ticket: 0008_workflow_engine

#include "mfg-core/src/Engine.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "mfg-core/src/Logging.hpp"

namespace mfg_core
{

namespace
{

std::optional<EngineError> checkMutable(const Order& order)
{
  if (isMutablePhase(order.currentPhase))
  {
    return std::nullopt;
  }
  auto error = EngineError::conflict(
    fmt::format("Order {} is in {} and can no longer be reconfigured",
                order.orderNumber,
                toString(order.currentPhase)));
  error.currentPhase = order.currentPhase;
  return error;
}

/// Tasks of the item's Active BOM; tasks of superseded BOMs are history
std::vector<ProductionTask> currentBomTasks(const OrderItem& item,
                                            std::vector<ProductionTask> tasks)
{
  std::erase_if(tasks,
                [&item](const ProductionTask& task)
                { return !item.bomId || task.bomId != *item.bomId; });
  return tasks;
}

void cancelOpenTasks(UnitOfWork& uow, const Bom& superseded)
{
  EntityId const bomId = superseded.bomId;
  for (auto& task : uow.select<ProductionTask>(
         [bomId](const ProductionTask& t)
         { return t.bomId == bomId && t.status == TaskStatus::Pending; }))
  {
    task.status = TaskStatus::Cancelled;
    uow.put(std::move(task));
  }
}

}  // namespace

WorkflowEngine::WorkflowEngine(mfg_catalog::CatalogRegistry& catalog,
                               const Config& config,
                               SinkSet sinks,
                               std::shared_ptr<spdlog::logger> logger,
                               Clock clock)
  : catalog_{catalog},
    pricing_{config.pricing},
    sinks_{std::move(sinks)},
    logger_{logger ? std::move(logger) : defaultLogger()},
    clock_{clock ? std::move(clock) : systemClock()},
    validator_{config.rules, logger_},
    numbering_{catalog_,
               config.customPartSeries,
               config.categorySeries,
               logger_},
    documents_{config.documentNumbering},
    synthesizer_{catalog_, numbering_, documents_, sinks_, logger_, clock_},
    lifecycle_{config.permissions, sinks_, logger_, clock_}
{
}

// ============================================================================
// Orders and configurations
// ============================================================================

OrderResult WorkflowEngine::createOrder(const std::string& customerId,
                                        bool taxExempt,
                                        const Actor& actor)
{
  auto const now = clock_();

  Order order;
  order.orderId = store_.nextId();
  order.orderNumber = documents_.nextOrderNumber(now);
  order.customerId = customerId;
  order.taxExempt = taxExempt;
  order.currentPhase = OrderPhase::Draft;
  order.phaseEnteredAt = now;
  order.createdBy = actor.actorId;
  order.createdAt = now;

  UnitOfWork uow{store_};
  uow.put(order);

  OrderResult result;
  if (auto conflict = uow.commit())
  {
    result.error = std::move(conflict);
    return result;
  }

  logger_->info("Created order {} for customer {}", order.orderNumber, customerId);
  result.success = true;
  result.orderId = order.orderId;
  result.orderNumber = order.orderNumber;
  return result;
}

OrderItemResult WorkflowEngine::addOrderItem(EntityId orderId,
                                             const OrderItemRequest& request,
                                             const Actor& actor)
{
  OrderItemResult result;

  auto assembly = catalog_.findAssembly(request.assemblyId);
  if (!assembly)
  {
    EngineError error;
    error.kind = ErrorKind::NotFound;
    error.message = "Assembly " + request.assemblyId + " not found";
    error.field = "assemblyId";
    result.error = std::move(error);
    return result;
  }

  auto orderLock = store_.lockOrder(orderId);
  UnitOfWork uow{store_};

  auto order = uow.find<Order>(orderId);
  if (!order)
  {
    result.error = EngineError::notFound("Order", orderId);
    return result;
  }
  if (auto error = checkMutable(*order))
  {
    result.error = std::move(error);
    return result;
  }

  auto const now = clock_();

  OrderItem item;
  item.orderItemId = uow.nextId();
  item.orderId = orderId;
  item.lineNumber = static_cast<uint32_t>(order->itemIds.size()) + 1;
  item.assemblyId = request.assemblyId;
  item.quantity = request.quantity;
  item.unitPrice = request.unitPrice;
  item.discountPercentage = request.discountPercentage;

  Configuration configuration;
  configuration.configurationId = uow.nextId();
  configuration.orderItemId = item.orderItemId;
  configuration.assemblyId = assembly->assemblyId;
  configuration.categoryId = assembly->categoryId;
  configuration.version = 1;
  configuration.selection = request.selection;
  configuration.createdBy = actor.actorId;
  configuration.createdAt = now;

  item.configurationId = configuration.configurationId;
  order->itemIds.push_back(item.orderItemId);

  uow.put(item);
  uow.put(configuration);
  uow.put(*order);

  if (auto conflict = uow.commit())
  {
    result.error = std::move(conflict);
    return result;
  }

  result.success = true;
  result.orderItemId = item.orderItemId;
  result.configurationId = configuration.configurationId;
  return result;
}

ConfigurationResult WorkflowEngine::reviseConfiguration(
  EntityId orderItemId,
  const ConfigurationSelection& changes,
  const Actor& actor)
{
  ConfigurationResult result;

  auto current = store_.find<OrderItem>(orderItemId);
  if (!current)
  {
    result.error = EngineError::notFound("OrderItem", orderItemId);
    return result;
  }

  auto orderLock = store_.lockOrder(current->orderId);
  auto configurationLock = store_.lockConfiguration(current->configurationId);
  UnitOfWork uow{store_};

  auto item = uow.find<OrderItem>(orderItemId);
  auto order = item ? uow.find<Order>(item->orderId) : std::nullopt;
  if (!item || !order)
  {
    result.error = EngineError::notFound("OrderItem", orderItemId);
    return result;
  }
  if (auto error = checkMutable(*order))
  {
    result.error = std::move(error);
    return result;
  }

  auto parent = uow.find<Configuration>(item->configurationId);
  if (!parent)
  {
    result.error =
      EngineError::notFound("Configuration", item->configurationId);
    return result;
  }

  Configuration revised;
  revised.configurationId = uow.nextId();
  revised.orderItemId = parent->orderItemId;
  revised.assemblyId = parent->assemblyId;
  revised.categoryId = parent->categoryId;
  revised.version = parent->version + 1;
  revised.parentConfigurationId = parent->configurationId;
  revised.selection = parent->selection;
  revised.selection.merge(changes);
  revised.createdBy = actor.actorId;
  revised.createdAt = clock_();

  item->configurationId = revised.configurationId;
  uow.put(revised);
  uow.put(*item);

  AuditEvent audit{actor.actorId,
                   "REVISE_CONFIGURATION",
                   "Configuration",
                   revised.configurationId,
                   fmt::format("v{}", parent->version),
                   fmt::format("v{}", revised.version),
                   revised.createdAt};
  const SinkSet& sinks = sinks_;
  uow.onCommit([&sinks, audit] { sinks.publish(audit); });

  if (auto conflict = uow.commit())
  {
    result.error = std::move(conflict);
    return result;
  }

  result.success = true;
  result.configurationId = revised.configurationId;
  result.version = revised.version;
  return result;
}

ValidationResult WorkflowEngine::validateConfiguration(
  const Configuration& configuration) const
{
  return validator_.validate(configuration);
}

std::optional<ValidationResult> WorkflowEngine::validateConfiguration(
  EntityId configurationId)
{
  auto located = store_.find<Configuration>(configurationId);
  if (!located)
  {
    return std::nullopt;
  }
  auto owner = store_.find<OrderItem>(located->orderItemId);
  if (!owner)
  {
    return validator_.validate(*located);
  }

  auto orderLock = store_.lockOrder(owner->orderId);
  auto configurationLock = store_.lockConfiguration(configurationId);
  UnitOfWork uow{store_};

  auto configuration = uow.find<Configuration>(configurationId);
  if (!configuration)
  {
    return std::nullopt;
  }
  auto result = validator_.validate(*configuration);

  auto item = uow.find<OrderItem>(owner->orderItemId);
  auto order = item ? uow.find<Order>(item->orderId) : std::nullopt;
  if (!item || !order || item->configurationId != configurationId ||
      checkMutable(*order))
  {
    logger_->debug("Configuration {} is frozen, validation not recorded",
                   configurationId);
    return result;
  }

  configuration->recordValidation(result, clock_());
  uow.put(*configuration);

  if (auto conflict = uow.commit())
  {
    logger_->error("Validation of configuration {} not recorded: {}",
                   configurationId,
                   describe(*conflict));
    throw std::runtime_error(
      fmt::format("Configuration {} changed while locked: {}",
                  configurationId,
                  conflict->message));
  }
  return result;
}

// ============================================================================
// BOMs
// ============================================================================

BomResult WorkflowEngine::generateBOM(EntityId configurationId,
                                      const Actor& actor)
{
  return runBomRequest(configurationId, actor, false, {});
}

BomResult WorkflowEngine::requestBOM(EntityId orderItemId, const Actor& actor)
{
  auto item = store_.find<OrderItem>(orderItemId);
  if (!item)
  {
    return BomResult::failure(EngineError::notFound("OrderItem", orderItemId));
  }
  return runBomRequest(item->configurationId, actor, false, {});
}

BomResult WorkflowEngine::requestBOMOverride(EntityId orderItemId,
                                             const Actor& actor,
                                             const std::string& reason)
{
  if (!actor.isAdmin())
  {
    logger_->warn("Actor {} denied BOM override for item {}",
                  actor.actorId,
                  orderItemId);
    return BomResult::failure(EngineError::authorization(
      "Administrative override requires the ADMIN role"));
  }

  auto item = store_.find<OrderItem>(orderItemId);
  if (!item)
  {
    return BomResult::failure(EngineError::notFound("OrderItem", orderItemId));
  }
  return runBomRequest(item->configurationId, actor, true, reason);
}

BomResult WorkflowEngine::runBomRequest(EntityId configurationId,
                                        const Actor& actor,
                                        bool administrativeOverride,
                                        const std::string& reason)
{
  auto located = store_.find<Configuration>(configurationId);
  if (!located)
  {
    return BomResult::failure(
      EngineError::notFound("Configuration", configurationId));
  }
  auto owner = store_.find<OrderItem>(located->orderItemId);
  if (!owner)
  {
    return BomResult::failure(
      EngineError::notFound("OrderItem", located->orderItemId));
  }

  auto orderLock = store_.lockOrder(owner->orderId);
  auto configurationLock = store_.lockConfiguration(configurationId);
  UnitOfWork uow{store_};

  // Re-read under the locks
  auto configuration = uow.find<Configuration>(configurationId);
  auto item = uow.find<OrderItem>(owner->orderItemId);
  auto order = item ? uow.find<Order>(item->orderId) : std::nullopt;
  if (!configuration || !item || !order)
  {
    return BomResult::failure(
      EngineError::notFound("Configuration", configurationId));
  }

  if (item->configurationId != configurationId)
  {
    return BomResult::failure(EngineError::conflict(
      fmt::format("Configuration {} v{} has been superseded by configuration "
                  "{}",
                  configurationId,
                  configuration->version,
                  item->configurationId)));
  }

  if (!administrativeOverride)
  {
    if (auto error = checkMutable(*order))
    {
      logger_->warn("BOM request for configuration {} rejected: {}",
                    configurationId,
                    error->message);
      return BomResult::failure(std::move(*error));
    }
  }

  // ========== Validate and record ==========

  auto const validation = validator_.validate(*configuration);
  configuration->recordValidation(validation, clock_());
  uow.put(*configuration);

  if (!validation.isValid)
  {
    auto result =
      BomResult::failure(EngineError::validationFailed(validation.errors));
    result.validation = validation;
    if (auto conflict = uow.commit())
    {
      logger_->warn("Validation of configuration {} not recorded: {}",
                    configurationId,
                    describe(*conflict));
    }
    logger_->warn("Configuration {} failed validation with {} error(s)",
                  configurationId,
                  validation.errors.size());
    return result;
  }

  // ========== Synthesize ==========

  BomResult result;
  try
  {
    result = synthesizer_.generate(
      uow, configurationId, actor, administrativeOverride);
  }
  catch (const DataIntegrityError& e)
  {
    logger_->error("BOM generation for configuration {} aborted: {}",
                   configurationId,
                   e.what());
    throw;
  }
  if (!result.success)
  {
    return result;
  }

  // ========== Activate ==========

  auto prior = uow.select<Bom>(
    [configurationId](const Bom& b)
    { return b.configurationId == configurationId && b.status == BomStatus::Active; });
  std::string priorNumbers;
  for (auto& previous : prior)
  {
    if (previous.bomId == *result.bomId)
    {
      continue;
    }
    previous.status = BomStatus::Superseded;
    priorNumbers += priorNumbers.empty() ? previous.bomNumber
                                         : "," + previous.bomNumber;
    cancelOpenTasks(uow, previous);
    uow.put(std::move(previous));
  }

  auto bom = uow.find<Bom>(*result.bomId);
  bom->status = BomStatus::Active;
  uow.put(*bom);

  item->bomId = bom->bomId;
  uow.put(*item);

  auto const now = clock_();
  std::vector<AuditEvent> events;
  if (administrativeOverride)
  {
    events.push_back(AuditEvent{actor.actorId,
                                "BOM_OVERRIDE",
                                "Configuration",
                                configurationId,
                                toString(order->currentPhase),
                                bom->bomNumber,
                                now,
                                reason});
  }
  events.push_back(AuditEvent{actor.actorId,
                              "GENERATE_BOM",
                              "BOM",
                              bom->bomId,
                              priorNumbers,
                              bom->bomNumber,
                              now,
                              reason});

  const SinkSet& sinks = sinks_;
  uow.onCommit(
    [&sinks, events = std::move(events), committed = *bom]
    {
      for (const auto& event : events)
      {
        sinks.publish(event);
      }
      sinks.publishBom(committed);
    });

  if (auto conflict = uow.commit())
  {
    logger_->warn("BOM for configuration {} not committed: {}",
                  configurationId,
                  describe(*conflict));
    return BomResult::failure(std::move(*conflict));
  }

  logger_->info("Generated {} for configuration {} v{}: {} line(s), {} custom, "
                "cost {:.2f}{}",
                result.bomNumber,
                configurationId,
                configuration->version,
                result.totalParts,
                result.customPartsCount,
                result.totalCost,
                administrativeOverride ? " (override)" : "");
  return result;
}

// ============================================================================
// Lifecycle
// ============================================================================

TransitionResult WorkflowEngine::transitionOrderPhase(EntityId orderId,
                                                      OrderPhase target,
                                                      const Actor& actor,
                                                      const std::string& reason)
{
  auto orderLock = store_.lockOrder(orderId);
  UnitOfWork uow{store_};

  auto result = lifecycle_.transition(uow, orderId, target, actor, reason);
  if (!result.success)
  {
    return result;
  }

  if (auto conflict = uow.commit())
  {
    return TransitionResult::failure(std::move(*conflict));
  }
  return result;
}

TaskResult WorkflowEngine::completeTask(EntityId taskId, const Actor& actor)
{
  TaskResult result;

  if (!actor.isAdmin() && !actor.hasRole(Role::Assembler) &&
      !actor.hasRole(Role::ProductionCoordinator))
  {
    result.error = EngineError::authorization(
      fmt::format("Actor {} may not complete production tasks", actor.actorId));
    return result;
  }

  auto located = store_.find<ProductionTask>(taskId);
  if (!located)
  {
    result.error = EngineError::notFound("ProductionTask", taskId);
    return result;
  }
  auto owner = store_.find<OrderItem>(located->orderItemId);
  if (!owner)
  {
    result.error = EngineError::notFound("OrderItem", located->orderItemId);
    return result;
  }

  auto orderLock = store_.lockOrder(owner->orderId);
  UnitOfWork uow{store_};

  auto task = uow.find<ProductionTask>(taskId);
  auto item = uow.find<OrderItem>(owner->orderItemId);
  auto order = item ? uow.find<Order>(item->orderId) : std::nullopt;
  if (!task || !item || !order)
  {
    result.error = EngineError::notFound("ProductionTask", taskId);
    return result;
  }

  if (order->currentPhase != OrderPhase::Production)
  {
    auto error = EngineError::conflict(
      fmt::format("Tasks can only be completed in PRODUCTION (order {} is in "
                  "{})",
                  order->orderNumber,
                  toString(order->currentPhase)));
    error.currentPhase = order->currentPhase;
    result.error = std::move(error);
    return result;
  }
  if (task->status != TaskStatus::Pending)
  {
    result.error = EngineError::conflict(fmt::format(
      "Task {} is already {}", taskId, toString(task->status)));
    return result;
  }

  auto const now = clock_();
  task->status = TaskStatus::Completed;
  task->completedBy = actor.actorId;
  task->completedAt = now;
  uow.put(*task);

  EntityId const itemId = item->orderItemId;
  auto metrics = OrderPricing::metrics(
    itemId,
    currentBomTasks(*item,
                    uow.select<ProductionTask>(
                      [itemId](const ProductionTask& t)
                      { return t.orderItemId == itemId; })));
  item->productionStatus = metrics.status;
  uow.put(*item);

  AuditEvent audit{actor.actorId,
                   "COMPLETE_TASK",
                   "ProductionTask",
                   taskId,
                   toString(TaskStatus::Pending),
                   toString(TaskStatus::Completed),
                   now};
  const SinkSet& sinks = sinks_;
  uow.onCommit([&sinks, audit] { sinks.publish(audit); });

  if (auto conflict = uow.commit())
  {
    result.error = std::move(conflict);
    return result;
  }

  result.success = true;
  result.metrics = metrics;
  return result;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<OrderTotals> WorkflowEngine::calculateOrderTotals(
  EntityId orderId) const
{
  auto order = store_.find<Order>(orderId);
  if (!order)
  {
    return std::nullopt;
  }
  return OrderPricing::calculateTotals(*order, orderItems(orderId), pricing_);
}

std::optional<ProductionMetrics> WorkflowEngine::productionMetrics(
  EntityId orderItemId) const
{
  auto item = store_.find<OrderItem>(orderItemId);
  if (!item)
  {
    return std::nullopt;
  }
  return OrderPricing::metrics(orderItemId,
                               currentBomTasks(*item, tasks(orderItemId)));
}

std::optional<Order> WorkflowEngine::order(EntityId orderId) const
{
  return store_.find<Order>(orderId);
}

std::optional<OrderItem> WorkflowEngine::orderItem(EntityId orderItemId) const
{
  return store_.find<OrderItem>(orderItemId);
}

std::vector<OrderItem> WorkflowEngine::orderItems(EntityId orderId) const
{
  return store_.select<OrderItem>([orderId](const OrderItem& item)
                                  { return item.orderId == orderId; });
}

std::optional<Configuration> WorkflowEngine::configuration(
  EntityId configurationId) const
{
  return store_.find<Configuration>(configurationId);
}

std::optional<Bom> WorkflowEngine::bom(EntityId bomId) const
{
  return store_.find<Bom>(bomId);
}

std::optional<Bom> WorkflowEngine::activeBom(EntityId configurationId) const
{
  auto active = store_.select<Bom>(
    [configurationId](const Bom& b)
    { return b.configurationId == configurationId && b.status == BomStatus::Active; });
  if (active.empty())
  {
    return std::nullopt;
  }
  return active.front();
}

std::vector<Bom> WorkflowEngine::bomsForConfiguration(
  EntityId configurationId) const
{
  return store_.select<Bom>([configurationId](const Bom& b)
                            { return b.configurationId == configurationId; });
}

std::vector<OrderStatusHistory> WorkflowEngine::history(EntityId orderId) const
{
  return store_.select<OrderStatusHistory>(
    [orderId](const OrderStatusHistory& row) { return row.orderId == orderId; });
}

std::vector<ProductionTask> WorkflowEngine::tasks(EntityId orderItemId) const
{
  return store_.select<ProductionTask>(
    [orderItemId](const ProductionTask& task)
    { return task.orderItemId == orderItemId; });
}

std::vector<QcChecklist> WorkflowEngine::checklists(EntityId orderId) const
{
  return store_.select<QcChecklist>(
    [orderId](const QcChecklist& c) { return c.orderId == orderId; });
}

}  // namespace mfg_core
