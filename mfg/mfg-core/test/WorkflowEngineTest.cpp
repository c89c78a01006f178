// Ticket: 0008_workflow_engine
// Test: WorkflowEngine end-to-end workflows

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "mfg-core/src/Engine.hpp"
#include "mfg-core/test/SinkFixtures.hpp"

using namespace mfg_core;
using namespace mfg_core::test;

class WorkflowEngineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    seedSinkCatalog(catalog_);
    audit_ = std::make_shared<InMemoryAuditSink>();
    tasks_ = std::make_shared<InMemoryTaskSink>();
    customParts_ = std::make_shared<CustomPartCapture>();

    WorkflowEngine::Config config;
    config.rules = sinkRules();

    SinkSet sinks;
    sinks.audit = audit_;
    sinks.tasks = tasks_;
    sinks.records.push_back(customParts_);
    engine_ = std::make_unique<WorkflowEngine>(
      catalog_, config, sinks, nullLogger(), fixedClock());
  }

  static ConfigurationSelection sink(double basins, double length)
  {
    ConfigurationSelection selection;
    selection.parameters["basinCount"] = basins;
    selection.parameters["sinkLength"] = length;
    return selection;
  }

  struct Placed
  {
    EntityId orderId{0};
    EntityId itemId{0};
    EntityId configurationId{0};
  };

  Placed placeOrder(const ConfigurationSelection& selection,
                    uint32_t quantity = 1)
  {
    auto order = engine_->createOrder("CUST-1", false, coordinator_);
    EXPECT_TRUE(order.success);

    OrderItemRequest request;
    request.assemblyId = kSinkAssembly;
    request.quantity = quantity;
    request.unitPrice = 2400.0;
    request.selection = selection;
    auto item = engine_->addOrderItem(order.orderId, request, coordinator_);
    EXPECT_TRUE(item.success);

    return Placed{order.orderId, item.orderItemId, item.configurationId};
  }

  void advance(EntityId orderId, std::vector<OrderPhase> phases)
  {
    for (auto phase : phases)
    {
      auto const& actor =
        phase == OrderPhase::Packaging ? inspector_ : coordinator_;
      auto result = engine_->transitionOrderPhase(orderId, phase, actor, "");
      ASSERT_TRUE(result.success)
        << "to " << toString(phase) << ": "
        << (result.error ? describe(*result.error) : "");
    }
  }

  /// Placed order with an Active BOM, moved to Production
  Placed orderInProduction(uint32_t quantity = 1)
  {
    auto placed = placeOrder(sink(2, 48), quantity);
    advance(placed.orderId, {OrderPhase::Configuration});
    EXPECT_TRUE(engine_->requestBOM(placed.itemId, coordinator_).success);
    advance(placed.orderId, {OrderPhase::Approval, OrderPhase::Production});
    return placed;
  }

  mfg_catalog::CatalogRegistry catalog_;
  std::shared_ptr<InMemoryAuditSink> audit_;
  std::shared_ptr<InMemoryTaskSink> tasks_;
  std::shared_ptr<CustomPartCapture> customParts_;
  std::unique_ptr<WorkflowEngine> engine_;

  Actor admin_{"admin", {Role::Admin}};
  Actor coordinator_{"coordinator", {Role::ProductionCoordinator}};
  Actor inspector_{"inspector", {Role::QcInspector}};
  Actor assembler_{"assembler", {Role::Assembler}};
};

// ============================================================================
// Scenarios
// ============================================================================

TEST_F(WorkflowEngineTest, ScenarioA_StandardSinkProducesStandardBom)
{
  auto placed = placeOrder(sink(2, 48));

  auto validation = engine_->validateConfiguration(placed.configurationId);
  ASSERT_TRUE(validation.has_value());
  EXPECT_TRUE(validation->isValid);
  EXPECT_TRUE(validation->errors.empty());

  auto result = engine_->generateBOM(placed.configurationId, coordinator_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.totalParts, kSinkCatalogLines);
  EXPECT_EQ(result.customPartsCount, 0u);
  EXPECT_NEAR(result.totalCost, kSinkCatalogCost, 1e-10);

  auto active = engine_->activeBom(placed.configurationId);
  ASSERT_TRUE(active.has_value());
  EXPECT_EQ(active->bomId, *result.bomId);
  EXPECT_EQ(engine_->orderItem(placed.itemId)->bomId, active->bomId);
  EXPECT_EQ(audit_->eventsWithAction("GENERATE_BOM").size(), 1u);
}

TEST_F(WorkflowEngineTest, ScenarioB_TooManyBasinsRefused)
{
  auto placed = placeOrder(sink(4, 48));

  auto validation = engine_->validateConfiguration(placed.configurationId);
  ASSERT_TRUE(validation.has_value());
  EXPECT_FALSE(validation->isValid);
  ASSERT_EQ(validation->errors.size(), 1u);
  EXPECT_EQ(validation->errors[0].ruleName, "basinCountRange");

  auto result = engine_->generateBOM(placed.configurationId, coordinator_);

  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::ValidationFailed);
  EXPECT_EQ(result.error->ruleName, "basinCountRange");
  ASSERT_TRUE(result.validation.has_value());
  EXPECT_FALSE(result.validation->isValid);
  EXPECT_TRUE(engine_->bomsForConfiguration(placed.configurationId).empty());

  auto configuration = engine_->configuration(placed.configurationId);
  EXPECT_TRUE(configuration->isValidated);
  EXPECT_FALSE(configuration->isValid);
}

TEST_F(WorkflowEngineTest, ScenarioC_NonCatalogPegboardMintsCustomPart)
{
  auto selection = sink(2, 48);
  selection.options["pegboardSize"] = "30x30";
  auto placed = placeOrder(selection);

  auto result = engine_->requestBOM(placed.itemId, coordinator_);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.customPartsCount, 1u);
  auto bom = engine_->bom(*result.bomId);
  ASSERT_TRUE(bom.has_value());
  EXPECT_EQ(bom->bomType, BomType::Custom);

  size_t customLines = 0;
  for (const auto& line : bom->lines)
  {
    if (line.isCustom)
    {
      ++customLines;
      EXPECT_EQ(line.componentId, "700-1025");
    }
  }
  EXPECT_EQ(customLines, 1u);
  EXPECT_TRUE(catalog_.findPart("700-1025")->isCustom);

  auto published = customParts_->parts();
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0].partId, "700-1025");

  // A second order for the same size reuses the part without republishing
  auto again = placeOrder(selection);
  ASSERT_TRUE(engine_->requestBOM(again.itemId, coordinator_).success);
  EXPECT_EQ(customParts_->parts().size(), 1u);
}

TEST_F(WorkflowEngineTest, ScenarioD_RegenerationInProductionRejected)
{
  auto placed = orderInProduction();
  auto before = engine_->activeBom(placed.configurationId);
  auto orderBefore = engine_->order(placed.orderId);

  auto result = engine_->requestBOM(placed.itemId, coordinator_);

  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::Conflict);

  auto after = engine_->activeBom(placed.configurationId);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->bomId, before->bomId);
  EXPECT_EQ(after->revision, before->revision);
  EXPECT_EQ(engine_->bomsForConfiguration(placed.configurationId).size(), 1u);
  EXPECT_EQ(engine_->order(placed.orderId)->revision, orderBefore->revision);
}

TEST_F(WorkflowEngineTest, ScenarioE_QcApprovalRequiresInspector)
{
  auto placed = orderInProduction();
  advance(placed.orderId, {OrderPhase::QualityControl});
  size_t const historyBefore = engine_->history(placed.orderId).size();

  auto result = engine_->transitionOrderPhase(
    placed.orderId, OrderPhase::Packaging, assembler_, "looks good");

  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::Authorization);
  EXPECT_EQ(result.error->currentPhase, OrderPhase::QualityControl);
  EXPECT_EQ(result.error->requestedPhase, OrderPhase::Packaging);
  EXPECT_EQ(engine_->history(placed.orderId).size(), historyBefore);
  EXPECT_EQ(engine_->order(placed.orderId)->currentPhase,
            OrderPhase::QualityControl);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(WorkflowEngineTest, OutOfTableTransition_NoMutation)
{
  auto placed = placeOrder(sink(2, 48));
  auto before = engine_->order(placed.orderId);

  auto result = engine_->transitionOrderPhase(
    placed.orderId, OrderPhase::Production, admin_, "rush");

  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::InvalidTransition);
  EXPECT_TRUE(engine_->history(placed.orderId).empty());
  auto after = engine_->order(placed.orderId);
  EXPECT_EQ(after->currentPhase, OrderPhase::Draft);
  EXPECT_EQ(after->revision, before->revision);
  EXPECT_TRUE(audit_->eventsWithAction("PHASE_CHANGE").empty());
}

TEST_F(WorkflowEngineTest, Production_RequiresActiveBomForEveryItem)
{
  auto placed = placeOrder(sink(2, 48));
  advance(placed.orderId, {OrderPhase::Configuration, OrderPhase::Approval});

  auto result = engine_->transitionOrderPhase(
    placed.orderId, OrderPhase::Production, coordinator_, "");

  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::Conflict);
  EXPECT_EQ(engine_->order(placed.orderId)->currentPhase, OrderPhase::Approval);
}

TEST_F(WorkflowEngineTest, History_RecordsEveryTransition)
{
  auto placed = orderInProduction();

  auto history = engine_->history(placed.orderId);

  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].fromPhase, OrderPhase::Draft);
  EXPECT_EQ(history[0].toPhase, OrderPhase::Configuration);
  EXPECT_EQ(history[2].toPhase, OrderPhase::Production);
  EXPECT_EQ(history[2].actorId, "coordinator");
  EXPECT_EQ(audit_->eventsWithAction("PHASE_CHANGE").size(), 3u);

  auto order = engine_->order(placed.orderId);
  EXPECT_TRUE(order->timestamps.configurationStartedAt.has_value());
  EXPECT_TRUE(order->timestamps.configurationCompletedAt.has_value());
  EXPECT_TRUE(order->timestamps.productionStartedAt.has_value());
}

TEST_F(WorkflowEngineTest, Approval_LocksActiveBom)
{
  auto placed = orderInProduction();

  auto bom = engine_->activeBom(placed.configurationId);
  ASSERT_TRUE(bom.has_value());
  EXPECT_TRUE(bom->isLocked);
  EXPECT_EQ(bom->status, BomStatus::Active);
}

TEST_F(WorkflowEngineTest, Production_GeneratesTasksAndNotifies)
{
  auto placed = orderInProduction(2);

  auto tasks = engine_->tasks(placed.itemId);
  ASSERT_EQ(tasks.size(), kSinkCatalogLines);
  for (const auto& task : tasks)
  {
    if (task.componentId == "LEG-34")
    {
      EXPECT_NEAR(task.quantity, 8.0, 1e-10);
    }
  }

  auto events = tasks_->events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].phase, OrderPhase::Production);
  EXPECT_EQ(events[0].orderItemId, placed.itemId);
  EXPECT_EQ(events[0].activeBomId, engine_->orderItem(placed.itemId)->bomId);
}

TEST_F(WorkflowEngineTest, QcRework_NoDuplicateTasksAndNewChecklist)
{
  auto placed = orderInProduction();
  advance(placed.orderId, {OrderPhase::QualityControl});

  auto rework = engine_->transitionOrderPhase(
    placed.orderId, OrderPhase::Production, inspector_, "weld porosity");
  ASSERT_TRUE(rework.success);
  EXPECT_TRUE(rework.createdTaskIds.empty());
  advance(placed.orderId, {OrderPhase::QualityControl});

  EXPECT_EQ(engine_->tasks(placed.itemId).size(), kSinkCatalogLines);
  auto checklists = engine_->checklists(placed.orderId);
  ASSERT_EQ(checklists.size(), 2u);
  EXPECT_EQ(checklists[0].attempt, 1u);
  EXPECT_EQ(checklists[1].attempt, 2u);
}

TEST_F(WorkflowEngineTest, OnHold_ResumesWithoutRerunningEntryEffects)
{
  auto placed = orderInProduction();
  size_t const eventsBefore = tasks_->events().size();

  advance(placed.orderId, {OrderPhase::OnHold});
  EXPECT_EQ(engine_->order(placed.orderId)->suspendedFrom,
            OrderPhase::Production);

  auto skip = engine_->transitionOrderPhase(
    placed.orderId, OrderPhase::QualityControl, coordinator_, "");
  EXPECT_FALSE(skip.success);

  advance(placed.orderId, {OrderPhase::Production});
  EXPECT_EQ(engine_->tasks(placed.itemId).size(), kSinkCatalogLines);
  EXPECT_EQ(tasks_->events().size(), eventsBefore);
  EXPECT_FALSE(engine_->order(placed.orderId)->suspendedFrom.has_value());
}

TEST_F(WorkflowEngineTest, FullWorkflow_ReachesDelivered)
{
  auto placed = orderInProduction();
  advance(placed.orderId,
          {OrderPhase::QualityControl,
           OrderPhase::Packaging,
           OrderPhase::Shipping,
           OrderPhase::Delivered});

  auto order = engine_->order(placed.orderId);
  EXPECT_EQ(order->currentPhase, OrderPhase::Delivered);
  EXPECT_TRUE(order->timestamps.actualDeliveryDate.has_value());

  auto cancel = engine_->transitionOrderPhase(
    placed.orderId, OrderPhase::Cancelled, admin_, "");
  EXPECT_FALSE(cancel.success);
}

// ============================================================================
// BOM regeneration
// ============================================================================

TEST_F(WorkflowEngineTest, Regeneration_SupersedesPreviousBom)
{
  auto placed = placeOrder(sink(2, 48));
  auto first = engine_->requestBOM(placed.itemId, coordinator_);
  auto second = engine_->requestBOM(placed.itemId, coordinator_);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);

  auto boms = engine_->bomsForConfiguration(placed.configurationId);
  ASSERT_EQ(boms.size(), 2u);
  EXPECT_EQ(engine_->bom(*first.bomId)->status, BomStatus::Superseded);
  EXPECT_EQ(engine_->bom(*second.bomId)->status, BomStatus::Active);
  EXPECT_EQ(engine_->orderItem(placed.itemId)->bomId, second.bomId);

  auto generated = audit_->eventsWithAction("GENERATE_BOM");
  ASSERT_EQ(generated.size(), 2u);
  EXPECT_EQ(generated[1].before, first.bomNumber);
  EXPECT_EQ(generated[1].after, second.bomNumber);
}

TEST_F(WorkflowEngineTest, Override_AdminOnlyAndAudited)
{
  auto placed = orderInProduction();
  auto original = engine_->activeBom(placed.configurationId);

  auto denied =
    engine_->requestBOMOverride(placed.itemId, coordinator_, "field fix");
  EXPECT_FALSE(denied.success);
  ASSERT_TRUE(denied.error.has_value());
  EXPECT_EQ(denied.error->kind, ErrorKind::Authorization);

  auto granted = engine_->requestBOMOverride(placed.itemId, admin_, "field fix");
  ASSERT_TRUE(granted.success);
  EXPECT_EQ(engine_->bom(original->bomId)->status, BomStatus::Superseded);
  EXPECT_EQ(engine_->activeBom(placed.configurationId)->bomId, granted.bomId);

  auto overrides = audit_->eventsWithAction("BOM_OVERRIDE");
  ASSERT_EQ(overrides.size(), 1u);
  EXPECT_EQ(overrides[0].actorId, "admin");
  EXPECT_EQ(overrides[0].reason, "field fix");
}

TEST_F(WorkflowEngineTest, OverrideInProduction_CancelsOpenTasksOfSupersededBom)
{
  auto placed = orderInProduction();
  auto original = engine_->tasks(placed.itemId);
  ASSERT_EQ(original.size(), kSinkCatalogLines);
  ASSERT_TRUE(engine_->completeTask(original[0].taskId, assembler_).success);

  auto granted =
    engine_->requestBOMOverride(placed.itemId, admin_, "revised drain");
  ASSERT_TRUE(granted.success);

  size_t cancelled = 0;
  for (const auto& task : engine_->tasks(placed.itemId))
  {
    if (task.status == TaskStatus::Cancelled)
    {
      ++cancelled;
    }
  }
  EXPECT_EQ(cancelled, kSinkCatalogLines - 1);

  auto stale = engine_->completeTask(original[1].taskId, assembler_);
  EXPECT_FALSE(stale.success);
  ASSERT_TRUE(stale.error.has_value());
  EXPECT_EQ(stale.error->kind, ErrorKind::Conflict);

  // Rework builds tasks for the new BOM; progress ignores the old set
  advance(placed.orderId, {OrderPhase::QualityControl});
  auto rework = engine_->transitionOrderPhase(
    placed.orderId, OrderPhase::Production, inspector_, "new BOM");
  ASSERT_TRUE(rework.success);
  EXPECT_EQ(rework.createdTaskIds.size(), kSinkCatalogLines);

  auto metrics = engine_->productionMetrics(placed.itemId);
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->totalTasks, kSinkCatalogLines);
  EXPECT_EQ(metrics->completedTasks, 0u);
  EXPECT_EQ(metrics->status, ProductionStatus::Pending);
}

TEST_F(WorkflowEngineTest, ValidateInProduction_LeavesConfigurationFrozen)
{
  auto placed = orderInProduction();
  auto before = engine_->configuration(placed.configurationId);
  ASSERT_TRUE(before->isValid);

  ConfigurationRule singleBasin;
  singleBasin.name = "singleBasinOnly";
  singleBasin.priority = 5;
  singleBasin.predicate = CountRule{"basinCount", 1, 1, true};
  engine_->validator().addRule(singleBasin);

  auto result = engine_->validateConfiguration(placed.configurationId);

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->isValid);
  auto after = engine_->configuration(placed.configurationId);
  EXPECT_TRUE(after->isValid);
  EXPECT_EQ(after->revision, before->revision);
  EXPECT_EQ(after->validatedAt, before->validatedAt);
}

TEST_F(WorkflowEngineTest, ValidateSupersededVersion_NotRecorded)
{
  auto placed = placeOrder(sink(2, 48));
  ConfigurationSelection changes;
  changes.parameters["basinCount"] = 4;
  auto revised =
    engine_->reviseConfiguration(placed.itemId, changes, coordinator_);
  ASSERT_TRUE(revised.success);

  auto result = engine_->validateConfiguration(placed.configurationId);

  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->isValid);
  EXPECT_FALSE(engine_->configuration(placed.configurationId)->isValidated);
}

TEST_F(WorkflowEngineTest, ConcurrentRequests_SingleActiveBom)
{
  auto placed = placeOrder(sink(2, 48));

  constexpr int kThreads = 8;
  std::vector<BomResult> results(kThreads);
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < kThreads; ++t)
    {
      threads.emplace_back(
        [this, &results, &placed, t]
        { results[t] = engine_->requestBOM(placed.itemId, coordinator_); });
    }
  }

  for (const auto& result : results)
  {
    EXPECT_TRUE(result.success);
  }
  size_t active = 0;
  for (const auto& bom : engine_->bomsForConfiguration(placed.configurationId))
  {
    if (bom.status == BomStatus::Active)
    {
      ++active;
    }
  }
  EXPECT_EQ(active, 1u);
}

TEST_F(WorkflowEngineTest, ConcurrentCustomRequests_DistinctNumbers)
{
  constexpr int kOrders = 6;
  std::vector<Placed> placed;
  for (int i = 0; i < kOrders; ++i)
  {
    auto selection = sink(2, 48);
    selection.options["pegboardSize"] = "custom-" + std::to_string(i);
    placed.push_back(placeOrder(selection));
  }

  std::vector<BomResult> results(kOrders);
  {
    std::vector<std::jthread> threads;
    for (int i = 0; i < kOrders; ++i)
    {
      threads.emplace_back(
        [this, &results, &placed, i]
        { results[i] = engine_->requestBOM(placed[i].itemId, coordinator_); });
    }
  }

  std::set<std::string> numbers;
  for (const auto& result : results)
  {
    ASSERT_TRUE(result.success);
    for (const auto& line : engine_->bom(*result.bomId)->lines)
    {
      if (line.isCustom)
      {
        numbers.insert(line.componentId);
      }
    }
  }
  EXPECT_EQ(numbers.size(), static_cast<size_t>(kOrders));
}

TEST_F(WorkflowEngineTest, ConcurrentSameCustomValue_OnePartPublishedOnce)
{
  constexpr int kRounds = 20;
  constexpr int kOrders = 4;

  for (int round = 0; round < kRounds; ++round)
  {
    auto selection = sink(2, 48);
    selection.options["pegboardSize"] = "99x" + std::to_string(round);
    std::vector<Placed> placed;
    for (int i = 0; i < kOrders; ++i)
    {
      placed.push_back(placeOrder(selection));
    }

    std::vector<BomResult> results(kOrders);
    {
      std::vector<std::jthread> threads;
      for (int i = 0; i < kOrders; ++i)
      {
        threads.emplace_back(
          [this, &results, &placed, i]
          { results[i] = engine_->requestBOM(placed[i].itemId, coordinator_); });
      }
    }

    std::set<std::string> numbers;
    for (const auto& result : results)
    {
      ASSERT_TRUE(result.success);
      for (const auto& line : engine_->bom(*result.bomId)->lines)
      {
        if (line.isCustom)
        {
          numbers.insert(line.componentId);
        }
      }
    }
    EXPECT_EQ(numbers.size(), 1u) << "round " << round;
  }

  auto published = customParts_->parts();
  EXPECT_EQ(published.size(), static_cast<size_t>(kRounds));
  std::set<std::string> distinct;
  for (const auto& part : published)
  {
    distinct.insert(part.partId);
  }
  EXPECT_EQ(distinct.size(), published.size());
}

TEST_F(WorkflowEngineTest, CyclicCatalog_ThrowsAndLeavesNoBom)
{
  catalog_.addAssembly(mfg_catalog::Assembly{
    "LOOP", "Loop", "SINKS", mfg_catalog::AssemblyLevel::SubAssembly, 1.0});
  catalog_.addComponent(sinkComponent(
    "LOOP", 60, 1.0, 0.0, mfg_catalog::ComponentType::Assembly));
  mfg_catalog::AssemblyComponent back;
  back.assemblyId = "LOOP";
  back.componentId = kSinkAssembly;
  back.type = mfg_catalog::ComponentType::Assembly;
  catalog_.addComponent(back);

  auto placed = placeOrder(sink(2, 48));

  EXPECT_THROW((void)engine_->requestBOM(placed.itemId, coordinator_),
               DataIntegrityError);
  EXPECT_TRUE(engine_->bomsForConfiguration(placed.configurationId).empty());
  EXPECT_FALSE(engine_->orderItem(placed.itemId)->bomId.has_value());
}

// ============================================================================
// Configuration revisions
// ============================================================================

TEST_F(WorkflowEngineTest, Revision_CreatesLinkedVersion)
{
  auto placed = placeOrder(sink(2, 48));

  ConfigurationSelection changes;
  changes.parameters["sinkLength"] = 60;
  auto revised =
    engine_->reviseConfiguration(placed.itemId, changes, coordinator_);

  ASSERT_TRUE(revised.success);
  EXPECT_EQ(revised.version, 2u);
  auto configuration = engine_->configuration(revised.configurationId);
  EXPECT_EQ(configuration->parentConfigurationId, placed.configurationId);
  EXPECT_EQ(configuration->selection.parameters.at("sinkLength"), 60.0);
  EXPECT_EQ(configuration->selection.parameters.at("basinCount"), 2.0);
  EXPECT_EQ(engine_->orderItem(placed.itemId)->configurationId,
            revised.configurationId);

  // The superseded version can no longer be generated
  auto stale = engine_->generateBOM(placed.configurationId, coordinator_);
  EXPECT_FALSE(stale.success);
  EXPECT_EQ(stale.error->kind, ErrorKind::Conflict);
}

TEST_F(WorkflowEngineTest, Revision_RejectedAfterConfiguration)
{
  auto placed = orderInProduction();

  auto revised = engine_->reviseConfiguration(
    placed.itemId, sink(3, 60), coordinator_);

  EXPECT_FALSE(revised.success);
  ASSERT_TRUE(revised.error.has_value());
  EXPECT_EQ(revised.error->kind, ErrorKind::Conflict);
}

TEST_F(WorkflowEngineTest, AddItem_UnknownAssemblyNotFound)
{
  auto order = engine_->createOrder("CUST-1", false, coordinator_);
  OrderItemRequest request;
  request.assemblyId = "NO-SUCH-SINK";

  auto item = engine_->addOrderItem(order.orderId, request, coordinator_);

  EXPECT_FALSE(item.success);
  ASSERT_TRUE(item.error.has_value());
  EXPECT_EQ(item.error->kind, ErrorKind::NotFound);
}

TEST_F(WorkflowEngineTest, OrderNumbers_SequentialPerYear)
{
  auto first = engine_->createOrder("CUST-1", false, coordinator_);
  auto second = engine_->createOrder("CUST-2", true, coordinator_);

  EXPECT_EQ(first.orderNumber, "ORD-2024-0001");
  EXPECT_EQ(second.orderNumber, "ORD-2024-0002");
}

// ============================================================================
// Tasks, metrics and totals
// ============================================================================

TEST_F(WorkflowEngineTest, CompleteTasks_DrivesProductionStatus)
{
  auto placed = orderInProduction();
  auto tasks = engine_->tasks(placed.itemId);
  ASSERT_FALSE(tasks.empty());

  auto denied = engine_->completeTask(tasks[0].taskId, inspector_);
  EXPECT_FALSE(denied.success);
  EXPECT_EQ(denied.error->kind, ErrorKind::Authorization);

  auto first = engine_->completeTask(tasks[0].taskId, assembler_);
  ASSERT_TRUE(first.success);
  EXPECT_EQ(first.metrics->status, ProductionStatus::InProgress);

  auto repeat = engine_->completeTask(tasks[0].taskId, assembler_);
  EXPECT_FALSE(repeat.success);
  EXPECT_EQ(repeat.error->kind, ErrorKind::Conflict);

  for (size_t i = 1; i < tasks.size(); ++i)
  {
    ASSERT_TRUE(engine_->completeTask(tasks[i].taskId, assembler_).success);
  }

  auto metrics = engine_->productionMetrics(placed.itemId);
  ASSERT_TRUE(metrics.has_value());
  EXPECT_EQ(metrics->status, ProductionStatus::Completed);
  EXPECT_NEAR(metrics->completionPercentage, 100.0, 1e-10);
  EXPECT_EQ(engine_->orderItem(placed.itemId)->productionStatus,
            ProductionStatus::Completed);
}

TEST_F(WorkflowEngineTest, CompleteTask_OutsideProductionConflict)
{
  auto placed = orderInProduction();
  auto tasks = engine_->tasks(placed.itemId);
  advance(placed.orderId, {OrderPhase::QualityControl});

  auto result = engine_->completeTask(tasks[0].taskId, assembler_);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::Conflict);
}

TEST_F(WorkflowEngineTest, OrderTotals_FromItems)
{
  auto placed = placeOrder(sink(2, 48), 2);

  auto totals = engine_->calculateOrderTotals(placed.orderId);

  ASSERT_TRUE(totals.has_value());
  EXPECT_NEAR(totals->subtotal, 4800.0, 1e-10);
  EXPECT_NEAR(totals->taxAmount, 420.0, 1e-10);
  EXPECT_NEAR(totals->shippingAmount, 150.0, 1e-10);
  EXPECT_NEAR(totals->total, 5370.0, 1e-10);
  EXPECT_FALSE(engine_->calculateOrderTotals(424242).has_value());
}
