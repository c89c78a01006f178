#ifndef MFG_CORE_ORDER_ORDER_HPP
#define MFG_CORE_ORDER_ORDER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"

namespace mfg_core
{

/**
 * @brief Timestamps stamped by phase transitions
 */
struct PhaseTimestamps
{
  std::optional<TimePoint> configurationStartedAt;
  std::optional<TimePoint> configurationCompletedAt;
  std::optional<TimePoint> productionStartedAt;
  std::optional<TimePoint> productionCompletedAt;
  std::optional<TimePoint> qcStartedAt;
  std::optional<TimePoint> qcCompletedAt;
  std::optional<TimePoint> actualDeliveryDate;
};

/**
 * @brief Aggregate root of the workflow
 *
 * currentPhase only changes through OrderLifecycleManager::transition.
 */
struct Order
{
  EntityId orderId{0};
  std::string orderNumber;
  std::string customerId;
  bool taxExempt{false};
  OrderPhase currentPhase{OrderPhase::Draft};
  std::optional<OrderPhase> suspendedFrom;  // Set while OnHold
  TimePoint phaseEnteredAt{};
  PhaseTimestamps timestamps;
  std::vector<EntityId> itemIds;
  std::string createdBy;
  TimePoint createdAt{};
  uint64_t revision{0};
};

struct OrderItem
{
  EntityId orderItemId{0};
  EntityId orderId{0};
  uint32_t lineNumber{0};
  std::string assemblyId;
  uint32_t quantity{1};
  double unitPrice{0.0};           // [USD]
  double discountPercentage{0.0};  // [0, 100]
  EntityId configurationId{0};     // Newest configuration version
  std::optional<EntityId> bomId;   // Active BOM, once generated
  ProductionStatus productionStatus{ProductionStatus::Pending};
  uint64_t revision{0};
};

/**
 * @brief Append-only record of one phase transition
 */
struct OrderStatusHistory
{
  EntityId historyId{0};
  EntityId orderId{0};
  OrderPhase fromPhase{OrderPhase::Draft};
  OrderPhase toPhase{OrderPhase::Draft};
  std::string actorId;
  TimePoint timestamp{};
  std::string reason;
  std::chrono::milliseconds durationInPriorPhase{0};
  uint64_t revision{0};
};

/**
 * @brief Work item generated from an Active BOM line on entering Production
 */
struct ProductionTask
{
  EntityId taskId{0};
  EntityId orderItemId{0};
  EntityId bomId{0};
  uint32_t bomLineNumber{0};
  std::string componentId;
  double quantity{0.0};
  std::string description;
  TaskStatus status{TaskStatus::Pending};
  std::optional<std::string> completedBy;
  std::optional<TimePoint> completedAt;
  uint64_t revision{0};
};

/**
 * @brief Inspection instance created each time an order enters QualityControl
 */
struct QcChecklist
{
  EntityId checklistId{0};
  EntityId orderId{0};
  uint32_t attempt{1};
  std::vector<EntityId> orderItemIds;
  std::string createdBy;
  TimePoint createdAt{};
  uint64_t revision{0};
};

}  // namespace mfg_core

#endif  // MFG_CORE_ORDER_ORDER_HPP
