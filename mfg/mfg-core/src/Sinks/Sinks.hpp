#ifndef MFG_CORE_SINKS_SINKS_HPP
#define MFG_CORE_SINKS_SINKS_HPP

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mfg-catalog/src/CatalogTypes.hpp"
#include "mfg-core/src/Bom/Bom.hpp"
#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"
#include "mfg-core/src/Order/Order.hpp"

namespace mfg_core
{

// ============================================================================
// Audit
// ============================================================================

/**
 * @brief Immutable record of a committed state change
 *
 * before/after are short renderings of the changed value (phase names, BOM
 * numbers), not full entity dumps.
 */
struct AuditEvent
{
  std::string actorId;
  std::string action;  // e.g. GENERATE_BOM, PHASE_CHANGE, BOM_OVERRIDE
  std::string entityType;
  EntityId entityId{0};
  std::string before;
  std::string after;
  TimePoint timestamp{};
  std::string reason;
};

class AuditSink
{
public:
  virtual ~AuditSink() = default;
  virtual void record(const AuditEvent& event) = 0;
};

// ============================================================================
// Task / notification
// ============================================================================

/**
 * @brief Emitted per order item when an order enters Production or
 * QualityControl
 */
struct PhaseEvent
{
  EntityId orderId{0};
  EntityId orderItemId{0};
  OrderPhase phase{OrderPhase::Production};
  std::optional<EntityId> activeBomId;
  std::string bomNumber;
  TimePoint timestamp{};
};

class TaskSink
{
public:
  virtual ~TaskSink() = default;
  virtual void onPhaseEntered(const PhaseEvent& event) = 0;
};

// ============================================================================
// Committed records
// ============================================================================

/**
 * @brief Observer of committed artifacts, used by exporters
 */
class RecordSink
{
public:
  virtual ~RecordSink() = default;
  virtual void onBomCommitted(const Bom& bom) = 0;
  virtual void onHistoryAppended(const OrderStatusHistory& row) = 0;
  virtual void onCustomPartRegistered(const mfg_catalog::Part& part) = 0;
};

/**
 * @brief Every sink an engine component publishes to
 *
 * Null audit or task sinks are allowed and simply drop events.
 */
struct SinkSet
{
  std::shared_ptr<AuditSink> audit;
  std::shared_ptr<TaskSink> tasks;
  std::vector<std::shared_ptr<RecordSink>> records;

  void publish(const AuditEvent& event) const;
  void publish(const PhaseEvent& event) const;
  void publishBom(const Bom& bom) const;
  void publishHistory(const OrderStatusHistory& row) const;
  void publishCustomPart(const mfg_catalog::Part& part) const;
};

// ============================================================================
// In-memory sinks
// ============================================================================

/**
 * @brief Thread-safe audit sink that keeps every event in memory
 */
class InMemoryAuditSink : public AuditSink
{
public:
  void record(const AuditEvent& event) override;

  [[nodiscard]] std::vector<AuditEvent> events() const;
  [[nodiscard]] std::vector<AuditEvent> eventsWithAction(
    const std::string& action) const;

private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
};

class InMemoryTaskSink : public TaskSink
{
public:
  void onPhaseEntered(const PhaseEvent& event) override;

  [[nodiscard]] std::vector<PhaseEvent> events() const;

private:
  mutable std::mutex mutex_;
  std::vector<PhaseEvent> events_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_SINKS_SINKS_HPP
