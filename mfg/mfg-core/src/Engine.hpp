// Ticket: 0008_workflow_engine

#ifndef MFG_CORE_ENGINE_HPP
#define MFG_CORE_ENGINE_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "mfg-catalog/src/CatalogRegistry.hpp"
#include "mfg-core/src/Bom/BomSynthesizer.hpp"
#include "mfg-core/src/Bom/CustomPartNumbering.hpp"
#include "mfg-core/src/Bom/DocumentNumbering.hpp"
#include "mfg-core/src/Configuration/ConfigurationValidator.hpp"
#include "mfg-core/src/Order/OrderLifecycleManager.hpp"
#include "mfg-core/src/Order/OrderPricing.hpp"
#include "mfg-core/src/Sinks/Sinks.hpp"
#include "mfg-core/src/Store/WorkflowStore.hpp"

namespace mfg_core
{

struct OrderResult
{
  bool success{false};
  EntityId orderId{0};
  std::string orderNumber;
  std::optional<EngineError> error;
};

/**
 * @brief Order line to add, with the initial configuration of its assembly
 */
struct OrderItemRequest
{
  std::string assemblyId;
  uint32_t quantity{1};
  double unitPrice{0.0};
  double discountPercentage{0.0};
  ConfigurationSelection selection;
};

struct OrderItemResult
{
  bool success{false};
  EntityId orderItemId{0};
  EntityId configurationId{0};
  std::optional<EngineError> error;
};

struct ConfigurationResult
{
  bool success{false};
  EntityId configurationId{0};
  uint32_t version{0};
  std::optional<EngineError> error;
};

struct TaskResult
{
  bool success{false};
  std::optional<ProductionMetrics> metrics;
  std::optional<EngineError> error;
};

/**
 * @brief Top-level workflow orchestrator
 *
 * Owns the store and wires validator -> synthesizer -> persistence together
 * with the lifecycle manager. Every mutating operation runs in its own
 * UnitOfWork under the order lock, and BOM requests additionally under the
 * configuration lock (order lock first). Expected failures come back inside
 * the result; DataIntegrityError propagates after the unit of work has been
 * rolled back.
 *
 * Thread Safety:
 *   All public methods may be called concurrently.
 *
 * @ticket 0008_workflow_engine
 */
class WorkflowEngine
{
public:
  struct Config
  {
    CustomPartNumbering::Series customPartSeries;
    std::map<std::string, CustomPartNumbering::Series> categorySeries;
    DocumentNumbering::Config documentNumbering;
    PricingPolicy pricing;
    PhasePermissions permissions{PhasePermissions::defaults()};
    std::vector<ConfigurationRule> rules;
  };

  /**
   * @param catalog Catalog read by synthesis; custom parts are registered in
   * it
   * @param config Numbering, pricing, permission and rule setup
   * @param sinks Audit, task and record sinks; null members drop events
   * @param logger Logger, or nullptr for the shared default
   * @param clock Time source
   * @throws std::invalid_argument on a malformed numbering series or
   * duplicate rule name
   */
  WorkflowEngine(mfg_catalog::CatalogRegistry& catalog,
                 const Config& config,
                 SinkSet sinks,
                 std::shared_ptr<spdlog::logger> logger = nullptr,
                 Clock clock = systemClock());

  WorkflowEngine(const WorkflowEngine&) = delete;
  WorkflowEngine& operator=(const WorkflowEngine&) = delete;

  // ========== Orders and configurations ==========

  OrderResult createOrder(const std::string& customerId,
                          bool taxExempt,
                          const Actor& actor);

  /**
   * @brief Add an item and its version 1 configuration
   *
   * Failures: NotFound (order or assembly), Conflict (order past
   * Configuration).
   */
  OrderItemResult addOrderItem(EntityId orderId,
                               const OrderItemRequest& request,
                               const Actor& actor);

  /**
   * @brief Create the next configuration version for an item
   *
   * The new version links to its parent and carries the parent's selection
   * with changes applied. The item points at the new version.
   */
  ConfigurationResult reviseConfiguration(
    EntityId orderItemId,
    const ConfigurationSelection& changes,
    const Actor& actor);

  /// Evaluate the rule set without recording anything
  [[nodiscard]] ValidationResult validateConfiguration(
    const Configuration& configuration) const;

  /**
   * @brief Evaluate a stored configuration and record the result on it
   *
   * The result is recorded only while the owning order is in Draft or
   * Configuration and the configuration is the item's newest version.
   * Otherwise the configuration is frozen and the result is returned
   * without being stored.
   *
   * @return std::nullopt if the configuration does not exist
   * @throws std::runtime_error if recording conflicts with a concurrent
   * write, which the order and configuration locks rule out
   */
  std::optional<ValidationResult> validateConfiguration(
    EntityId configurationId);

  // ========== BOMs ==========

  /**
   * @brief Validate, synthesize and activate a BOM for a configuration
   *
   * In one unit of work the previous Active BOM of the configuration becomes
   * Superseded and the new one Active. Only the newest configuration version
   * of an item can be generated.
   *
   * @throws DataIntegrityError on a cyclic or dangling catalog reference
   */
  BomResult generateBOM(EntityId configurationId, const Actor& actor);

  /// generateBOM() for an order item's current configuration
  BomResult requestBOM(EntityId orderItemId, const Actor& actor);

  /**
   * @brief Regenerate a BOM after the order has left Configuration
   *
   * Admin only (Authorization otherwise). Audited as BOM_OVERRIDE in
   * addition to the regular generation event.
   */
  BomResult requestBOMOverride(EntityId orderItemId,
                               const Actor& actor,
                               const std::string& reason);

  // ========== Lifecycle ==========

  TransitionResult transitionOrderPhase(EntityId orderId,
                                        OrderPhase target,
                                        const Actor& actor,
                                        const std::string& reason);

  /**
   * @brief Mark a production task done
   *
   * Allowed for Assembler, ProductionCoordinator and Admin while the order is
   * in Production.
   */
  TaskResult completeTask(EntityId taskId, const Actor& actor);

  // ========== Queries ==========

  [[nodiscard]] std::optional<OrderTotals> calculateOrderTotals(
    EntityId orderId) const;
  [[nodiscard]] std::optional<ProductionMetrics> productionMetrics(
    EntityId orderItemId) const;

  [[nodiscard]] std::optional<Order> order(EntityId orderId) const;
  [[nodiscard]] std::optional<OrderItem> orderItem(EntityId orderItemId) const;
  [[nodiscard]] std::vector<OrderItem> orderItems(EntityId orderId) const;
  [[nodiscard]] std::optional<Configuration> configuration(
    EntityId configurationId) const;
  [[nodiscard]] std::optional<Bom> bom(EntityId bomId) const;
  [[nodiscard]] std::optional<Bom> activeBom(EntityId configurationId) const;
  [[nodiscard]] std::vector<Bom> bomsForConfiguration(
    EntityId configurationId) const;
  [[nodiscard]] std::vector<OrderStatusHistory> history(EntityId orderId) const;
  [[nodiscard]] std::vector<ProductionTask> tasks(EntityId orderItemId) const;
  [[nodiscard]] std::vector<QcChecklist> checklists(EntityId orderId) const;

  ConfigurationValidator& validator()
  {
    return validator_;
  }

  CustomPartNumbering& customPartNumbering()
  {
    return numbering_;
  }

private:
  BomResult runBomRequest(EntityId configurationId,
                          const Actor& actor,
                          bool administrativeOverride,
                          const std::string& reason);

  mfg_catalog::CatalogRegistry& catalog_;
  PricingPolicy pricing_;
  SinkSet sinks_;
  std::shared_ptr<spdlog::logger> logger_;
  Clock clock_;

  WorkflowStore store_;
  ConfigurationValidator validator_;
  CustomPartNumbering numbering_;
  DocumentNumbering documents_;
  BomSynthesizer synthesizer_;
  OrderLifecycleManager lifecycle_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_ENGINE_HPP
