#ifndef MFG_CORE_DATATYPES_WORKFLOW_TYPES_HPP
#define MFG_CORE_DATATYPES_WORKFLOW_TYPES_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "mfg-catalog/src/CatalogTypes.hpp"

namespace mfg_core
{

using EntityId = uint64_t;
using TimePoint = mfg_catalog::TimePoint;

/// Time source; injectable so tests can pin timestamps
using Clock = std::function<TimePoint()>;

Clock systemClock();

// ============================================================================
// Order phases
// ============================================================================

enum class OrderPhase : uint8_t
{
  Draft,
  Configuration,
  Approval,
  Production,
  QualityControl,
  Packaging,
  Shipping,
  Delivered,
  Cancelled,
  OnHold
};

const char* toString(OrderPhase phase);
std::optional<OrderPhase> parseOrderPhase(std::string_view name);

/// Delivered and Cancelled accept no further transitions
bool isTerminal(OrderPhase phase);

/// Configuration and BOM may be regenerated without an override
bool isMutablePhase(OrderPhase phase);

// ============================================================================
// BOM status
// ============================================================================

enum class BomStatus : uint8_t
{
  Draft,
  PendingApproval,
  Approved,
  Active,
  Superseded
};

const char* toString(BomStatus status);

enum class BomType : uint8_t
{
  Standard,
  Custom
};

const char* toString(BomType type);

// ============================================================================
// Production
// ============================================================================

enum class ProductionStatus : uint8_t
{
  Pending,
  InProgress,
  Completed
};

const char* toString(ProductionStatus status);

/// Open tasks of a superseded BOM are Cancelled
enum class TaskStatus : uint8_t
{
  Pending,
  Completed,
  Cancelled
};

const char* toString(TaskStatus status);

// ============================================================================
// Actors
// ============================================================================

enum class Role : uint8_t
{
  Admin,
  ProductionCoordinator,
  ProcurementManager,
  QcInspector,
  Assembler,
  ServiceDept
};

const char* toString(Role role);
std::optional<Role> parseRole(std::string_view name);

/**
 * @brief Authenticated caller of an engine operation
 *
 * Authentication happens upstream; the engine only checks roles.
 */
struct Actor
{
  std::string actorId;
  std::set<Role> roles;

  [[nodiscard]] bool hasRole(Role role) const
  {
    return roles.count(role) > 0;
  }

  [[nodiscard]] bool isAdmin() const
  {
    return hasRole(Role::Admin);
  }
};

}  // namespace mfg_core

#endif  // MFG_CORE_DATATYPES_WORKFLOW_TYPES_HPP
