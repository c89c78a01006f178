#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"

#include <array>
#include <chrono>
#include <utility>

namespace mfg_core
{

namespace
{

constexpr std::array<std::pair<OrderPhase, const char*>, 10> kPhaseNames{{
  {OrderPhase::Draft, "DRAFT"},
  {OrderPhase::Configuration, "CONFIGURATION"},
  {OrderPhase::Approval, "APPROVAL"},
  {OrderPhase::Production, "PRODUCTION"},
  {OrderPhase::QualityControl, "QUALITY_CONTROL"},
  {OrderPhase::Packaging, "PACKAGING"},
  {OrderPhase::Shipping, "SHIPPING"},
  {OrderPhase::Delivered, "DELIVERED"},
  {OrderPhase::Cancelled, "CANCELLED"},
  {OrderPhase::OnHold, "ON_HOLD"},
}};

constexpr std::array<std::pair<Role, const char*>, 6> kRoleNames{{
  {Role::Admin, "ADMIN"},
  {Role::ProductionCoordinator, "PRODUCTION_COORDINATOR"},
  {Role::ProcurementManager, "PROCUREMENT_MANAGER"},
  {Role::QcInspector, "QC_INSPECTOR"},
  {Role::Assembler, "ASSEMBLER"},
  {Role::ServiceDept, "SERVICE_DEPT"},
}};

}  // namespace

Clock systemClock()
{
  return [] { return std::chrono::system_clock::now(); };
}

const char* toString(OrderPhase phase)
{
  for (const auto& [value, name] : kPhaseNames)
  {
    if (value == phase)
    {
      return name;
    }
  }
  return "UNKNOWN";
}

std::optional<OrderPhase> parseOrderPhase(std::string_view name)
{
  for (const auto& [value, phaseName] : kPhaseNames)
  {
    if (name == phaseName)
    {
      return value;
    }
  }
  return std::nullopt;
}

bool isTerminal(OrderPhase phase)
{
  return phase == OrderPhase::Delivered || phase == OrderPhase::Cancelled;
}

bool isMutablePhase(OrderPhase phase)
{
  return phase == OrderPhase::Draft || phase == OrderPhase::Configuration;
}

const char* toString(BomStatus status)
{
  switch (status)
  {
    case BomStatus::Draft:
      return "DRAFT";
    case BomStatus::PendingApproval:
      return "PENDING_APPROVAL";
    case BomStatus::Approved:
      return "APPROVED";
    case BomStatus::Active:
      return "ACTIVE";
    case BomStatus::Superseded:
      return "SUPERSEDED";
  }
  return "UNKNOWN";
}

const char* toString(BomType type)
{
  return type == BomType::Custom ? "CUSTOM" : "STANDARD";
}

const char* toString(ProductionStatus status)
{
  switch (status)
  {
    case ProductionStatus::Pending:
      return "PENDING";
    case ProductionStatus::InProgress:
      return "IN_PROGRESS";
    case ProductionStatus::Completed:
      return "COMPLETED";
  }
  return "UNKNOWN";
}

const char* toString(TaskStatus status)
{
  switch (status)
  {
    case TaskStatus::Pending:
      return "PENDING";
    case TaskStatus::Completed:
      return "COMPLETED";
    case TaskStatus::Cancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* toString(Role role)
{
  for (const auto& [value, name] : kRoleNames)
  {
    if (value == role)
    {
      return name;
    }
  }
  return "UNKNOWN";
}

std::optional<Role> parseRole(std::string_view name)
{
  for (const auto& [value, roleName] : kRoleNames)
  {
    if (name == roleName)
    {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace mfg_core
