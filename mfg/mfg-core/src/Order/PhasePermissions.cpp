// Ticket: 0007_order_lifecycle

#include "mfg-core/src/Order/PhasePermissions.hpp"

#include <utility>

namespace mfg_core
{

PhasePermissions::PhasePermissions(std::map<Role, std::set<OrderPhase>> grants)
  : grants_{std::move(grants)}
{
}

PhasePermissions PhasePermissions::defaults()
{
  using P = OrderPhase;
  return PhasePermissions{{
    {Role::ProductionCoordinator,
     {P::Configuration,
      P::Approval,
      P::Production,
      P::QualityControl,
      P::Shipping,
      P::Delivered,
      P::OnHold,
      P::Cancelled}},
    {Role::QcInspector, {P::Packaging, P::Production}},
    {Role::Assembler, {P::QualityControl}},
    {Role::ProcurementManager, {P::OnHold}},
    {Role::ServiceDept, {P::Shipping, P::Delivered}},
  }};
}

void PhasePermissions::grant(Role role, OrderPhase target)
{
  grants_[role].insert(target);
}

bool PhasePermissions::isAuthorized(const Actor& actor, OrderPhase target) const
{
  if (actor.isAdmin())
  {
    return true;
  }
  for (auto const role : actor.roles)
  {
    auto it = grants_.find(role);
    if (it != grants_.end() && it->second.count(target) > 0)
    {
      return true;
    }
  }
  return false;
}

}  // namespace mfg_core
