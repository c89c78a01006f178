// Ticket: 0007_order_lifecycle

#include "mfg-core/src/Order/TransitionTable.hpp"

#include <array>
#include <utility>

namespace mfg_core
{

namespace
{

constexpr std::array<std::pair<OrderPhase, OrderPhase>, 8> kForwardEdges{{
  {OrderPhase::Draft, OrderPhase::Configuration},
  {OrderPhase::Configuration, OrderPhase::Approval},
  {OrderPhase::Approval, OrderPhase::Production},
  {OrderPhase::Production, OrderPhase::QualityControl},
  {OrderPhase::QualityControl, OrderPhase::Packaging},
  {OrderPhase::QualityControl, OrderPhase::Production},
  {OrderPhase::Packaging, OrderPhase::Shipping},
  {OrderPhase::Shipping, OrderPhase::Delivered},
}};

constexpr std::array<OrderPhase, 10> kAllPhases{OrderPhase::Draft,
                                                 OrderPhase::Configuration,
                                                 OrderPhase::Approval,
                                                 OrderPhase::Production,
                                                 OrderPhase::QualityControl,
                                                 OrderPhase::Packaging,
                                                 OrderPhase::Shipping,
                                                 OrderPhase::Delivered,
                                                 OrderPhase::Cancelled,
                                                 OrderPhase::OnHold};

}  // namespace

bool TransitionTable::isAllowed(OrderPhase from,
                                OrderPhase to,
                                std::optional<OrderPhase> suspendedFrom)
{
  if (isTerminal(from) || from == to)
  {
    return false;
  }

  if (to == OrderPhase::Cancelled)
  {
    return true;
  }
  if (to == OrderPhase::OnHold)
  {
    return from != OrderPhase::OnHold;
  }
  if (from == OrderPhase::OnHold)
  {
    return suspendedFrom.has_value() && *suspendedFrom == to;
  }

  for (const auto& [edgeFrom, edgeTo] : kForwardEdges)
  {
    if (edgeFrom == from && edgeTo == to)
    {
      return true;
    }
  }
  return false;
}

std::vector<OrderPhase> TransitionTable::targets(
  OrderPhase from,
  std::optional<OrderPhase> suspendedFrom)
{
  std::vector<OrderPhase> reachable;
  for (auto const phase : kAllPhases)
  {
    if (isAllowed(from, phase, suspendedFrom))
    {
      reachable.push_back(phase);
    }
  }
  return reachable;
}

}  // namespace mfg_core
