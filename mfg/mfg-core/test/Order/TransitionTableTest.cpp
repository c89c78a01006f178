// Ticket: 0007_order_lifecycle
// Test: TransitionTable and PhasePermissions

#include <gtest/gtest.h>

#include <algorithm>

#include "mfg-core/src/Order/PhasePermissions.hpp"
#include "mfg-core/src/Order/TransitionTable.hpp"

using namespace mfg_core;

// ============================================================================
// Transition table
// ============================================================================

TEST(TransitionTable, ForwardChain_Allowed)
{
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::Draft,
                                         OrderPhase::Configuration));
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::Configuration,
                                         OrderPhase::Approval));
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::Approval,
                                         OrderPhase::Production));
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::Production,
                                         OrderPhase::QualityControl));
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::QualityControl,
                                         OrderPhase::Packaging));
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::Packaging,
                                         OrderPhase::Shipping));
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::Shipping,
                                         OrderPhase::Delivered));
}

TEST(TransitionTable, QcRework_BackToProduction)
{
  EXPECT_TRUE(TransitionTable::isAllowed(OrderPhase::QualityControl,
                                         OrderPhase::Production));
  EXPECT_FALSE(TransitionTable::isAllowed(OrderPhase::Packaging,
                                          OrderPhase::Production));
}

TEST(TransitionTable, SkippingPhases_Rejected)
{
  EXPECT_FALSE(TransitionTable::isAllowed(OrderPhase::Draft,
                                          OrderPhase::Production));
  EXPECT_FALSE(TransitionTable::isAllowed(OrderPhase::Configuration,
                                          OrderPhase::Production));
  EXPECT_FALSE(TransitionTable::isAllowed(OrderPhase::Production,
                                          OrderPhase::Packaging));
  EXPECT_FALSE(TransitionTable::isAllowed(OrderPhase::Draft,
                                          OrderPhase::Draft));
}

TEST(TransitionTable, TerminalPhases_HaveNoTargets)
{
  EXPECT_TRUE(TransitionTable::targets(OrderPhase::Delivered).empty());
  EXPECT_TRUE(TransitionTable::targets(OrderPhase::Cancelled).empty());
  EXPECT_FALSE(TransitionTable::isAllowed(OrderPhase::Delivered,
                                          OrderPhase::Cancelled));
}

TEST(TransitionTable, CancelAndHold_FromAnyActivePhase)
{
  for (auto phase : {OrderPhase::Draft,
                     OrderPhase::Configuration,
                     OrderPhase::Approval,
                     OrderPhase::Production,
                     OrderPhase::QualityControl,
                     OrderPhase::Packaging,
                     OrderPhase::Shipping})
  {
    EXPECT_TRUE(TransitionTable::isAllowed(phase, OrderPhase::Cancelled))
      << toString(phase);
    EXPECT_TRUE(TransitionTable::isAllowed(phase, OrderPhase::OnHold))
      << toString(phase);
  }
}

TEST(TransitionTable, OnHold_ResumesOnlyToSuspendedPhase)
{
  EXPECT_TRUE(TransitionTable::isAllowed(
    OrderPhase::OnHold, OrderPhase::Production, OrderPhase::Production));
  EXPECT_FALSE(TransitionTable::isAllowed(
    OrderPhase::OnHold, OrderPhase::QualityControl, OrderPhase::Production));
  EXPECT_TRUE(TransitionTable::isAllowed(
    OrderPhase::OnHold, OrderPhase::Cancelled, OrderPhase::Production));
  EXPECT_FALSE(TransitionTable::isAllowed(
    OrderPhase::OnHold, OrderPhase::OnHold, OrderPhase::Production));

  auto targets =
    TransitionTable::targets(OrderPhase::OnHold, OrderPhase::Approval);
  ASSERT_EQ(targets.size(), 2u);
  EXPECT_NE(std::find(targets.begin(), targets.end(), OrderPhase::Approval),
            targets.end());
  EXPECT_NE(std::find(targets.begin(), targets.end(), OrderPhase::Cancelled),
            targets.end());
}

// ============================================================================
// Permissions
// ============================================================================

TEST(PhasePermissions, Defaults_QcApprovalReservedForInspector)
{
  auto permissions = PhasePermissions::defaults();
  Actor inspector{"qc-1", {Role::QcInspector}};
  Actor assembler{"asm-1", {Role::Assembler}};
  Actor coordinator{"pc-1", {Role::ProductionCoordinator}};
  Actor admin{"admin", {Role::Admin}};

  EXPECT_TRUE(permissions.isAuthorized(inspector, OrderPhase::Packaging));
  EXPECT_FALSE(permissions.isAuthorized(assembler, OrderPhase::Packaging));
  EXPECT_FALSE(permissions.isAuthorized(coordinator, OrderPhase::Packaging));
  EXPECT_TRUE(permissions.isAuthorized(admin, OrderPhase::Packaging));
}

TEST(PhasePermissions, NoRoles_NothingAuthorized)
{
  auto permissions = PhasePermissions::defaults();
  Actor nobody{"guest", {}};

  EXPECT_FALSE(permissions.isAuthorized(nobody, OrderPhase::Configuration));
  EXPECT_FALSE(permissions.isAuthorized(nobody, OrderPhase::Cancelled));
}

TEST(PhasePermissions, Grant_ExtendsRole)
{
  PhasePermissions permissions;
  Actor service{"svc", {Role::ServiceDept}};
  EXPECT_FALSE(permissions.isAuthorized(service, OrderPhase::Packaging));

  permissions.grant(Role::ServiceDept, OrderPhase::Packaging);
  EXPECT_TRUE(permissions.isAuthorized(service, OrderPhase::Packaging));
}

// ============================================================================
// Phase names
// ============================================================================

TEST(OrderPhase, ParseRoundTripsEveryName)
{
  for (auto phase : {OrderPhase::Draft,
                     OrderPhase::QualityControl,
                     OrderPhase::OnHold,
                     OrderPhase::Delivered})
  {
    auto parsed = parseOrderPhase(toString(phase));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, phase);
  }
  EXPECT_FALSE(parseOrderPhase("SHIPPED").has_value());
}
