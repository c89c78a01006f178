#ifndef MFG_CORE_ORDER_ORDER_PRICING_HPP
#define MFG_CORE_ORDER_ORDER_PRICING_HPP

#include <cstdint>
#include <vector>

#include "mfg-core/src/Order/Order.hpp"

namespace mfg_core
{

/**
 * @brief Tax and shipping policy applied to order totals
 */
struct PricingPolicy
{
  double taxRate{0.0875};
  double freeShippingThreshold{5000.0};     // [USD]
  double reducedShippingThreshold{1000.0};  // [USD]
  double reducedShipping{150.0};            // [USD]
  double standardShipping{250.0};           // [USD]
};

struct OrderTotals
{
  double subtotal{0.0};
  double discountAmount{0.0};
  double taxAmount{0.0};
  double shippingAmount{0.0};
  double total{0.0};
};

struct ProductionMetrics
{
  EntityId orderItemId{0};
  uint32_t totalTasks{0};
  uint32_t completedTasks{0};
  double completionPercentage{0.0};  // [0, 100]
  ProductionStatus status{ProductionStatus::Pending};
};

/**
 * @brief Order pricing and production progress calculations
 *
 * Pure functions over already-loaded entities.
 */
class OrderPricing
{
public:
  /**
   * @brief Totals for an order
   *
   * subtotal = sum of quantity * unitPrice
   * discount = sum of line total * discountPercentage / 100
   * tax      = taxRate * (subtotal - discount), zero if tax exempt
   * shipping = tiered on subtotal
   */
  static OrderTotals calculateTotals(const Order& order,
                                     const std::vector<OrderItem>& items,
                                     const PricingPolicy& policy);

  /**
   * @brief Task progress for one order item
   *
   * Pending with no completed task, Completed when every task is done,
   * InProgress otherwise. An item with no tasks is Pending. Cancelled tasks
   * are not counted.
   */
  static ProductionMetrics metrics(EntityId orderItemId,
                                   const std::vector<ProductionTask>& tasks);

  OrderPricing() = delete;
};

}  // namespace mfg_core

#endif  // MFG_CORE_ORDER_ORDER_PRICING_HPP
