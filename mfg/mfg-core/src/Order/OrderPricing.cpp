#include "mfg-core/src/Order/OrderPricing.hpp"

namespace mfg_core
{

OrderTotals OrderPricing::calculateTotals(const Order& order,
                                          const std::vector<OrderItem>& items,
                                          const PricingPolicy& policy)
{
  OrderTotals totals;
  for (const auto& item : items)
  {
    double const lineTotal = item.quantity * item.unitPrice;
    totals.subtotal += lineTotal;
    totals.discountAmount += lineTotal * item.discountPercentage / 100.0;
  }

  double const taxable = totals.subtotal - totals.discountAmount;
  totals.taxAmount = order.taxExempt ? 0.0 : taxable * policy.taxRate;

  if (totals.subtotal >= policy.freeShippingThreshold)
  {
    totals.shippingAmount = 0.0;
  }
  else if (totals.subtotal >= policy.reducedShippingThreshold)
  {
    totals.shippingAmount = policy.reducedShipping;
  }
  else
  {
    totals.shippingAmount = policy.standardShipping;
  }

  totals.total = taxable + totals.taxAmount + totals.shippingAmount;
  return totals;
}

ProductionMetrics OrderPricing::metrics(EntityId orderItemId,
                                        const std::vector<ProductionTask>& tasks)
{
  ProductionMetrics metrics;
  metrics.orderItemId = orderItemId;
  for (const auto& task : tasks)
  {
    if (task.orderItemId != orderItemId ||
        task.status == TaskStatus::Cancelled)
    {
      continue;
    }
    ++metrics.totalTasks;
    if (task.status == TaskStatus::Completed)
    {
      ++metrics.completedTasks;
    }
  }

  if (metrics.totalTasks > 0)
  {
    metrics.completionPercentage =
      100.0 * metrics.completedTasks / metrics.totalTasks;
  }

  if (metrics.completedTasks == 0)
  {
    metrics.status = ProductionStatus::Pending;
  }
  else if (metrics.completedTasks == metrics.totalTasks)
  {
    metrics.status = ProductionStatus::Completed;
  }
  else
  {
    metrics.status = ProductionStatus::InProgress;
  }
  return metrics;
}

}  // namespace mfg_core
