#ifndef MFG_CORE_STORE_TABLES_HPP
#define MFG_CORE_STORE_TABLES_HPP

#include <map>

#include "mfg-core/src/Bom/Bom.hpp"
#include "mfg-core/src/Configuration/Configuration.hpp"
#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"
#include "mfg-core/src/Order/Order.hpp"

namespace mfg_core
{

/**
 * @brief One keyed map per workflow entity type
 *
 * Used both for committed state (WorkflowStore) and for the writes staged by a
 * UnitOfWork.
 */
struct Tables
{
  std::map<EntityId, Order> orders;
  std::map<EntityId, OrderItem> orderItems;
  std::map<EntityId, Configuration> configurations;
  std::map<EntityId, Bom> boms;
  std::map<EntityId, OrderStatusHistory> history;
  std::map<EntityId, ProductionTask> tasks;
  std::map<EntityId, QcChecklist> checklists;

  template <typename Fn>
  void forEachTable(Fn&& fn)
  {
    fn(orders);
    fn(orderItems);
    fn(configurations);
    fn(boms);
    fn(history);
    fn(tasks);
    fn(checklists);
  }

  template <typename Fn>
  void forEachTable(Fn&& fn) const
  {
    fn(orders);
    fn(orderItems);
    fn(configurations);
    fn(boms);
    fn(history);
    fn(tasks);
    fn(checklists);
  }

  [[nodiscard]] bool empty() const
  {
    return orders.empty() && orderItems.empty() && configurations.empty() &&
           boms.empty() && history.empty() && tasks.empty() &&
           checklists.empty();
  }
};

/**
 * @brief Maps an entity type to its table, key and display name
 */
template <typename T>
struct EntityTraits;

template <>
struct EntityTraits<Order>
{
  static constexpr const char* kName = "Order";
  static EntityId id(const Order& e) { return e.orderId; }
  static std::map<EntityId, Order>& table(Tables& t) { return t.orders; }
};

template <>
struct EntityTraits<OrderItem>
{
  static constexpr const char* kName = "OrderItem";
  static EntityId id(const OrderItem& e) { return e.orderItemId; }
  static std::map<EntityId, OrderItem>& table(Tables& t)
  {
    return t.orderItems;
  }
};

template <>
struct EntityTraits<Configuration>
{
  static constexpr const char* kName = "Configuration";
  static EntityId id(const Configuration& e) { return e.configurationId; }
  static std::map<EntityId, Configuration>& table(Tables& t)
  {
    return t.configurations;
  }
};

template <>
struct EntityTraits<Bom>
{
  static constexpr const char* kName = "BOM";
  static EntityId id(const Bom& e) { return e.bomId; }
  static std::map<EntityId, Bom>& table(Tables& t) { return t.boms; }
};

template <>
struct EntityTraits<OrderStatusHistory>
{
  static constexpr const char* kName = "OrderStatusHistory";
  static EntityId id(const OrderStatusHistory& e) { return e.historyId; }
  static std::map<EntityId, OrderStatusHistory>& table(Tables& t)
  {
    return t.history;
  }
};

template <>
struct EntityTraits<ProductionTask>
{
  static constexpr const char* kName = "ProductionTask";
  static EntityId id(const ProductionTask& e) { return e.taskId; }
  static std::map<EntityId, ProductionTask>& table(Tables& t)
  {
    return t.tasks;
  }
};

template <>
struct EntityTraits<QcChecklist>
{
  static constexpr const char* kName = "QcChecklist";
  static EntityId id(const QcChecklist& e) { return e.checklistId; }
  static std::map<EntityId, QcChecklist>& table(Tables& t)
  {
    return t.checklists;
  }
};

template <typename T>
const std::map<EntityId, T>& tableOf(const Tables& tables)
{
  return EntityTraits<T>::table(const_cast<Tables&>(tables));
}

template <typename T>
std::map<EntityId, T>& tableOf(Tables& tables)
{
  return EntityTraits<T>::table(tables);
}

}  // namespace mfg_core

#endif  // MFG_CORE_STORE_TABLES_HPP
