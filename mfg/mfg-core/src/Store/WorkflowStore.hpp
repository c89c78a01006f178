#ifndef MFG_CORE_STORE_WORKFLOW_STORE_HPP
#define MFG_CORE_STORE_WORKFLOW_STORE_HPP

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "mfg-core/src/Store/Tables.hpp"

namespace mfg_core
{

/**
 * @brief Lazily created mutex per entity id
 *
 * Entries live as long as the table; the number of orders and configurations
 * in one process is small.
 */
class LockTable
{
public:
  [[nodiscard]] std::unique_lock<std::mutex> acquire(EntityId key);

private:
  std::mutex mapMutex_;
  std::unordered_map<EntityId, std::unique_ptr<std::mutex>> locks_;
};

/**
 * @brief In-memory system of record for orders, configurations and BOMs
 *
 * Committed state is only written by UnitOfWork::commit(). Reads return
 * copies, so callers never hold references into the tables.
 *
 * Thread Safety:
 *   Reads and commits are serialized by an internal mutex. Per-order and
 *   per-configuration locks serialize whole requests; acquire the order lock
 *   before the configuration lock.
 */
class WorkflowStore
{
public:
  WorkflowStore() = default;

  WorkflowStore(const WorkflowStore&) = delete;
  WorkflowStore& operator=(const WorkflowStore&) = delete;

  /**
   * @brief Allocate an entity id
   *
   * Ids are unique across all entity types. Ids allocated by a unit of work
   * that later rolls back are not reused.
   */
  EntityId nextId()
  {
    return nextId_.fetch_add(1, std::memory_order_relaxed);
  }

  template <typename T>
  [[nodiscard]] std::optional<T> find(EntityId id) const
  {
    std::lock_guard<std::mutex> lock{mutex_};
    const auto& table = tableOf<T>(tables_);
    auto it = table.find(id);
    if (it == table.end())
    {
      return std::nullopt;
    }
    return it->second;
  }

  /// Committed entities matching a predicate, in id order
  template <typename T, typename Pred>
  [[nodiscard]] std::vector<T> select(Pred pred) const
  {
    std::lock_guard<std::mutex> lock{mutex_};
    std::vector<T> result;
    for (const auto& [id, entity] : tableOf<T>(tables_))
    {
      if (pred(entity))
      {
        result.push_back(entity);
      }
    }
    return result;
  }

  [[nodiscard]] std::unique_lock<std::mutex> lockOrder(EntityId orderId)
  {
    return orderLocks_.acquire(orderId);
  }

  [[nodiscard]] std::unique_lock<std::mutex> lockConfiguration(
    EntityId configurationId)
  {
    return configurationLocks_.acquire(configurationId);
  }

private:
  friend class UnitOfWork;

  mutable std::mutex mutex_;
  Tables tables_;
  std::atomic<EntityId> nextId_{1};

  LockTable orderLocks_;
  LockTable configurationLocks_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_STORE_WORKFLOW_STORE_HPP
