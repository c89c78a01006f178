#ifndef MFG_CORE_STORE_UNIT_OF_WORK_HPP
#define MFG_CORE_STORE_UNIT_OF_WORK_HPP

#include <algorithm>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

#include "mfg-core/src/Errors/EngineError.hpp"
#include "mfg-core/src/Store/Tables.hpp"
#include "mfg-core/src/Store/WorkflowStore.hpp"

namespace mfg_core
{

/**
 * @brief Explicit transaction over the WorkflowStore
 *
 * Writes are staged locally and become visible to other readers only on
 * commit(). Reads through the unit of work see its own staged writes first.
 *
 * Each staged entity carries the revision it was read at. commit() rejects
 * the whole unit with Conflict if any of those revisions is stale, or if the
 * result would leave more than one Active BOM for a configuration.
 *
 * A unit of work that is destroyed without commit() is rolled back. Callbacks
 * registered with onCommit() run after a successful commit, outside the store
 * lock, in registration order; they are discarded on rollback.
 *
 * Not thread-safe: one unit of work belongs to one request.
 */
class UnitOfWork
{
public:
  explicit UnitOfWork(WorkflowStore& store);
  ~UnitOfWork();

  UnitOfWork(const UnitOfWork&) = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;
  UnitOfWork(UnitOfWork&&) = delete;
  UnitOfWork& operator=(UnitOfWork&&) = delete;

  template <typename T>
  [[nodiscard]] std::optional<T> find(EntityId id) const
  {
    const auto& staged = tableOf<T>(staged_);
    auto it = staged.find(id);
    if (it != staged.end())
    {
      return it->second;
    }
    return store_.find<T>(id);
  }

  /**
   * @brief Entities matching a predicate, staged versions replacing committed
   * ones, in id order
   */
  template <typename T, typename Pred>
  [[nodiscard]] std::vector<T> select(Pred pred) const
  {
    const auto& staged = tableOf<T>(staged_);
    std::vector<T> result;
    for (auto& entity : store_.select<T>(pred))
    {
      if (staged.count(EntityTraits<T>::id(entity)) == 0)
      {
        result.push_back(std::move(entity));
      }
    }
    for (const auto& [id, entity] : staged)
    {
      if (pred(entity))
      {
        result.push_back(entity);
      }
    }
    std::sort(result.begin(),
              result.end(),
              [](const T& a, const T& b)
              { return EntityTraits<T>::id(a) < EntityTraits<T>::id(b); });
    return result;
  }

  /**
   * @brief Stage an insert or update
   * @throws std::logic_error if the unit of work is no longer open
   */
  template <typename T>
  void put(T entity)
  {
    ensureOpen();
    auto id = EntityTraits<T>::id(entity);
    tableOf<T>(staged_)[id] = std::move(entity);
  }

  EntityId nextId()
  {
    return store_.nextId();
  }

  void onCommit(std::function<void()> callback);

  /**
   * @brief Apply all staged writes atomically
   * @return std::nullopt on success, a Conflict error if nothing was applied
   * @throws std::logic_error if called twice or after rollback()
   */
  [[nodiscard]] std::optional<EngineError> commit();

  /// Discard all staged writes and callbacks. Idempotent.
  void rollback();

  [[nodiscard]] bool isOpen() const
  {
    return state_ == State::Open;
  }

  [[nodiscard]] bool hasStagedWrites() const
  {
    return !staged_.empty();
  }

private:
  enum class State : uint8_t
  {
    Open,
    Committed,
    RolledBack
  };

  void ensureOpen() const;

  // Both run with the store mutex held
  [[nodiscard]] std::optional<EngineError> checkRevisions() const;
  [[nodiscard]] std::optional<EngineError> checkSingleActiveBom() const;

  WorkflowStore& store_;
  Tables staged_;
  std::vector<std::function<void()>> commitCallbacks_;
  State state_{State::Open};
};

}  // namespace mfg_core

#endif  // MFG_CORE_STORE_UNIT_OF_WORK_HPP
