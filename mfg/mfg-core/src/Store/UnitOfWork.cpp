#include "mfg-core/src/Store/UnitOfWork.hpp"

#include <set>
#include <type_traits>

#include <fmt/format.h>

namespace mfg_core
{

UnitOfWork::UnitOfWork(WorkflowStore& store) : store_{store}
{
}

UnitOfWork::~UnitOfWork()
{
  rollback();
}

void UnitOfWork::onCommit(std::function<void()> callback)
{
  ensureOpen();
  commitCallbacks_.push_back(std::move(callback));
}

std::optional<EngineError> UnitOfWork::commit()
{
  ensureOpen();

  {
    std::lock_guard<std::mutex> lock{store_.mutex_};

    auto conflict = checkRevisions();
    if (!conflict)
    {
      conflict = checkSingleActiveBom();
    }
    if (conflict)
    {
      staged_ = Tables{};
      commitCallbacks_.clear();
      state_ = State::RolledBack;
      return conflict;
    }

    staged_.forEachTable(
      [this](auto& staged)
      {
        using Entity = typename std::decay_t<decltype(staged)>::mapped_type;
        auto& committed = tableOf<Entity>(store_.tables_);
        for (auto& [id, entity] : staged)
        {
          ++entity.revision;
          committed[id] = std::move(entity);
        }
      });
    staged_ = Tables{};
  }

  state_ = State::Committed;

  auto callbacks = std::move(commitCallbacks_);
  commitCallbacks_.clear();
  for (auto& callback : callbacks)
  {
    callback();
  }
  return std::nullopt;
}

void UnitOfWork::rollback()
{
  if (state_ != State::Open)
  {
    return;
  }
  staged_ = Tables{};
  commitCallbacks_.clear();
  state_ = State::RolledBack;
}

void UnitOfWork::ensureOpen() const
{
  if (state_ != State::Open)
  {
    throw std::logic_error("Unit of work is no longer open");
  }
}

std::optional<EngineError> UnitOfWork::checkRevisions() const
{
  std::optional<EngineError> conflict;
  staged_.forEachTable(
    [this, &conflict](const auto& staged)
    {
      using Entity = typename std::decay_t<decltype(staged)>::mapped_type;
      if (conflict)
      {
        return;
      }
      const auto& committed = tableOf<Entity>(store_.tables_);
      for (const auto& [id, entity] : staged)
      {
        auto it = committed.find(id);
        uint64_t const current = it == committed.end() ? 0 : it->second.revision;
        if (entity.revision != current)
        {
          conflict = EngineError::conflict(
            fmt::format("{} {} was modified concurrently (read revision {}, "
                        "current revision {})",
                        EntityTraits<Entity>::kName,
                        id,
                        entity.revision,
                        current));
          return;
        }
      }
    });
  return conflict;
}

std::optional<EngineError> UnitOfWork::checkSingleActiveBom() const
{
  std::set<EntityId> touched;
  for (const auto& [id, bom] : staged_.boms)
  {
    touched.insert(bom.configurationId);
  }

  for (EntityId const configurationId : touched)
  {
    size_t active = 0;
    for (const auto& [id, bom] : store_.tables_.boms)
    {
      if (bom.configurationId == configurationId &&
          bom.status == BomStatus::Active && staged_.boms.count(id) == 0)
      {
        ++active;
      }
    }
    for (const auto& [id, bom] : staged_.boms)
    {
      if (bom.configurationId == configurationId &&
          bom.status == BomStatus::Active)
      {
        ++active;
      }
    }
    if (active > 1)
    {
      return EngineError::conflict(fmt::format(
        "Configuration {} would have {} Active BOMs", configurationId, active));
    }
  }
  return std::nullopt;
}

}  // namespace mfg_core
