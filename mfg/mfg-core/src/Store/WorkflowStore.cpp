#include "mfg-core/src/Store/WorkflowStore.hpp"

namespace mfg_core
{

std::unique_lock<std::mutex> LockTable::acquire(EntityId key)
{
  std::mutex* entry = nullptr;
  {
    std::lock_guard<std::mutex> lock{mapMutex_};
    auto& slot = locks_[key];
    if (!slot)
    {
      slot = std::make_unique<std::mutex>();
    }
    entry = slot.get();
  }
  // Entries are never erased, so the pointer stays valid after mapMutex_ is
  // released
  return std::unique_lock<std::mutex>{*entry};
}

}  // namespace mfg_core
