#ifndef MFG_CORE_BOM_SEQUENCE_COUNTER_HPP
#define MFG_CORE_BOM_SEQUENCE_COUNTER_HPP

#include <atomic>
#include <cstdint>

namespace mfg_core
{

/**
 * @brief Lock-free monotonically increasing sequence
 *
 * next() returns each value at most once across all threads. Values handed
 * out to callers that later abort are not returned to the pool, so consumers
 * must tolerate gaps.
 */
class SequenceCounter
{
public:
  explicit SequenceCounter(uint64_t first = 1) : next_{first}
  {
  }

  SequenceCounter(const SequenceCounter&) = delete;
  SequenceCounter& operator=(const SequenceCounter&) = delete;

  uint64_t next()
  {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

  /**
   * @brief Ensure every later next() returns a value greater than floor
   */
  void advancePast(uint64_t floor)
  {
    uint64_t current = next_.load(std::memory_order_relaxed);
    while (current <= floor &&
           !next_.compare_exchange_weak(
             current, floor + 1, std::memory_order_relaxed))
    {
    }
  }

  /// Value the next call to next() would return if uncontended
  [[nodiscard]] uint64_t peek() const
  {
    return next_.load(std::memory_order_relaxed);
  }

private:
  std::atomic<uint64_t> next_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_BOM_SEQUENCE_COUNTER_HPP
