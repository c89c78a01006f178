// Ticket: 0009_ledger_export

#ifndef MFG_LEDGER_LEDGER_RECORDER_HPP
#define MFG_LEDGER_LEDGER_RECORDER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "mfg-core/src/Sinks/Sinks.hpp"

namespace mfg_ledger
{

/**
 * @brief Background-flushing SQLite ledger of committed workflow artifacts
 *
 * Registered as the engine's audit sink and as a record sink. Every callback
 * converts its argument to a transfer record and adds it to the matching DAO
 * buffer; a recorder thread flushes all DAOs in one transaction every
 * flushInterval. The destructor stops the thread, which performs a final
 * flush, so nothing buffered is lost on shutdown.
 *
 * Thread Safety:
 *   Callbacks may arrive from any engine thread. DAO buffering is
 *   thread-safe; flushes are serialized by flushMutex_.
 *
 * @ticket 0009_ledger_export
 */
class LedgerRecorder : public mfg_core::AuditSink, public mfg_core::RecordSink
{
public:
  struct Config
  {
    std::chrono::milliseconds flushInterval{100};
    std::string databasePath;  // Path to SQLite database file
  };

  /**
   * @brief Open the database and start the recorder thread
   * @throws std::runtime_error if the database cannot be opened
   */
  explicit LedgerRecorder(const Config& config,
                          std::shared_ptr<spdlog::logger> logger = nullptr);

  ~LedgerRecorder() override;

  LedgerRecorder(const LedgerRecorder&) = delete;
  LedgerRecorder& operator=(const LedgerRecorder&) = delete;
  LedgerRecorder(LedgerRecorder&&) = delete;
  LedgerRecorder& operator=(LedgerRecorder&&) = delete;

  // AuditSink
  void record(const mfg_core::AuditEvent& event) override;

  // RecordSink
  void onBomCommitted(const mfg_core::Bom& bom) override;
  void onHistoryAppended(const mfg_core::OrderStatusHistory& row) override;
  void onCustomPartRegistered(const mfg_catalog::Part& part) override;

  /// Write every buffered record now
  void flush();

  const cpp_sqlite::Database& getDatabase() const;

private:
  void recorderThreadMain(std::stop_token stopToken);
  void flushLocked();

  std::unique_ptr<cpp_sqlite::Database> database_;
  std::shared_ptr<spdlog::logger> logger_;
  std::chrono::milliseconds flushInterval_;
  std::mutex flushMutex_;
  std::atomic<uint32_t> nextBomRecordId_{1};  // Pre-assigned for line FKs

  // Declared last: started after, and joined before, everything above
  std::jthread recorderThread_;
};

}  // namespace mfg_ledger

#endif  // MFG_LEDGER_LEDGER_RECORDER_HPP
