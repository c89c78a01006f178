// Ticket: 0009_ledger_export

#include "mfg-ledger/src/LedgerRecorder.hpp"

#include <algorithm>
#include <exception>

#include "mfg-core/src/Logging.hpp"
#include "mfg-transfer/src/Records.hpp"

namespace mfg_ledger
{

namespace
{

double toEpochSeconds(mfg_core::TimePoint t)
{
  return std::chrono::duration_cast<std::chrono::duration<double>>(
           t.time_since_epoch())
    .count();
}

uint32_t toRecordId(mfg_core::EntityId id)
{
  return static_cast<uint32_t>(id);
}

mfg_transfer::BomRecord toRecord(const mfg_core::Bom& bom)
{
  mfg_transfer::BomRecord record{};
  record.bom_id = toRecordId(bom.bomId);
  record.bom_number = bom.bomNumber;
  record.configuration_id = toRecordId(bom.configurationId);
  record.configuration_version = bom.configurationVersion;
  record.order_item_id = toRecordId(bom.orderItemId);
  record.assembly_id = bom.assemblyId;
  record.status = mfg_core::toString(bom.status);
  record.bom_type = mfg_core::toString(bom.bomType);
  record.is_locked = bom.isLocked ? 1 : 0;
  record.total_parts = bom.totalParts;
  record.unique_parts = bom.uniqueParts;
  record.custom_parts_count = bom.customPartsCount;
  record.total_cost = bom.totalCost;
  record.total_weight_kg = bom.totalWeightKg;
  record.generation_time_ms = bom.generationTimeMs;
  record.created_by = bom.createdBy;
  record.created_at = toEpochSeconds(bom.createdAt);
  return record;
}

mfg_transfer::BomLineItemRecord toRecord(const mfg_core::BomLineItem& line,
                                         uint32_t bomRecordId)
{
  mfg_transfer::BomLineItemRecord record{};
  record.line_number = line.lineNumber;
  record.component_id = line.componentId;
  record.component_type = mfg_catalog::toString(line.componentType);
  record.base_quantity = line.baseQuantity;
  record.waste_factor = line.wasteFactor;
  record.adjusted_quantity = line.adjustedQuantity;
  record.unit_cost = line.unitCost;
  record.extended_cost = line.extendedCost;
  record.unit_weight_kg = line.unitWeightKg;
  record.is_custom = line.isCustom ? 1 : 0;
  record.is_optional = line.isOptional ? 1 : 0;
  record.substitute_group = line.substituteGroup.value_or("");
  record.bom.id = bomRecordId;
  return record;
}

}  // namespace

LedgerRecorder::LedgerRecorder(const Config& config,
                               std::shared_ptr<spdlog::logger> logger)
  : logger_{logger ? std::move(logger) : mfg_core::defaultLogger()},
    flushInterval_{config.flushInterval}
{
  database_ =
    std::make_unique<cpp_sqlite::Database>(config.databasePath, true, logger_);

  // Create every DAO before the thread starts iterating them; BOM headers
  // first for FK integrity
  database_->getDAO<mfg_transfer::BomRecord>();
  database_->getDAO<mfg_transfer::BomLineItemRecord>();
  database_->getDAO<mfg_transfer::CustomPartRecord>();
  database_->getDAO<mfg_transfer::OrderStatusHistoryRecord>();
  database_->getDAO<mfg_transfer::AuditEventRecord>();

  logger_->info("Ledger recording to {}", config.databasePath);

  recorderThread_ = std::jthread{[this](std::stop_token st)
                                 { recorderThreadMain(std::move(st)); }};
}

LedgerRecorder::~LedgerRecorder()
{
  // The recorder thread flushes once more before exiting
  recorderThread_.request_stop();
}

void LedgerRecorder::record(const mfg_core::AuditEvent& event)
{
  mfg_transfer::AuditEventRecord record{};
  record.actor_id = event.actorId;
  record.action = event.action;
  record.entity_type = event.entityType;
  record.entity_id = toRecordId(event.entityId);
  record.before_value = event.before;
  record.after_value = event.after;
  record.timestamp = toEpochSeconds(event.timestamp);
  record.reason = event.reason;

  database_->getDAO<mfg_transfer::AuditEventRecord>().addToBuffer(record);
}

void LedgerRecorder::onBomCommitted(const mfg_core::Bom& bom)
{
  auto header = toRecord(bom);
  header.id = nextBomRecordId_.fetch_add(1);
  database_->getDAO<mfg_transfer::BomRecord>().addToBuffer(header);

  auto& lineDAO = database_->getDAO<mfg_transfer::BomLineItemRecord>();
  for (const auto& line : bom.lines)
  {
    lineDAO.addToBuffer(toRecord(line, header.id));
  }
}

void LedgerRecorder::onHistoryAppended(const mfg_core::OrderStatusHistory& row)
{
  mfg_transfer::OrderStatusHistoryRecord record{};
  record.history_id = toRecordId(row.historyId);
  record.order_id = toRecordId(row.orderId);
  record.from_phase = mfg_core::toString(row.fromPhase);
  record.to_phase = mfg_core::toString(row.toPhase);
  record.actor_id = row.actorId;
  record.timestamp = toEpochSeconds(row.timestamp);
  record.reason = row.reason;
  record.duration_in_prior_phase =
    std::chrono::duration<double>(row.durationInPriorPhase).count();

  database_->getDAO<mfg_transfer::OrderStatusHistoryRecord>().addToBuffer(
    record);
}

void LedgerRecorder::onCustomPartRegistered(const mfg_catalog::Part& part)
{
  mfg_transfer::CustomPartRecord record{};
  record.part_id = part.partId;
  record.name = part.name;
  record.category_id = part.categoryId;
  record.unit_cost = part.unitCost;
  record.weight_kg = part.weightKg;
  if (!part.specifications.empty())
  {
    const auto& [key, value] = *part.specifications.begin();
    record.option_key = key;
    record.option_value = value;
  }

  database_->getDAO<mfg_transfer::CustomPartRecord>().addToBuffer(record);
}

void LedgerRecorder::flush()
{
  std::scoped_lock lock{flushMutex_};
  flushLocked();
}

const cpp_sqlite::Database& LedgerRecorder::getDatabase() const
{
  return *database_;
}

void LedgerRecorder::flushLocked()
{
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
}

void LedgerRecorder::recorderThreadMain(std::stop_token stopToken)
{
  constexpr auto kSleepChunk = std::chrono::milliseconds{10};

  while (!stopToken.stop_requested())
  {
    auto remaining = flushInterval_;
    while (remaining > std::chrono::milliseconds{0} &&
           !stopToken.stop_requested())
    {
      auto sleepTime = std::min(remaining, kSleepChunk);
      std::this_thread::sleep_for(sleepTime);
      remaining -= sleepTime;
    }

    if (stopToken.stop_requested())
    {
      break;
    }

    std::scoped_lock lock{flushMutex_};
    try
    {
      flushLocked();
    }
    catch (const std::exception& e)
    {
      logger_->error("Ledger flush failed: {}", e.what());
    }
  }

  std::scoped_lock lock{flushMutex_};
  try
  {
    flushLocked();
  }
  catch (const std::exception& e)
  {
    logger_->error("Final ledger flush failed: {}", e.what());
  }
}

}  // namespace mfg_ledger
