#include "mfg-core/src/Sinks/Sinks.hpp"

#include <algorithm>
#include <iterator>

namespace mfg_core
{

void SinkSet::publish(const AuditEvent& event) const
{
  if (audit)
  {
    audit->record(event);
  }
}

void SinkSet::publish(const PhaseEvent& event) const
{
  if (tasks)
  {
    tasks->onPhaseEntered(event);
  }
}

void SinkSet::publishBom(const Bom& bom) const
{
  for (const auto& sink : records)
  {
    sink->onBomCommitted(bom);
  }
}

void SinkSet::publishHistory(const OrderStatusHistory& row) const
{
  for (const auto& sink : records)
  {
    sink->onHistoryAppended(row);
  }
}

void SinkSet::publishCustomPart(const mfg_catalog::Part& part) const
{
  for (const auto& sink : records)
  {
    sink->onCustomPartRegistered(part);
  }
}

void InMemoryAuditSink::record(const AuditEvent& event)
{
  std::lock_guard<std::mutex> lock{mutex_};
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditSink::events() const
{
  std::lock_guard<std::mutex> lock{mutex_};
  return events_;
}

std::vector<AuditEvent> InMemoryAuditSink::eventsWithAction(
  const std::string& action) const
{
  std::lock_guard<std::mutex> lock{mutex_};
  std::vector<AuditEvent> matching;
  std::copy_if(events_.begin(),
               events_.end(),
               std::back_inserter(matching),
               [&action](const AuditEvent& e) { return e.action == action; });
  return matching;
}

void InMemoryTaskSink::onPhaseEntered(const PhaseEvent& event)
{
  std::lock_guard<std::mutex> lock{mutex_};
  events_.push_back(event);
}

std::vector<PhaseEvent> InMemoryTaskSink::events() const
{
  std::lock_guard<std::mutex> lock{mutex_};
  return events_;
}

}  // namespace mfg_core
