// Ticket: 0009_ledger_export

#ifndef MFG_TRANSFER_ORDER_STATUS_HISTORY_RECORD_HPP
#define MFG_TRANSFER_ORDER_STATUS_HISTORY_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace mfg_transfer
{

/**
 * @brief Database record for one order phase transition
 */
struct OrderStatusHistoryRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t history_id{0};
  uint32_t order_id{0};
  std::string from_phase;
  std::string to_phase;
  std::string actor_id;
  double timestamp{0.0};  // [seconds since epoch]
  std::string reason;
  double duration_in_prior_phase{0.0};  // [seconds]
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(OrderStatusHistoryRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (history_id,
                       order_id,
                       from_phase,
                       to_phase,
                       actor_id,
                       timestamp,
                       reason,
                       duration_in_prior_phase));

}  // namespace mfg_transfer

#endif  // MFG_TRANSFER_ORDER_STATUS_HISTORY_RECORD_HPP
