// Ticket: 0009_ledger_export

#ifndef MFG_TRANSFER_AUDIT_EVENT_RECORD_HPP
#define MFG_TRANSFER_AUDIT_EVENT_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace mfg_transfer
{

struct AuditEventRecord : public cpp_sqlite::BaseTransferObject
{
  std::string actor_id;
  std::string action;  // GENERATE_BOM, PHASE_CHANGE, BOM_OVERRIDE, ...
  std::string entity_type;
  uint32_t entity_id{0};
  std::string before_value;
  std::string after_value;
  double timestamp{0.0};  // [seconds since epoch]
  std::string reason;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(AuditEventRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (actor_id,
                       action,
                       entity_type,
                       entity_id,
                       before_value,
                       after_value,
                       timestamp,
                       reason));

}  // namespace mfg_transfer

#endif  // MFG_TRANSFER_AUDIT_EVENT_RECORD_HPP
