// Ticket: 0009_ledger_export

#ifndef MFG_TRANSFER_BOM_RECORD_HPP
#define MFG_TRANSFER_BOM_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace mfg_transfer
{

/**
 * @brief Database record for a committed BOM header
 *
 * The record id is pre-assigned by the recorder so that line records can
 * reference it before either is flushed. bom_id is the engine's entity id.
 */
struct BomRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t bom_id{0};
  std::string bom_number;
  uint32_t configuration_id{0};
  uint32_t configuration_version{0};
  uint32_t order_item_id{0};
  std::string assembly_id;
  std::string status;    // DRAFT, ACTIVE, SUPERSEDED, ...
  std::string bom_type;  // STANDARD or CUSTOM
  uint32_t is_locked{0};  // Boolean as uint32_t for SQLite
  uint32_t total_parts{0};
  uint32_t unique_parts{0};
  uint32_t custom_parts_count{0};
  double total_cost{0.0};          // [USD]
  double total_weight_kg{0.0};     // [kg]
  double generation_time_ms{0.0};  // [ms]
  std::string created_by;
  double created_at{0.0};  // [seconds since epoch]
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(BomRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (bom_id,
                       bom_number,
                       configuration_id,
                       configuration_version,
                       order_item_id,
                       assembly_id,
                       status,
                       bom_type,
                       is_locked,
                       total_parts,
                       unique_parts,
                       custom_parts_count,
                       total_cost,
                       total_weight_kg,
                       generation_time_ms,
                       created_by,
                       created_at));

}  // namespace mfg_transfer

#endif  // MFG_TRANSFER_BOM_RECORD_HPP
