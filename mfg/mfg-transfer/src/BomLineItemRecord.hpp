// Ticket: 0009_ledger_export

#ifndef MFG_TRANSFER_BOM_LINE_ITEM_RECORD_HPP
#define MFG_TRANSFER_BOM_LINE_ITEM_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "mfg-transfer/src/BomRecord.hpp"

namespace mfg_transfer
{

/**
 * @brief Database record for one costed BOM line
 *
 * References its header via ForeignKey<BomRecord>.
 */
struct BomLineItemRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t line_number{0};
  std::string component_id;
  std::string component_type;  // PART or ASSEMBLY
  double base_quantity{0.0};
  double waste_factor{0.0};
  double adjusted_quantity{0.0};
  double unit_cost{0.0};      // [USD]
  double extended_cost{0.0};  // [USD]
  double unit_weight_kg{0.0};  // [kg]
  uint32_t is_custom{0};
  uint32_t is_optional{0};
  std::string substitute_group;  // Empty when the line has none
  cpp_sqlite::ForeignKey<BomRecord> bom;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(BomLineItemRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (line_number,
                       component_id,
                       component_type,
                       base_quantity,
                       waste_factor,
                       adjusted_quantity,
                       unit_cost,
                       extended_cost,
                       unit_weight_kg,
                       is_custom,
                       is_optional,
                       substitute_group,
                       bom));

}  // namespace mfg_transfer

#endif  // MFG_TRANSFER_BOM_LINE_ITEM_RECORD_HPP
