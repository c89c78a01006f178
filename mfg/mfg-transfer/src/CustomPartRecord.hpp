// Ticket: 0009_ledger_export

#ifndef MFG_TRANSFER_CUSTOM_PART_RECORD_HPP
#define MFG_TRANSFER_CUSTOM_PART_RECORD_HPP

#include <string>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace mfg_transfer
{

/**
 * @brief Database record for a synthesized custom part
 *
 * option_key/option_value is the selection the part was created for.
 */
struct CustomPartRecord : public cpp_sqlite::BaseTransferObject
{
  std::string part_id;  // e.g. 700-1025
  std::string name;
  std::string category_id;
  std::string option_key;
  std::string option_value;
  double unit_cost{0.0};  // [USD]
  double weight_kg{0.0};  // [kg]
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(CustomPartRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (part_id,
                       name,
                       category_id,
                       option_key,
                       option_value,
                       unit_cost,
                       weight_kg));

}  // namespace mfg_transfer

#endif  // MFG_TRANSFER_CUSTOM_PART_RECORD_HPP
