#ifndef MFG_CORE_BOM_DOCUMENT_NUMBERING_HPP
#define MFG_CORE_BOM_DOCUMENT_NUMBERING_HPP

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "mfg-core/src/DataTypes/WorkflowTypes.hpp"

namespace mfg_core
{

/**
 * @brief Human-readable BOM and order numbers
 *
 * BOM numbers are BOM-YYYYMM-NNNN, sequential per calendar month. Order
 * numbers are ORD-YYYY-NNNN, sequential per calendar year. Dates are taken in
 * UTC. Numbers allocated by a request that later rolls back are gaps.
 */
class DocumentNumbering
{
public:
  struct Config
  {
    std::string bomPrefix{"BOM"};
    std::string orderPrefix{"ORD"};
  };

  explicit DocumentNumbering(Config config);

  std::string nextBomNumber(TimePoint at);
  std::string nextOrderNumber(TimePoint at);

private:
  uint32_t nextInPeriod(const std::string& periodKey);

  Config config_;
  std::mutex mutex_;
  std::map<std::string, uint32_t> counters_;
};

}  // namespace mfg_core

#endif  // MFG_CORE_BOM_DOCUMENT_NUMBERING_HPP
