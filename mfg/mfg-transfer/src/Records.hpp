#ifndef MFG_TRANSFER_RECORDS_HPP
#define MFG_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all ledger transfer objects
 */

#include "mfg-transfer/src/AuditEventRecord.hpp"
#include "mfg-transfer/src/BomLineItemRecord.hpp"
#include "mfg-transfer/src/BomRecord.hpp"
#include "mfg-transfer/src/CustomPartRecord.hpp"
#include "mfg-transfer/src/OrderStatusHistoryRecord.hpp"

#endif  // MFG_TRANSFER_RECORDS_HPP
