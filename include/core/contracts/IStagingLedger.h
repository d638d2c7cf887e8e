#pragma once

#include <string>
#include <vector>

#include "core/model/StagingTypes.h"

namespace tradegate {
namespace core {

// Keyed store of staged strategies and their orders. Implementations must make
// compareAndSetStatus atomic per order id without serializing unrelated keys.
// Every method reports backend trouble as BACKEND_UNAVAILABLE rather than
// pretending success.
class IStagingLedger {
public:
    virtual ~IStagingLedger() = default;

    // Inserts the strategy and all of its orders, or nothing at all.
    virtual LedgerStatus insertStrategy(const StrategyRecord& strategy,
                                        const std::vector<OrderRecord>& orders) = 0;

    virtual LedgerLookup<OrderRecord> getOrder(const std::string& order_id) const = 0;
    virtual LedgerLookup<StrategyRecord> getStrategy(const std::string& strategy_id) const = 0;

    virtual LedgerStatus compareAndSetStatus(const std::string& order_id, const StatusChange& change) = 0;

    // Legal only from a terminal status. History records are read-only.
    virtual LedgerStatus moveToHistory(const std::string& order_id) = 0;
    // Moves the strategy and every one of its orders; all orders must be terminal.
    virtual LedgerStatus moveStrategyToHistory(const std::string& strategy_id) = 0;

    virtual LedgerList<OrderRecord> listOrders(const OrderFilter& filter) const = 0;
    virtual LedgerList<StrategyRecord> listStrategies(LedgerPartition partition) const = 0;
};

} // namespace core
} // namespace tradegate
