#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

#include "core/contracts/IStagingLedger.h"

namespace tradegate {
namespace core {

// Process-local ledger. Structural changes (insert, history moves) take the
// index lock exclusively; status updates share it and serialize only on the
// target order's own mutex.
class InMemoryStagingLedger : public IStagingLedger {
public:
    InMemoryStagingLedger() = default;

    LedgerStatus insertStrategy(const StrategyRecord& strategy,
                                const std::vector<OrderRecord>& orders) override;

    LedgerLookup<OrderRecord> getOrder(const std::string& order_id) const override;
    LedgerLookup<StrategyRecord> getStrategy(const std::string& strategy_id) const override;

    LedgerStatus compareAndSetStatus(const std::string& order_id, const StatusChange& change) override;

    LedgerStatus moveToHistory(const std::string& order_id) override;
    LedgerStatus moveStrategyToHistory(const std::string& strategy_id) override;

    LedgerList<OrderRecord> listOrders(const OrderFilter& filter) const override;
    LedgerList<StrategyRecord> listStrategies(LedgerPartition partition) const override;

private:
    struct OrderSlot {
        mutable std::mutex mutex;
        OrderRecord record;
    };

    bool idInUse(const std::string& id) const;

    mutable std::shared_mutex index_mutex_;
    std::map<std::string, std::shared_ptr<OrderSlot>> active_orders_;
    std::map<std::string, StrategyRecord> active_strategies_;
    std::map<std::string, OrderRecord> history_orders_;
    std::map<std::string, StrategyRecord> history_strategies_;
};

} // namespace core
} // namespace tradegate
