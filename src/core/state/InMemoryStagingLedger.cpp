#include "core/state/InMemoryStagingLedger.h"

#include <set>
#include <vector>

#include "core/execution/OrderLifecycleStateMachine.h"

namespace tradegate {
namespace core {

using execution::OrderLifecycleStateMachine;

bool InMemoryStagingLedger::idInUse(const std::string& id) const {
    return active_orders_.count(id) > 0 || history_orders_.count(id) > 0 ||
           active_strategies_.count(id) > 0 || history_strategies_.count(id) > 0;
}

LedgerStatus InMemoryStagingLedger::insertStrategy(const StrategyRecord& strategy,
                                                   const std::vector<OrderRecord>& orders) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);

    // Check every key first so a collision leaves the ledger untouched.
    if (strategy.id.empty() || idInUse(strategy.id)) {
        return LedgerStatus::ALREADY_EXISTS;
    }
    std::set<std::string> seen;
    for (const auto& order : orders) {
        if (order.id.empty() || order.id == strategy.id || idInUse(order.id) || !seen.insert(order.id).second) {
            return LedgerStatus::ALREADY_EXISTS;
        }
    }

    for (const auto& order : orders) {
        auto slot = std::make_shared<OrderSlot>();
        slot->record = order;
        active_orders_.emplace(order.id, std::move(slot));
    }
    active_strategies_.emplace(strategy.id, strategy);
    return LedgerStatus::OK;
}

LedgerLookup<OrderRecord> InMemoryStagingLedger::getOrder(const std::string& order_id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    LedgerLookup<OrderRecord> out;

    auto it = active_orders_.find(order_id);
    if (it != active_orders_.end()) {
        std::lock_guard<std::mutex> slot_lock(it->second->mutex);
        out.status = LedgerStatus::OK;
        out.partition = LedgerPartition::ACTIVE;
        out.record = it->second->record;
        return out;
    }

    auto hist = history_orders_.find(order_id);
    if (hist != history_orders_.end()) {
        out.status = LedgerStatus::OK;
        out.partition = LedgerPartition::HISTORY;
        out.record = hist->second;
    }
    return out;
}

LedgerLookup<StrategyRecord> InMemoryStagingLedger::getStrategy(const std::string& strategy_id) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    LedgerLookup<StrategyRecord> out;

    auto it = active_strategies_.find(strategy_id);
    if (it != active_strategies_.end()) {
        out.status = LedgerStatus::OK;
        out.partition = LedgerPartition::ACTIVE;
        out.record = it->second;
        return out;
    }

    auto hist = history_strategies_.find(strategy_id);
    if (hist != history_strategies_.end()) {
        out.status = LedgerStatus::OK;
        out.partition = LedgerPartition::HISTORY;
        out.record = hist->second;
    }
    return out;
}

LedgerStatus InMemoryStagingLedger::compareAndSetStatus(const std::string& order_id, const StatusChange& change) {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);

    auto it = active_orders_.find(order_id);
    if (it == active_orders_.end()) {
        return history_orders_.count(order_id) > 0 ? LedgerStatus::READ_ONLY : LedgerStatus::NOT_FOUND;
    }

    std::lock_guard<std::mutex> slot_lock(it->second->mutex);
    OrderRecord& record = it->second->record;

    if (record.status != change.expected) {
        return LedgerStatus::CONFLICT;
    }
    if (change.expected_version && record.version != *change.expected_version) {
        return LedgerStatus::CONFLICT;
    }

    record.status = change.next;
    if (change.filled_price) record.filled_price = change.filled_price;
    if (change.filled_quantity) record.filled_quantity = *change.filled_quantity;
    if (change.broker_ref) record.broker_ref = *change.broker_ref;
    record.updated_at_ms = change.audit.ts_ms;
    record.audit_trail.push_back(change.audit);
    ++record.version;
    return LedgerStatus::OK;
}

LedgerStatus InMemoryStagingLedger::moveToHistory(const std::string& order_id) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);

    auto it = active_orders_.find(order_id);
    if (it == active_orders_.end()) {
        return history_orders_.count(order_id) > 0 ? LedgerStatus::READ_ONLY : LedgerStatus::NOT_FOUND;
    }

    std::lock_guard<std::mutex> slot_lock(it->second->mutex);
    if (!OrderLifecycleStateMachine::isTerminal(it->second->record.status)) {
        return LedgerStatus::NOT_TERMINAL;
    }
    history_orders_.emplace(order_id, it->second->record);
    active_orders_.erase(it);
    return LedgerStatus::OK;
}

LedgerStatus InMemoryStagingLedger::moveStrategyToHistory(const std::string& strategy_id) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);

    auto strategy_it = active_strategies_.find(strategy_id);
    if (strategy_it == active_strategies_.end()) {
        return history_strategies_.count(strategy_id) > 0 ? LedgerStatus::READ_ONLY : LedgerStatus::NOT_FOUND;
    }

    // Exclusive index lock: no status update can run while we check and move.
    std::vector<std::string> to_move;
    for (const auto& order_id : strategy_it->second.order_ids) {
        auto it = active_orders_.find(order_id);
        if (it == active_orders_.end()) {
            if (history_orders_.count(order_id) == 0) {
                return LedgerStatus::NOT_FOUND;
            }
            continue;
        }
        if (!OrderLifecycleStateMachine::isTerminal(it->second->record.status)) {
            return LedgerStatus::NOT_TERMINAL;
        }
        to_move.push_back(order_id);
    }

    for (const auto& order_id : to_move) {
        auto it = active_orders_.find(order_id);
        history_orders_.emplace(order_id, it->second->record);
        active_orders_.erase(it);
    }
    history_strategies_.emplace(strategy_id, strategy_it->second);
    active_strategies_.erase(strategy_it);
    return LedgerStatus::OK;
}

LedgerList<OrderRecord> InMemoryStagingLedger::listOrders(const OrderFilter& filter) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    LedgerList<OrderRecord> out;

    for (const auto& [id, slot] : active_orders_) {
        std::lock_guard<std::mutex> slot_lock(slot->mutex);
        if (filter.matches(slot->record, LedgerPartition::ACTIVE)) {
            out.records.push_back(slot->record);
        }
    }
    for (const auto& [id, record] : history_orders_) {
        if (filter.matches(record, LedgerPartition::HISTORY)) {
            out.records.push_back(record);
        }
    }
    return out;
}

LedgerList<StrategyRecord> InMemoryStagingLedger::listStrategies(LedgerPartition partition) const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    LedgerList<StrategyRecord> out;

    const auto& source = partition == LedgerPartition::ACTIVE ? active_strategies_ : history_strategies_;
    out.records.reserve(source.size());
    for (const auto& [id, record] : source) {
        out.records.push_back(record);
    }
    return out;
}

} // namespace core
} // namespace tradegate
