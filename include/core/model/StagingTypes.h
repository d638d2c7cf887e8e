#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "risk/RiskAssessor.h"

namespace tradegate {
namespace core {

enum class JournalEventType {
    STRATEGY_STAGED,
    STRATEGY_REJECTED_STRUCTURE,
    STRATEGY_REJECTED_RISK,
    ORDER_STAGED,
    ORDER_APPROVED,
    ORDER_ROLLED_BACK,
    ORDER_REJECTED,
    ORDER_CANCELLED,
    ORDER_SUBMITTED,
    ORDER_PARTIALLY_FILLED,
    ORDER_FILLED,
    STRATEGY_ARCHIVED,
    TRADE_RESULT_RECORDED
};

// Row of the append-only audit journal; seq is assigned by the journal.
struct JournalEvent {
    std::uint64_t seq = 0;
    long long ts_ms = 0;
    JournalEventType type = JournalEventType::ORDER_STAGED;
    std::string strategy_id;
    std::string order_id;
    std::string actor;
    std::string note;
    nlohmann::json payload;
};

struct AuditEntry {
    long long ts_ms = 0;
    std::string event;
    std::string actor;
    std::string note;
};

struct OrderRecord {
    std::string id;
    std::string strategy_id;
    std::size_t leg_index = 0;  // position of the leg in the candidate
    Leg leg;
    std::string symbol;
    OrderStatus status = OrderStatus::PENDING;
    long long created_at_ms = 0;
    long long updated_at_ms = 0;
    std::optional<Price> filled_price;  // volume-weighted over partial fills
    int filled_quantity = 0;
    std::string broker_ref;
    std::uint64_t version = 0;  // bumped on every successful mutation
    std::vector<AuditEntry> audit_trail;
};

struct StrategyRecord {
    std::string id;
    StrategyCandidate candidate;
    risk::RiskAssessment assessment;
    std::vector<std::string> order_ids;
    long long created_at_ms = 0;
    std::string trade_date;
};

enum class LedgerPartition { ACTIVE, HISTORY };

enum class LedgerStatus {
    OK,
    NOT_FOUND,
    CONFLICT,            // stored status/version differs from the expected one
    ALREADY_EXISTS,
    READ_ONLY,           // record lives in the history partition
    NOT_TERMINAL,        // history move attempted before a terminal status
    BACKEND_UNAVAILABLE
};

// Conditional mutation applied by compareAndSetStatus. Optional fields are
// written together with the status when the comparison succeeds.
struct StatusChange {
    OrderStatus expected = OrderStatus::STAGED;
    OrderStatus next = OrderStatus::STAGED;
    std::optional<std::uint64_t> expected_version;
    AuditEntry audit;
    std::optional<Price> filled_price;
    std::optional<int> filled_quantity;
    std::optional<std::string> broker_ref;
};

template <typename T>
struct LedgerLookup {
    LedgerStatus status = LedgerStatus::NOT_FOUND;
    LedgerPartition partition = LedgerPartition::ACTIVE;
    T record;

    bool found() const { return status == LedgerStatus::OK; }
};

template <typename T>
struct LedgerList {
    LedgerStatus status = LedgerStatus::OK;
    std::vector<T> records;
};

struct OrderFilter {
    std::optional<OrderStatus> status;
    std::optional<std::string> strategy_id;
    std::optional<LedgerPartition> partition;

    bool matches(const OrderRecord& order, LedgerPartition where) const {
        if (status && order.status != *status) return false;
        if (strategy_id && order.strategy_id != *strategy_id) return false;
        if (partition && where != *partition) return false;
        return true;
    }
};

// Read-only projection handed to listing callers.
struct StrategySnapshot {
    StrategyRecord record;
    std::vector<OrderRecord> orders;
    AggregateStatus aggregate_status = AggregateStatus::IN_PROGRESS;
    LedgerPartition partition = LedgerPartition::ACTIVE;
};

struct AuditRecord {
    std::string order_id;
    AuditEntry entry;
};

struct OrderSummary {
    LedgerStatus status = LedgerStatus::OK;
    std::size_t total_active = 0;
    std::size_t total_strategies = 0;
    std::map<std::string, std::size_t> by_status;
    std::size_t history_count = 0;
};

enum class StagingErrorCode {
    NONE,
    STRUCTURAL_ERROR,
    RISK_REJECTED,
    INVALID_TRANSITION,
    INVALID_REQUEST,
    NOT_FOUND,
    STAGING_CONFLICT,
    PARTIAL_APPROVAL_CONFLICT,
    BACKEND_UNAVAILABLE
};

struct StagingError {
    StagingErrorCode code = StagingErrorCode::NONE;
    std::string message;
    std::vector<std::string> reasons;
    std::optional<risk::RiskAssessment> assessment;  // set for RISK_REJECTED
};

struct StageResult {
    bool ok = false;
    std::string strategy_id;
    StagingError error;
    std::optional<risk::RiskAssessment> assessment;
};

struct OperationResult {
    bool ok = false;
    StagingError error;
};

std::string toString(JournalEventType type);
JournalEventType journalEventTypeFromString(const std::string& value);
std::string toString(LedgerStatus status);
std::string toString(StagingErrorCode code);
std::string toString(LedgerPartition partition);

} // namespace core
} // namespace tradegate
