#include "core/model/StagingTypes.h"

namespace tradegate {
namespace core {

std::string toString(JournalEventType type) {
    switch (type) {
        case JournalEventType::STRATEGY_STAGED: return "STRATEGY_STAGED";
        case JournalEventType::STRATEGY_REJECTED_STRUCTURE: return "STRATEGY_REJECTED_STRUCTURE";
        case JournalEventType::STRATEGY_REJECTED_RISK: return "STRATEGY_REJECTED_RISK";
        case JournalEventType::ORDER_STAGED: return "ORDER_STAGED";
        case JournalEventType::ORDER_APPROVED: return "ORDER_APPROVED";
        case JournalEventType::ORDER_ROLLED_BACK: return "ORDER_ROLLED_BACK";
        case JournalEventType::ORDER_REJECTED: return "ORDER_REJECTED";
        case JournalEventType::ORDER_CANCELLED: return "ORDER_CANCELLED";
        case JournalEventType::ORDER_SUBMITTED: return "ORDER_SUBMITTED";
        case JournalEventType::ORDER_PARTIALLY_FILLED: return "ORDER_PARTIALLY_FILLED";
        case JournalEventType::ORDER_FILLED: return "ORDER_FILLED";
        case JournalEventType::STRATEGY_ARCHIVED: return "STRATEGY_ARCHIVED";
        case JournalEventType::TRADE_RESULT_RECORDED: return "TRADE_RESULT_RECORDED";
    }
    return "ORDER_STAGED";
}

JournalEventType journalEventTypeFromString(const std::string& value) {
    if (value == "STRATEGY_STAGED") return JournalEventType::STRATEGY_STAGED;
    if (value == "STRATEGY_REJECTED_STRUCTURE") return JournalEventType::STRATEGY_REJECTED_STRUCTURE;
    if (value == "STRATEGY_REJECTED_RISK") return JournalEventType::STRATEGY_REJECTED_RISK;
    if (value == "ORDER_APPROVED") return JournalEventType::ORDER_APPROVED;
    if (value == "ORDER_ROLLED_BACK") return JournalEventType::ORDER_ROLLED_BACK;
    if (value == "ORDER_REJECTED") return JournalEventType::ORDER_REJECTED;
    if (value == "ORDER_CANCELLED") return JournalEventType::ORDER_CANCELLED;
    if (value == "ORDER_SUBMITTED") return JournalEventType::ORDER_SUBMITTED;
    if (value == "ORDER_PARTIALLY_FILLED") return JournalEventType::ORDER_PARTIALLY_FILLED;
    if (value == "ORDER_FILLED") return JournalEventType::ORDER_FILLED;
    if (value == "STRATEGY_ARCHIVED") return JournalEventType::STRATEGY_ARCHIVED;
    if (value == "TRADE_RESULT_RECORDED") return JournalEventType::TRADE_RESULT_RECORDED;
    return JournalEventType::ORDER_STAGED;
}

std::string toString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::OK: return "OK";
        case LedgerStatus::NOT_FOUND: return "NOT_FOUND";
        case LedgerStatus::CONFLICT: return "CONFLICT";
        case LedgerStatus::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case LedgerStatus::READ_ONLY: return "READ_ONLY";
        case LedgerStatus::NOT_TERMINAL: return "NOT_TERMINAL";
        case LedgerStatus::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
    }
    return "UNKNOWN";
}

std::string toString(StagingErrorCode code) {
    switch (code) {
        case StagingErrorCode::NONE: return "NONE";
        case StagingErrorCode::STRUCTURAL_ERROR: return "STRUCTURAL_ERROR";
        case StagingErrorCode::RISK_REJECTED: return "RISK_REJECTED";
        case StagingErrorCode::INVALID_TRANSITION: return "INVALID_TRANSITION";
        case StagingErrorCode::INVALID_REQUEST: return "INVALID_REQUEST";
        case StagingErrorCode::NOT_FOUND: return "NOT_FOUND";
        case StagingErrorCode::STAGING_CONFLICT: return "STAGING_CONFLICT";
        case StagingErrorCode::PARTIAL_APPROVAL_CONFLICT: return "PARTIAL_APPROVAL_CONFLICT";
        case StagingErrorCode::BACKEND_UNAVAILABLE: return "BACKEND_UNAVAILABLE";
    }
    return "UNKNOWN";
}

std::string toString(LedgerPartition partition) {
    return partition == LedgerPartition::ACTIVE ? "active" : "history";
}

} // namespace core
} // namespace tradegate
