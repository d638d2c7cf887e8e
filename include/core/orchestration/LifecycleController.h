#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/IAuditJournal.h"
#include "core/contracts/IStagingLedger.h"
#include "core/model/StagingSettings.h"
#include "core/model/StagingTypes.h"
#include "risk/DailyLossTracker.h"
#include "risk/RiskAssessor.h"

namespace tradegate {
namespace core {

// Drives a strategy candidate through validation, risk assessment and the
// order lifecycle. It is the only writer of order status; every write goes
// through the ledger's compare-and-set primitive. No operation retries on
// its own: conflicts are returned to the caller.
class LifecycleController {
public:
    LifecycleController(
        std::shared_ptr<IStagingLedger> ledger,
        const risk::RiskLimits& limits,
        const StagingSettings& settings = StagingSettings(),
        std::shared_ptr<risk::DailyLossTracker> daily_losses = nullptr,
        std::shared_ptr<IAuditJournal> journal = nullptr
    );

    // ===== Strategy-level operations =====

    StageResult stageStrategy(const StrategyCandidate& candidate, const PortfolioSnapshot& portfolio);

    // STAGED -> APPROVED for every order, or none of them.
    OperationResult approveStrategy(const std::string& strategy_id, const std::string& actor = "");

    // STAGED/APPROVED -> REJECTED for every order, or none of them.
    OperationResult rejectStrategy(const std::string& strategy_id, const std::string& reason,
                                   const std::string& actor = "");

    // STAGED/APPROVED -> CANCELLED for every order, or none of them.
    OperationResult cancelStrategy(const std::string& strategy_id, const std::string& reason,
                                   const std::string& actor = "");

    // ===== Order-level operations =====

    // One STAGED/APPROVED order -> REJECTED or CANCELLED; sibling orders keep
    // their status. The strategy is archived once every order is terminal.
    OperationResult rejectOrder(const std::string& order_id, const std::string& reason,
                                const std::string& actor = "");
    OperationResult cancelOrder(const std::string& order_id, const std::string& reason,
                                const std::string& actor = "");

    OperationResult markSubmitted(const std::string& order_id, const std::string& broker_ref,
                                  const std::string& actor = "");

    // Adds a fill; the order becomes PARTIALLY_FILLED until the leg quantity is reached.
    OperationResult markFilled(const std::string& order_id, Price price, int quantity,
                               const std::string& actor = "");

    // Realized P&L feeding the daily-loss limit. An empty date means today.
    Amount recordTradeResult(Amount pnl, const std::string& trade_date = "");

    // ===== Read-only projections =====

    LedgerLookup<StrategySnapshot> getStrategy(const std::string& strategy_id) const;
    LedgerLookup<OrderRecord> getOrder(const std::string& order_id) const;
    LedgerList<StrategySnapshot> listStrategies(LedgerPartition partition = LedgerPartition::ACTIVE) const;
    LedgerList<OrderRecord> listOrders(const OrderFilter& filter = OrderFilter()) const;
    LedgerList<OrderRecord> getApprovedOrders() const;
    LedgerList<AuditRecord> getAuditTrail(const std::string& strategy_id) const;
    OrderSummary getOrderSummary() const;

    const risk::RiskAssessor& assessor() const { return assessor_; }
    std::string currentTradeDate() const;

private:
    struct GroupTransition {
        std::vector<OrderStatus> allowed_from;
        OrderStatus target;
        JournalEventType event;
        StagingErrorCode conflict_code;
        std::string verb;
        std::string note;
        std::string actor;
    };

    OperationResult transitionStrategy(const std::string& strategy_id, const GroupTransition& group);
    OperationResult closeOrder(const std::string& order_id, OrderStatus target, JournalEventType event,
                               const std::string& verb, const std::string& note, const std::string& actor);
    void archiveIfSettled(const std::string& strategy_id);
    std::string nextStrategyId(long long now_ms);
    std::string resolveActor(const std::string& actor) const;

    void publish(JournalEventType type, const std::string& strategy_id, const std::string& order_id,
                 const std::string& actor, const std::string& note, long long ts_ms,
                 nlohmann::json payload = nlohmann::json::object());

    // Ledger calls with exceptions turned into BACKEND_UNAVAILABLE.
    LedgerStatus safeInsert(const StrategyRecord& strategy, const std::vector<OrderRecord>& orders);
    LedgerStatus safeCompareAndSet(const std::string& order_id, const StatusChange& change);
    LedgerStatus safeArchive(const std::string& strategy_id);
    LedgerLookup<OrderRecord> safeGetOrder(const std::string& order_id) const;
    LedgerLookup<StrategyRecord> safeGetStrategy(const std::string& strategy_id) const;
    LedgerList<OrderRecord> safeListOrders(const OrderFilter& filter) const;
    LedgerList<StrategyRecord> safeListStrategies(LedgerPartition partition) const;

    static OperationResult ok();
    static OperationResult fail(StagingErrorCode code, std::string message,
                                std::vector<std::string> reasons = {});
    static StagingErrorCode fromLedgerStatus(LedgerStatus status, StagingErrorCode conflict_code);

    std::shared_ptr<IStagingLedger> ledger_;
    risk::RiskAssessor assessor_;
    StagingSettings settings_;
    std::shared_ptr<risk::DailyLossTracker> daily_losses_;
    std::shared_ptr<IAuditJournal> journal_;
    std::atomic<unsigned long long> id_sequence_{0};
};

} // namespace core
} // namespace tradegate
