#include "core/orchestration/LifecycleController.h"
#include "core/state/InMemoryStagingLedger.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tradegate;
using namespace tradegate::core;

namespace {

// Answers CONFLICT for one order as if another caller had just moved it.
class ConflictInjectingLedger : public InMemoryStagingLedger {
public:
    void injectConflict(const std::string& order_id, OrderStatus on_next) {
        target_order_ = order_id;
        on_next_ = on_next;
    }
    void clear() { target_order_.clear(); }

    LedgerStatus compareAndSetStatus(const std::string& order_id, const StatusChange& change) override {
        if (!target_order_.empty() && order_id == target_order_ && change.next == on_next_) {
            return LedgerStatus::CONFLICT;
        }
        return InMemoryStagingLedger::compareAndSetStatus(order_id, change);
    }

private:
    std::string target_order_;
    OrderStatus on_next_ = OrderStatus::APPROVED;
};

// Backend that starts throwing once switched off.
class FlakyLedger : public InMemoryStagingLedger {
public:
    std::atomic<bool> down{false};

    LedgerStatus insertStrategy(const StrategyRecord& strategy, const std::vector<OrderRecord>& orders) override {
        guard();
        return InMemoryStagingLedger::insertStrategy(strategy, orders);
    }
    LedgerLookup<OrderRecord> getOrder(const std::string& order_id) const override {
        guard();
        return InMemoryStagingLedger::getOrder(order_id);
    }
    LedgerLookup<StrategyRecord> getStrategy(const std::string& strategy_id) const override {
        guard();
        return InMemoryStagingLedger::getStrategy(strategy_id);
    }
    LedgerStatus compareAndSetStatus(const std::string& order_id, const StatusChange& change) override {
        guard();
        return InMemoryStagingLedger::compareAndSetStatus(order_id, change);
    }
    LedgerList<OrderRecord> listOrders(const OrderFilter& filter) const override {
        guard();
        return InMemoryStagingLedger::listOrders(filter);
    }
    LedgerList<StrategyRecord> listStrategies(LedgerPartition partition) const override {
        guard();
        return InMemoryStagingLedger::listStrategies(partition);
    }

private:
    void guard() const {
        if (down.load()) {
            throw std::runtime_error("ledger connection refused");
        }
    }
};

risk::RiskLimits testLimits() {
    risk::RiskLimits limits;
    limits.max_position_size = 5000.0;
    limits.max_portfolio_exposure = 20000.0;
    limits.max_loss_per_trade = 1000.0;
    limits.max_loss_per_day = 2000.0;
    limits.contract_multiplier = 100.0;
    return limits;
}

StrategyCandidate ironCondor(double max_risk = 290.0, int quantity = 2) {
    StrategyCandidate c;
    c.id = "ic-1";
    c.symbol = "SPY";
    c.archetype = Archetype::IRON_CONDOR;
    c.legs = {
        {OrderSide::SELL, OptionType::PUT, 440.0, quantity},
        {OrderSide::BUY, OptionType::PUT, 435.0, quantity},
        {OrderSide::SELL, OptionType::CALL, 460.0, quantity},
        {OrderSide::BUY, OptionType::CALL, 465.0, quantity}
    };
    c.declared_max_risk = max_risk;
    return c;
}

PortfolioSnapshot portfolio() {
    PortfolioSnapshot p;
    p.equity = 100000.0;
    p.cash = 100000.0;
    return p;
}

bool allStatus(const LifecycleController& controller, const std::string& strategy_id, OrderStatus expected) {
    auto snapshot = controller.getStrategy(strategy_id);
    if (!snapshot.found()) {
        return false;
    }
    return std::all_of(snapshot.record.orders.begin(), snapshot.record.orders.end(),
                       [&](const OrderRecord& o) { return o.status == expected; });
}

bool hasEvent(const LedgerList<AuditRecord>& trail, const std::string& event, const std::string& note = "") {
    return std::any_of(trail.records.begin(), trail.records.end(), [&](const AuditRecord& r) {
        return r.entry.event == event && (note.empty() || r.entry.note == note);
    });
}

// Status, version and audit trail all untouched.
bool sameRecord(const OrderRecord& before, const OrderRecord& after) {
    return before.status == after.status && before.version == after.version &&
           before.audit_trail.size() == after.audit_trail.size() &&
           before.filled_quantity == after.filled_quantity;
}

bool testStructuralRejectionWritesNothing() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    StrategyCandidate c;
    c.id = "pcs-1";
    c.symbol = "SPY";
    c.archetype = Archetype::PUT_CREDIT_SPREAD;
    c.legs = {{OrderSide::SELL, OptionType::PUT, 440.0, 1}};
    c.declared_max_risk = 100.0;

    auto result = controller.stageStrategy(c, portfolio());
    if (result.ok || result.error.code != StagingErrorCode::STRUCTURAL_ERROR) {
        std::cerr << "[TEST] one-leg put credit spread should fail structurally\n";
        return false;
    }
    if (result.error.reasons != std::vector<std::string>{"put_credit_spread: expected 2 legs, found 1"}) {
        std::cerr << "[TEST] unexpected structural reasons\n";
        return false;
    }
    if (!ledger->listStrategies(LedgerPartition::ACTIVE).records.empty() ||
        !ledger->listOrders(OrderFilter()).records.empty()) {
        std::cerr << "[TEST] structural rejection must not create records\n";
        return false;
    }

    // A custom structure may take any shape, but never an unfillable leg.
    StrategyCandidate custom;
    custom.id = "custom-1";
    custom.symbol = "QQQ";
    custom.archetype = Archetype::CUSTOM;
    custom.legs = {{OrderSide::BUY, OptionType::CALL, -5.0, 0}};
    custom.declared_max_risk = 100.0;
    auto bad_legs = controller.stageStrategy(custom, portfolio());
    if (bad_legs.ok || bad_legs.error.code != StagingErrorCode::STRUCTURAL_ERROR ||
        bad_legs.error.reasons.size() != 2 || !ledger->listOrders(OrderFilter()).records.empty()) {
        std::cerr << "[TEST] custom leg with non-positive strike and quantity should fail structurally\n";
        return false;
    }
    return true;
}

bool testRiskRejectionWritesNothing() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    auto result = controller.stageStrategy(ironCondor(1500.0), portfolio());
    if (result.ok || result.error.code != StagingErrorCode::RISK_REJECTED || !result.error.assessment) {
        std::cerr << "[TEST] oversized trade should be risk-rejected with its assessment\n";
        return false;
    }
    const auto& violations = result.error.assessment->violations;
    const bool per_trade = std::any_of(violations.begin(), violations.end(), [](const std::string& v) {
        return v.rfind("per-trade limit", 0) == 0;
    });
    if (!per_trade || result.error.reasons != violations) {
        std::cerr << "[TEST] rejection should list the per-trade violation\n";
        return false;
    }
    if (!ledger->listOrders(OrderFilter()).records.empty()) {
        std::cerr << "[TEST] risk rejection must not create records\n";
        return false;
    }
    return true;
}

bool testFullLifecycle() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    auto staged = controller.stageStrategy(ironCondor(), portfolio());
    if (!staged.ok || staged.strategy_id.empty() || !staged.assessment || !staged.assessment->approved) {
        std::cerr << "[TEST] iron condor should stage: " << staged.error.message << "\n";
        return false;
    }
    const std::string id = staged.strategy_id;

    auto snapshot = controller.getStrategy(id);
    if (!snapshot.found() || snapshot.record.orders.size() != 4 ||
        snapshot.record.aggregate_status != AggregateStatus::IN_PROGRESS ||
        !allStatus(controller, id, OrderStatus::STAGED)) {
        std::cerr << "[TEST] staged strategy should hold four STAGED orders\n";
        return false;
    }
    if (snapshot.record.orders[2].id != id + "-L2" || snapshot.record.orders[2].leg.strike != 460.0) {
        std::cerr << "[TEST] order ids should follow leg order\n";
        return false;
    }

    const std::string l0 = id + "-L0";
    auto early = controller.markSubmitted(l0, "BRK-0");
    if (early.ok || early.error.code != StagingErrorCode::INVALID_TRANSITION) {
        std::cerr << "[TEST] unapproved order must not be submitted\n";
        return false;
    }

    if (!controller.approveStrategy(id, "desk").ok || !allStatus(controller, id, OrderStatus::APPROVED)) {
        std::cerr << "[TEST] approve failed\n";
        return false;
    }
    if (controller.getApprovedOrders().records.size() != 4) {
        std::cerr << "[TEST] four approved orders expected\n";
        return false;
    }
    auto again = controller.approveStrategy(id);
    if (again.ok || again.error.code != StagingErrorCode::INVALID_TRANSITION) {
        std::cerr << "[TEST] second approval should be an invalid transition\n";
        return false;
    }

    auto no_ref = controller.markSubmitted(l0, "");
    if (no_ref.ok || no_ref.error.code != StagingErrorCode::INVALID_REQUEST) {
        std::cerr << "[TEST] empty broker reference should be refused\n";
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        const std::string oid = id + "-L" + std::to_string(i);
        if (!controller.markSubmitted(oid, "BRK-" + std::to_string(i)).ok) {
            std::cerr << "[TEST] submit " << oid << " failed\n";
            return false;
        }
    }
    if (controller.getOrder(l0).record.broker_ref != "BRK-0") {
        std::cerr << "[TEST] broker reference not stored\n";
        return false;
    }

    if (!controller.markFilled(l0, 1.0, 1).ok ||
        controller.getOrder(l0).record.status != OrderStatus::PARTIALLY_FILLED) {
        std::cerr << "[TEST] first fill should be partial\n";
        return false;
    }
    auto overfill = controller.markFilled(l0, 1.0, 2);
    if (overfill.ok || overfill.error.code != StagingErrorCode::INVALID_REQUEST) {
        std::cerr << "[TEST] overfill should be refused\n";
        return false;
    }
    auto bad_price = controller.markFilled(l0, 0.0, 1);
    if (bad_price.ok || bad_price.error.code != StagingErrorCode::INVALID_REQUEST) {
        std::cerr << "[TEST] zero price should be refused\n";
        return false;
    }
    if (!controller.markFilled(l0, 2.0, 1).ok) {
        std::cerr << "[TEST] completing fill failed\n";
        return false;
    }
    auto filled = controller.getOrder(l0).record;
    if (filled.status != OrderStatus::FILLED || filled.filled_quantity != 2 ||
        !filled.filled_price || std::fabs(*filled.filled_price - 1.5) > 1e-9) {
        std::cerr << "[TEST] filled order should carry the average price\n";
        return false;
    }

    // Strategy stays active until every leg is terminal.
    if (controller.getStrategy(id).partition != LedgerPartition::ACTIVE) {
        std::cerr << "[TEST] strategy archived too early\n";
        return false;
    }
    for (int i = 1; i < 4; ++i) {
        if (!controller.markFilled(id + "-L" + std::to_string(i), 3.0, 2).ok) {
            std::cerr << "[TEST] fill of leg " << i << " failed\n";
            return false;
        }
    }

    auto done = controller.getStrategy(id);
    if (done.partition != LedgerPartition::HISTORY || done.record.aggregate_status != AggregateStatus::FILLED) {
        std::cerr << "[TEST] filled strategy should be archived as FILLED\n";
        return false;
    }

    // Terminal records are immutable.
    const auto before = controller.getOrder(l0).record;
    auto late_fill = controller.markFilled(l0, 1.0, 1);
    auto late_cancel = controller.cancelStrategy(id, "too late");
    auto late_approve = controller.approveStrategy(id);
    if (late_fill.error.code != StagingErrorCode::INVALID_TRANSITION ||
        late_cancel.error.code != StagingErrorCode::INVALID_TRANSITION ||
        late_approve.error.code != StagingErrorCode::INVALID_TRANSITION) {
        std::cerr << "[TEST] terminal strategy must refuse every mutation\n";
        return false;
    }
    const auto after = controller.getOrder(l0).record;
    if (after.version != before.version || after.audit_trail.size() != before.audit_trail.size()) {
        std::cerr << "[TEST] refused mutation changed the record\n";
        return false;
    }

    auto trail = controller.getAuditTrail(id);
    if (!hasEvent(trail, "ORDER_STAGED") || !hasEvent(trail, "ORDER_APPROVED") ||
        !hasEvent(trail, "ORDER_SUBMITTED") || !hasEvent(trail, "ORDER_PARTIALLY_FILLED") ||
        !hasEvent(trail, "ORDER_FILLED")) {
        std::cerr << "[TEST] audit trail incomplete\n";
        return false;
    }
    if (!std::is_sorted(trail.records.begin(), trail.records.end(), [](const AuditRecord& a, const AuditRecord& b) {
            return a.entry.ts_ms < b.entry.ts_ms;
        })) {
        std::cerr << "[TEST] audit trail should be time ordered\n";
        return false;
    }
    const bool desk_approved = std::any_of(trail.records.begin(), trail.records.end(), [](const AuditRecord& r) {
        return r.entry.event == "ORDER_APPROVED" && r.entry.actor == "desk";
    });
    if (!desk_approved) {
        std::cerr << "[TEST] approval actor not recorded\n";
        return false;
    }
    return true;
}

bool testRejectAndCancel() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    auto rejected = controller.stageStrategy(ironCondor(), portfolio());
    auto cancelled = controller.stageStrategy(ironCondor(), portfolio());
    auto live = controller.stageStrategy(ironCondor(), portfolio());
    if (!rejected.ok || !cancelled.ok || !live.ok || rejected.strategy_id == cancelled.strategy_id) {
        std::cerr << "[TEST] staging three strategies failed\n";
        return false;
    }

    if (!controller.rejectStrategy(rejected.strategy_id, "spread too wide", "risk-desk").ok) {
        std::cerr << "[TEST] reject failed\n";
        return false;
    }
    auto r = controller.getStrategy(rejected.strategy_id);
    if (r.partition != LedgerPartition::HISTORY || r.record.aggregate_status != AggregateStatus::REJECTED) {
        std::cerr << "[TEST] rejected strategy should be archived as REJECTED\n";
        return false;
    }
    if (!hasEvent(controller.getAuditTrail(rejected.strategy_id), "ORDER_REJECTED", "spread too wide")) {
        std::cerr << "[TEST] rejection reason missing from audit trail\n";
        return false;
    }

    if (!controller.approveStrategy(cancelled.strategy_id).ok ||
        !controller.cancelStrategy(cancelled.strategy_id, "user request").ok) {
        std::cerr << "[TEST] approve then cancel failed\n";
        return false;
    }
    auto c = controller.getStrategy(cancelled.strategy_id);
    if (c.partition != LedgerPartition::HISTORY || c.record.aggregate_status != AggregateStatus::CANCELLED) {
        std::cerr << "[TEST] cancelled strategy should be archived as CANCELLED\n";
        return false;
    }

    // Once anything is submitted the strategy can no longer be rejected as a whole.
    if (!controller.approveStrategy(live.strategy_id).ok ||
        !controller.markSubmitted(live.strategy_id + "-L0", "BRK-1").ok) {
        std::cerr << "[TEST] live strategy setup failed\n";
        return false;
    }
    auto refused = controller.rejectStrategy(live.strategy_id, "late");
    if (refused.ok || refused.error.code != StagingErrorCode::INVALID_TRANSITION || refused.error.reasons.size() != 1) {
        std::cerr << "[TEST] reject after submit should name the submitted order\n";
        return false;
    }
    if (controller.getOrder(live.strategy_id + "-L1").record.status != OrderStatus::APPROVED) {
        std::cerr << "[TEST] refused reject must not touch other orders\n";
        return false;
    }

    auto missing = controller.rejectStrategy("STRAT_missing", "x");
    if (missing.ok || missing.error.code != StagingErrorCode::NOT_FOUND) {
        std::cerr << "[TEST] unknown strategy should be NOT_FOUND\n";
        return false;
    }

    auto summary = controller.getOrderSummary();
    if (summary.status != LedgerStatus::OK || summary.total_active != 4 || summary.total_strategies != 1 ||
        summary.history_count != 8 || summary.by_status["SUBMITTED"] != 1 || summary.by_status["APPROVED"] != 3) {
        std::cerr << "[TEST] order summary mismatch\n";
        return false;
    }
    if (controller.listStrategies(LedgerPartition::HISTORY).records.size() != 2) {
        std::cerr << "[TEST] two strategies should be archived\n";
        return false;
    }
    return true;
}

bool testSingleOrderExits() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    auto staged = controller.stageStrategy(ironCondor(), portfolio());
    if (!staged.ok || !controller.approveStrategy(staged.strategy_id).ok) {
        std::cerr << "[TEST] setup failed\n";
        return false;
    }
    const std::string id = staged.strategy_id;
    if (!controller.markSubmitted(id + "-L0", "BRK-0").ok) {
        std::cerr << "[TEST] submit failed\n";
        return false;
    }

    auto at_broker = controller.cancelOrder(id + "-L0", "too late");
    if (at_broker.ok || at_broker.error.code != StagingErrorCode::INVALID_TRANSITION) {
        std::cerr << "[TEST] a submitted order cannot be cancelled\n";
        return false;
    }

    if (!controller.cancelOrder(id + "-L1", "leg no longer needed", "desk").ok ||
        !controller.rejectOrder(id + "-L2", "strike moved").ok ||
        !controller.cancelOrder(id + "-L3", "").ok) {
        std::cerr << "[TEST] single-order exits failed\n";
        return false;
    }
    auto pending = controller.getStrategy(id);
    if (pending.partition != LedgerPartition::ACTIVE ||
        pending.record.orders[1].status != OrderStatus::CANCELLED ||
        pending.record.orders[2].status != OrderStatus::REJECTED ||
        pending.record.orders[0].status != OrderStatus::SUBMITTED) {
        std::cerr << "[TEST] strategy must stay active while a leg is at the broker\n";
        return false;
    }

    const auto cancelled_before = controller.getOrder(id + "-L1").record;
    auto twice = controller.cancelOrder(id + "-L1", "again");
    if (twice.ok || twice.error.code != StagingErrorCode::INVALID_TRANSITION ||
        !sameRecord(cancelled_before, controller.getOrder(id + "-L1").record)) {
        std::cerr << "[TEST] cancelled order must refuse a second cancel\n";
        return false;
    }

    if (!controller.markFilled(id + "-L0", 1.1, 2).ok) {
        std::cerr << "[TEST] fill of the last live leg failed\n";
        return false;
    }
    auto closed = controller.getStrategy(id);
    if (closed.partition != LedgerPartition::HISTORY ||
        closed.record.aggregate_status != AggregateStatus::CLOSED) {
        std::cerr << "[TEST] one filled leg and the rest closed out should archive as CLOSED, got "
                  << toString(closed.record.aggregate_status) << "\n";
        return false;
    }
    auto trail = controller.getAuditTrail(id);
    if (!hasEvent(trail, "ORDER_CANCELLED", "leg no longer needed") ||
        !hasEvent(trail, "ORDER_REJECTED", "strike moved") || !hasEvent(trail, "ORDER_CANCELLED", "cancelled")) {
        std::cerr << "[TEST] single-order exits missing from audit trail\n";
        return false;
    }

    // Cancelling every leg one at a time archives the strategy as CANCELLED.
    auto other = controller.stageStrategy(ironCondor(), portfolio());
    if (!other.ok) {
        std::cerr << "[TEST] second staging failed\n";
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        if (!controller.cancelOrder(other.strategy_id + "-L" + std::to_string(i), "withdrawn").ok) {
            std::cerr << "[TEST] cancel of leg " << i << " failed\n";
            return false;
        }
    }
    auto withdrawn = controller.getStrategy(other.strategy_id);
    if (withdrawn.partition != LedgerPartition::HISTORY ||
        withdrawn.record.aggregate_status != AggregateStatus::CANCELLED) {
        std::cerr << "[TEST] fully cancelled strategy should archive as CANCELLED\n";
        return false;
    }

    auto missing = controller.rejectOrder("STRAT_missing-L0", "x");
    if (missing.ok || missing.error.code != StagingErrorCode::NOT_FOUND) {
        std::cerr << "[TEST] unknown order should be NOT_FOUND\n";
        return false;
    }
    return true;
}

bool testTerminalOrdersRefuseMutation() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    auto rejected = controller.stageStrategy(ironCondor(), portfolio());
    auto cancelled = controller.stageStrategy(ironCondor(), portfolio());
    auto mixed = controller.stageStrategy(ironCondor(), portfolio());
    auto filling = controller.stageStrategy(ironCondor(), portfolio());
    if (!rejected.ok || !cancelled.ok || !mixed.ok || !filling.ok ||
        !controller.rejectStrategy(rejected.strategy_id, "no edge").ok ||
        !controller.cancelStrategy(cancelled.strategy_id, "user request").ok ||
        !controller.rejectOrder(mixed.strategy_id + "-L0", "strike moved").ok) {
        std::cerr << "[TEST] terminal setup failed\n";
        return false;
    }

    // REJECTED and CANCELLED orders, archived or still beside live siblings.
    for (const std::string& order_id : {rejected.strategy_id + "-L0", cancelled.strategy_id + "-L1",
                                        mixed.strategy_id + "-L0"}) {
        const auto before = controller.getOrder(order_id).record;
        auto submit = controller.markSubmitted(order_id, "BRK-9");
        auto fill = controller.markFilled(order_id, 1.0, 1);
        auto cancel = controller.cancelOrder(order_id, "again");
        auto reject = controller.rejectOrder(order_id, "again");
        if (submit.error.code != StagingErrorCode::INVALID_TRANSITION ||
            fill.error.code != StagingErrorCode::INVALID_TRANSITION ||
            cancel.error.code != StagingErrorCode::INVALID_TRANSITION ||
            reject.error.code != StagingErrorCode::INVALID_TRANSITION) {
            std::cerr << "[TEST] " << order_id << " should refuse every mutation\n";
            return false;
        }
        if (!sameRecord(before, controller.getOrder(order_id).record)) {
            std::cerr << "[TEST] refused mutation changed " << order_id << "\n";
            return false;
        }
    }
    if (controller.getStrategy(mixed.strategy_id).partition != LedgerPartition::ACTIVE ||
        controller.getOrder(mixed.strategy_id + "-L1").record.status != OrderStatus::STAGED) {
        std::cerr << "[TEST] siblings of a rejected order stay staged\n";
        return false;
    }

    // FILLED order whose strategy is still active.
    const std::string id = filling.strategy_id;
    if (!controller.approveStrategy(id).ok || !controller.markSubmitted(id + "-L0", "BRK-0").ok ||
        !controller.markSubmitted(id + "-L1", "BRK-1").ok || !controller.markFilled(id + "-L0", 1.0, 2).ok) {
        std::cerr << "[TEST] fill setup failed\n";
        return false;
    }
    const auto filled = controller.getOrder(id + "-L0").record;
    if (filled.status != OrderStatus::FILLED || controller.getStrategy(id).partition != LedgerPartition::ACTIVE) {
        std::cerr << "[TEST] strategy with a live leg should remain active\n";
        return false;
    }
    auto approve = controller.approveStrategy(id);
    auto reject = controller.rejectStrategy(id, "late");
    auto submit = controller.markSubmitted(id + "-L0", "BRK-X");
    auto fill = controller.markFilled(id + "-L0", 1.0, 1);
    auto cancel = controller.cancelOrder(id + "-L0", "late");
    if (approve.error.code != StagingErrorCode::INVALID_TRANSITION ||
        reject.error.code != StagingErrorCode::INVALID_TRANSITION ||
        submit.error.code != StagingErrorCode::INVALID_TRANSITION ||
        fill.error.code != StagingErrorCode::INVALID_TRANSITION ||
        cancel.error.code != StagingErrorCode::INVALID_TRANSITION) {
        std::cerr << "[TEST] filled order should refuse every mutation\n";
        return false;
    }
    const auto after = controller.getOrder(id + "-L0").record;
    if (!sameRecord(filled, after) || after.broker_ref != "BRK-0") {
        std::cerr << "[TEST] refused mutation changed the filled order\n";
        return false;
    }
    return true;
}

bool testFillQuantityNearIntLimit() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    constexpr int kMax = std::numeric_limits<int>::max();
    auto staged = controller.stageStrategy(ironCondor(290.0, kMax), portfolio());
    if (!staged.ok || !controller.approveStrategy(staged.strategy_id).ok) {
        std::cerr << "[TEST] large-quantity setup failed\n";
        return false;
    }
    const std::string l0 = staged.strategy_id + "-L0";
    if (!controller.markSubmitted(l0, "BRK-0").ok || !controller.markFilled(l0, 1.0, kMax - 1).ok) {
        std::cerr << "[TEST] large partial fill failed\n";
        return false;
    }

    auto overfill = controller.markFilled(l0, 1.0, kMax);
    if (overfill.ok || overfill.error.code != StagingErrorCode::INVALID_REQUEST ||
        controller.getOrder(l0).record.filled_quantity != kMax - 1) {
        std::cerr << "[TEST] fill past the leg quantity should be refused\n";
        return false;
    }
    if (!controller.markFilled(l0, 1.0, 1).ok || controller.getOrder(l0).record.status != OrderStatus::FILLED) {
        std::cerr << "[TEST] last contract should complete the fill\n";
        return false;
    }
    return true;
}

bool testApprovalIsAllOrNothing() {
    auto ledger = std::make_shared<ConflictInjectingLedger>();
    LifecycleController controller(ledger, testLimits());

    auto staged = controller.stageStrategy(ironCondor(), portfolio());
    if (!staged.ok) {
        std::cerr << "[TEST] staging failed\n";
        return false;
    }
    const std::string id = staged.strategy_id;

    ledger->injectConflict(id + "-L3", OrderStatus::APPROVED);
    auto result = controller.approveStrategy(id);
    if (result.ok || result.error.code != StagingErrorCode::PARTIAL_APPROVAL_CONFLICT) {
        std::cerr << "[TEST] conflicting approval should report PARTIAL_APPROVAL_CONFLICT\n";
        return false;
    }
    if (!allStatus(controller, id, OrderStatus::STAGED)) {
        std::cerr << "[TEST] no order may stay APPROVED after a conflict\n";
        return false;
    }
    auto trail = controller.getAuditTrail(id);
    const auto rollbacks = std::count_if(trail.records.begin(), trail.records.end(), [](const AuditRecord& r) {
        return r.entry.event == "ORDER_ROLLED_BACK";
    });
    if (rollbacks != 3) {
        std::cerr << "[TEST] expected three compensating transitions, got " << rollbacks << "\n";
        return false;
    }

    // The caller retries once the conflict is gone.
    ledger->clear();
    if (!controller.approveStrategy(id).ok || !allStatus(controller, id, OrderStatus::APPROVED)) {
        std::cerr << "[TEST] retry after conflict should approve\n";
        return false;
    }
    return true;
}

bool testConcurrentApprovalHasOneWinner() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    LifecycleController controller(ledger, testLimits());

    auto staged = controller.stageStrategy(ironCondor(), portfolio());
    if (!staged.ok) {
        std::cerr << "[TEST] staging failed\n";
        return false;
    }

    constexpr int kCallers = 8;
    std::atomic<int> successes{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&controller, &successes, &staged, i]() {
            if (controller.approveStrategy(staged.strategy_id, "caller-" + std::to_string(i)).ok) {
                ++successes;
            }
        });
    }
    for (auto& t : callers) {
        t.join();
    }
    if (successes.load() != 1 || !allStatus(controller, staged.strategy_id, OrderStatus::APPROVED)) {
        std::cerr << "[TEST] concurrent approvals should have exactly one winner, got "
                  << successes.load() << "\n";
        return false;
    }
    return true;
}

bool testBackendUnavailableFailsClosed() {
    auto ledger = std::make_shared<FlakyLedger>();
    LifecycleController controller(ledger, testLimits());

    auto staged = controller.stageStrategy(ironCondor(), portfolio());
    if (!staged.ok) {
        std::cerr << "[TEST] staging on a healthy backend failed\n";
        return false;
    }

    ledger->down = true;
    auto stage = controller.stageStrategy(ironCondor(), portfolio());
    auto approve = controller.approveStrategy(staged.strategy_id);
    auto submit = controller.markSubmitted(staged.strategy_id + "-L0", "BRK");
    auto lookup = controller.getStrategy(staged.strategy_id);
    if (stage.ok || stage.error.code != StagingErrorCode::BACKEND_UNAVAILABLE ||
        approve.ok || approve.error.code != StagingErrorCode::BACKEND_UNAVAILABLE ||
        submit.ok || submit.error.code != StagingErrorCode::BACKEND_UNAVAILABLE ||
        lookup.status != LedgerStatus::BACKEND_UNAVAILABLE) {
        std::cerr << "[TEST] every operation must fail closed while the ledger is down\n";
        return false;
    }
    if (controller.getOrderSummary().status != LedgerStatus::BACKEND_UNAVAILABLE) {
        std::cerr << "[TEST] summary must surface the backend failure\n";
        return false;
    }

    ledger->down = false;
    if (!allStatus(controller, staged.strategy_id, OrderStatus::STAGED)) {
        std::cerr << "[TEST] outage must not leave partial state\n";
        return false;
    }
    return true;
}

bool testRecordedLossesFeedDailyLimit() {
    auto ledger = std::make_shared<InMemoryStagingLedger>();
    auto tracker = std::make_shared<risk::DailyLossTracker>();
    LifecycleController controller(ledger, testLimits(), StagingSettings(), tracker);

    controller.recordTradeResult(250.0);
    const double total = controller.recordTradeResult(-1900.0);
    if (std::fabs(total - 1900.0) > 1e-9 || std::fabs(tracker->lossFor(controller.currentTradeDate()) - 1900.0) > 1e-9) {
        std::cerr << "[TEST] recorded loss should be 1900\n";
        return false;
    }

    auto result = controller.stageStrategy(ironCondor(), portfolio());
    if (result.ok || result.error.code != StagingErrorCode::RISK_REJECTED) {
        std::cerr << "[TEST] daily loss should block the trade\n";
        return false;
    }
    const bool daily = std::any_of(result.error.reasons.begin(), result.error.reasons.end(),
                                   [](const std::string& r) { return r.rfind("daily-loss limit", 0) == 0; });
    if (!daily) {
        std::cerr << "[TEST] rejection should name the daily-loss limit\n";
        return false;
    }

    // The portfolio's own figure counts too; the larger one wins.
    auto fresh = std::make_shared<InMemoryStagingLedger>();
    LifecycleController other(fresh, testLimits());
    PortfolioSnapshot p = portfolio();
    p.daily_realized_loss[other.currentTradeDate()] = 1800.0;
    auto blocked = other.stageStrategy(ironCondor(), p);
    if (blocked.ok || blocked.error.code != StagingErrorCode::RISK_REJECTED) {
        std::cerr << "[TEST] portfolio daily loss should block the trade\n";
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!testStructuralRejectionWritesNothing()) return 1;
    if (!testRiskRejectionWritesNothing()) return 1;
    if (!testFullLifecycle()) return 1;
    if (!testRejectAndCancel()) return 1;
    if (!testSingleOrderExits()) return 1;
    if (!testTerminalOrdersRefuseMutation()) return 1;
    if (!testFillQuantityNearIntLimit()) return 1;
    if (!testApprovalIsAllOrNothing()) return 1;
    if (!testConcurrentApprovalHasOneWinner()) return 1;
    if (!testBackendUnavailableFailsClosed()) return 1;
    if (!testRecordedLossesFeedDailyLimit()) return 1;

    std::cout << "[TEST] LifecycleController PASSED\n";
    return 0;
}
