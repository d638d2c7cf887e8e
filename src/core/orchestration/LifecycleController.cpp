#include "core/orchestration/LifecycleController.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

#include "common/Logger.h"
#include "common/TradeDate.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "validation/StructuralValidator.h"

namespace tradegate {
namespace core {

using execution::OrderLifecycleStateMachine;

namespace {
std::string describeLeg(std::size_t index, const Leg& leg) {
    return fmt::format("leg {}: {} {} {:.2f} x{}", index, toString(leg.side),
                       toString(leg.instrument), leg.strike, leg.quantity);
}

bool contains(const std::vector<OrderStatus>& statuses, OrderStatus status) {
    return std::find(statuses.begin(), statuses.end(), status) != statuses.end();
}
} // namespace

LifecycleController::LifecycleController(
    std::shared_ptr<IStagingLedger> ledger,
    const risk::RiskLimits& limits,
    const StagingSettings& settings,
    std::shared_ptr<risk::DailyLossTracker> daily_losses,
    std::shared_ptr<IAuditJournal> journal
)
    : ledger_(std::move(ledger))
    , assessor_(limits)
    , settings_(settings)
    , daily_losses_(daily_losses ? std::move(daily_losses) : std::make_shared<risk::DailyLossTracker>())
    , journal_(std::move(journal))
{
    if (!ledger_) {
        throw std::invalid_argument("LifecycleController requires a staging ledger");
    }
    LOG_INFO("LifecycleController initialized - trade date offset {} min, journal {}",
             settings_.trade_date_utc_offset_minutes, journal_ ? "on" : "off");
}

// ===== Staging =====

StageResult LifecycleController::stageStrategy(const StrategyCandidate& candidate,
                                               const PortfolioSnapshot& portfolio) {
    StageResult result;
    const long long now = utils::nowMs();
    const std::string actor = resolveActor("");

    // 1) structure
    const auto structural = validation::StructuralValidator::validate(candidate);
    if (!structural.empty()) {
        LOG_WARN("[Lifecycle] {} ({}) failed structural validation: {}",
                 candidate.id, toString(candidate.archetype), structural.front());
        nlohmann::json payload;
        payload["candidate_id"] = candidate.id;
        payload["errors"] = structural;
        publish(JournalEventType::STRATEGY_REJECTED_STRUCTURE, "", "", actor, structural.front(), now, payload);

        result.error.code = StagingErrorCode::STRUCTURAL_ERROR;
        result.error.message = fmt::format("{} structural rule(s) violated", structural.size());
        result.error.reasons = structural;
        return result;
    }

    if (candidate.legs.empty()) {
        result.error.code = StagingErrorCode::INVALID_REQUEST;
        result.error.message = "candidate has no legs to stage";
        result.error.reasons.push_back(result.error.message);
        return result;
    }

    // 2) risk
    const std::string trade_date = utils::tradeDateFor(now, settings_.trade_date_utc_offset_minutes);
    const Amount daily_loss = std::max(portfolio.dailyRealizedLoss(trade_date),
                                       daily_losses_->lossFor(trade_date));
    LOG_DEBUG("[Lifecycle] {} trade date {}, prior daily loss {:.2f}", candidate.id, trade_date, daily_loss);
    const risk::RiskAssessment assessment = assessor_.assess(candidate, portfolio, daily_loss);
    result.assessment = assessment;

    if (!assessment.approved) {
        nlohmann::json payload;
        payload["candidate_id"] = candidate.id;
        payload["risk_score"] = assessment.risk_score;
        payload["violations"] = assessment.violations;
        publish(JournalEventType::STRATEGY_REJECTED_RISK, "", "", actor,
                assessment.violations.front(), now, payload);

        result.error.code = StagingErrorCode::RISK_REJECTED;
        result.error.message = fmt::format("risk assessment rejected {} (score {:.1f})",
                                           candidate.id, assessment.risk_score);
        result.error.reasons = assessment.violations;
        result.error.assessment = assessment;
        return result;
    }

    // 3) records, all written in one ledger call
    StrategyRecord strategy;
    strategy.id = nextStrategyId(now);
    strategy.candidate = candidate;
    strategy.assessment = assessment;
    strategy.created_at_ms = now;
    strategy.trade_date = trade_date;

    std::vector<OrderRecord> orders;
    orders.reserve(candidate.legs.size());
    for (std::size_t i = 0; i < candidate.legs.size(); ++i) {
        OrderRecord order;
        order.id = fmt::format("{}-L{}", strategy.id, i);
        order.strategy_id = strategy.id;
        order.leg_index = i;
        order.leg = candidate.legs[i];
        order.symbol = candidate.symbol;
        order.status = OrderStatus::PENDING;

        const auto step = OrderLifecycleStateMachine::transition(order.status, OrderStatus::STAGED);
        order.status = step.status;
        order.created_at_ms = now;
        order.updated_at_ms = now;
        order.version = 1;
        order.audit_trail.push_back({now, toString(JournalEventType::ORDER_STAGED), actor,
                                     describeLeg(i, order.leg)});

        strategy.order_ids.push_back(order.id);
        orders.push_back(std::move(order));
    }

    const LedgerStatus inserted = safeInsert(strategy, orders);
    if (inserted != LedgerStatus::OK) {
        LOG_ERROR("[Lifecycle] staging {} failed: ledger {}", strategy.id, toString(inserted));
        result.error.code = fromLedgerStatus(inserted, StagingErrorCode::STAGING_CONFLICT);
        result.error.message = fmt::format("ledger refused strategy {}: {}", strategy.id, toString(inserted));
        result.error.reasons.push_back(result.error.message);
        return result;
    }

    nlohmann::json payload;
    payload["candidate_id"] = candidate.id;
    payload["symbol"] = candidate.symbol;
    payload["archetype"] = toString(candidate.archetype);
    payload["risk_score"] = assessment.risk_score;
    payload["order_ids"] = strategy.order_ids;
    publish(JournalEventType::STRATEGY_STAGED, strategy.id, "", actor,
            fmt::format("{} {}", candidate.symbol, toString(candidate.archetype)), now, payload);
    for (const auto& order : orders) {
        publish(JournalEventType::ORDER_STAGED, strategy.id, order.id, actor,
                order.audit_trail.front().note, now);
    }

    LOG_INFO("[Lifecycle] staged {} ({} {}, {} order(s), score {:.1f})",
             strategy.id, candidate.symbol, toString(candidate.archetype),
             orders.size(), assessment.risk_score);

    result.ok = true;
    result.strategy_id = strategy.id;
    return result;
}

// ===== Strategy-level transitions =====

OperationResult LifecycleController::approveStrategy(const std::string& strategy_id, const std::string& actor) {
    GroupTransition group;
    group.allowed_from = {OrderStatus::STAGED};
    group.target = OrderStatus::APPROVED;
    group.event = JournalEventType::ORDER_APPROVED;
    group.conflict_code = StagingErrorCode::PARTIAL_APPROVAL_CONFLICT;
    group.verb = "approve";
    group.note = "approved";
    group.actor = resolveActor(actor);
    return transitionStrategy(strategy_id, group);
}

OperationResult LifecycleController::rejectStrategy(const std::string& strategy_id, const std::string& reason,
                                                    const std::string& actor) {
    GroupTransition group;
    group.allowed_from = {OrderStatus::STAGED, OrderStatus::APPROVED};
    group.target = OrderStatus::REJECTED;
    group.event = JournalEventType::ORDER_REJECTED;
    group.conflict_code = StagingErrorCode::STAGING_CONFLICT;
    group.verb = "reject";
    group.note = reason.empty() ? "rejected" : reason;
    group.actor = resolveActor(actor);
    return transitionStrategy(strategy_id, group);
}

OperationResult LifecycleController::cancelStrategy(const std::string& strategy_id, const std::string& reason,
                                                    const std::string& actor) {
    GroupTransition group;
    group.allowed_from = {OrderStatus::STAGED, OrderStatus::APPROVED};
    group.target = OrderStatus::CANCELLED;
    group.event = JournalEventType::ORDER_CANCELLED;
    group.conflict_code = StagingErrorCode::STAGING_CONFLICT;
    group.verb = "cancel";
    group.note = reason.empty() ? "cancelled" : reason;
    group.actor = resolveActor(actor);
    return transitionStrategy(strategy_id, group);
}

OperationResult LifecycleController::transitionStrategy(const std::string& strategy_id,
                                                        const GroupTransition& group) {
    const auto strategy = safeGetStrategy(strategy_id);
    if (!strategy.found()) {
        return fail(fromLedgerStatus(strategy.status, group.conflict_code),
                    fmt::format("strategy {}: {}", strategy_id, toString(strategy.status)));
    }
    if (strategy.partition == LedgerPartition::HISTORY) {
        return fail(StagingErrorCode::INVALID_TRANSITION,
                    fmt::format("cannot {} strategy {}: already archived", group.verb, strategy_id));
    }

    // Read every order first; a stale or illegal state aborts before any write.
    std::vector<OrderRecord> orders;
    std::vector<std::string> blockers;
    for (const auto& order_id : strategy.record.order_ids) {
        auto lookup = safeGetOrder(order_id);
        if (!lookup.found()) {
            return fail(fromLedgerStatus(lookup.status, group.conflict_code),
                        fmt::format("order {}: {}", order_id, toString(lookup.status)));
        }
        const OrderStatus current = lookup.record.status;
        if (lookup.partition == LedgerPartition::HISTORY ||
            !contains(group.allowed_from, current) ||
            !OrderLifecycleStateMachine::canTransition(current, group.target)) {
            blockers.push_back(fmt::format("order {} is {}", order_id, toString(current)));
        }
        orders.push_back(std::move(lookup.record));
    }
    if (!blockers.empty()) {
        LOG_WARN("[Lifecycle] {} {} refused: {}", group.verb, strategy_id, blockers.front());
        return fail(StagingErrorCode::INVALID_TRANSITION,
                    fmt::format("cannot {} strategy {}", group.verb, strategy_id), blockers);
    }

    const long long now = utils::nowMs();
    std::vector<const OrderRecord*> applied;
    LedgerStatus failure = LedgerStatus::OK;
    std::string failed_order;

    for (const auto& order : orders) {
        StatusChange change;
        change.expected = order.status;
        change.next = group.target;
        change.expected_version = order.version;
        change.audit = {now, toString(group.event), group.actor, group.note};

        const LedgerStatus status = safeCompareAndSet(order.id, change);
        if (status != LedgerStatus::OK) {
            failure = status;
            failed_order = order.id;
            break;
        }
        applied.push_back(&order);
    }

    if (failure == LedgerStatus::OK) {
        for (const auto& order : orders) {
            publish(group.event, strategy_id, order.id, group.actor, group.note, now);
        }
        LOG_INFO("[Lifecycle] {} {}: {} order(s) -> {}", group.verb, strategy_id,
                 orders.size(), toString(group.target));
        if (OrderLifecycleStateMachine::isTerminal(group.target)) {
            archiveIfSettled(strategy_id);
        }
        return ok();
    }

    // Compensate in reverse. Each undo only succeeds against our own write.
    std::vector<std::string> reasons;
    reasons.push_back(fmt::format("order {} {}", failed_order, toString(failure)));
    for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
        const OrderRecord& order = **it;
        StatusChange undo;
        undo.expected = group.target;
        undo.next = order.status;
        undo.expected_version = order.version + 1;
        undo.audit = {utils::nowMs(), toString(JournalEventType::ORDER_ROLLED_BACK), group.actor,
                      fmt::format("{} rolled back after {} on {}", group.verb, toString(failure), failed_order)};

        const LedgerStatus undone = safeCompareAndSet(order.id, undo);
        if (undone != LedgerStatus::OK) {
            LOG_ERROR("[Lifecycle] rollback of {} to {} failed: {}", order.id, toString(order.status),
                      toString(undone));
            reasons.push_back(fmt::format("rollback of order {} failed: {}", order.id, toString(undone)));
        } else {
            publish(JournalEventType::ORDER_ROLLED_BACK, strategy_id, order.id, group.actor,
                    undo.audit.note, undo.audit.ts_ms);
        }
    }

    const StagingErrorCode code = fromLedgerStatus(failure, group.conflict_code);
    LOG_WARN("[Lifecycle] {} {} aborted ({}), {} order(s) rolled back",
             group.verb, strategy_id, toString(code), applied.size());
    return fail(code, fmt::format("{} of strategy {} aborted: order {} {}",
                                  group.verb, strategy_id, failed_order, toString(failure)),
                reasons);
}

// ===== Order-level transitions =====

OperationResult LifecycleController::rejectOrder(const std::string& order_id, const std::string& reason,
                                                 const std::string& actor) {
    return closeOrder(order_id, OrderStatus::REJECTED, JournalEventType::ORDER_REJECTED, "reject",
                      reason.empty() ? "rejected" : reason, resolveActor(actor));
}

OperationResult LifecycleController::cancelOrder(const std::string& order_id, const std::string& reason,
                                                 const std::string& actor) {
    return closeOrder(order_id, OrderStatus::CANCELLED, JournalEventType::ORDER_CANCELLED, "cancel",
                      reason.empty() ? "cancelled" : reason, resolveActor(actor));
}

OperationResult LifecycleController::closeOrder(const std::string& order_id, OrderStatus target,
                                                JournalEventType event, const std::string& verb,
                                                const std::string& note, const std::string& actor) {
    const auto lookup = safeGetOrder(order_id);
    if (!lookup.found()) {
        return fail(fromLedgerStatus(lookup.status, StagingErrorCode::STAGING_CONFLICT),
                    fmt::format("order {}: {}", order_id, toString(lookup.status)));
    }

    // Same source states as the strategy-wide operations: nothing already at the broker.
    const OrderRecord& order = lookup.record;
    if (lookup.partition == LedgerPartition::HISTORY ||
        (order.status != OrderStatus::STAGED && order.status != OrderStatus::APPROVED)) {
        return fail(StagingErrorCode::INVALID_TRANSITION,
                    fmt::format("cannot {} order {} in status {}", verb, order_id, toString(order.status)));
    }

    const long long now = utils::nowMs();
    StatusChange change;
    change.expected = order.status;
    change.next = target;
    change.expected_version = order.version;
    change.audit = {now, toString(event), actor, note};

    const LedgerStatus status = safeCompareAndSet(order_id, change);
    if (status != LedgerStatus::OK) {
        LOG_WARN("[Lifecycle] {} {} failed: {}", verb, order_id, toString(status));
        return fail(fromLedgerStatus(status, StagingErrorCode::STAGING_CONFLICT),
                    fmt::format("{} of order {} failed: {}", verb, order_id, toString(status)));
    }

    publish(event, order.strategy_id, order_id, actor, note, now);
    LOG_INFO("[Lifecycle] order {} -> {} ({})", order_id, toString(target), note);
    archiveIfSettled(order.strategy_id);
    return ok();
}

OperationResult LifecycleController::markSubmitted(const std::string& order_id, const std::string& broker_ref,
                                                   const std::string& actor) {
    const auto lookup = safeGetOrder(order_id);
    if (!lookup.found()) {
        return fail(fromLedgerStatus(lookup.status, StagingErrorCode::STAGING_CONFLICT),
                    fmt::format("order {}: {}", order_id, toString(lookup.status)));
    }

    const OrderRecord& order = lookup.record;
    const auto step = OrderLifecycleStateMachine::transition(order.status, OrderStatus::SUBMITTED);
    if (!step.allowed || lookup.partition == LedgerPartition::HISTORY) {
        return fail(StagingErrorCode::INVALID_TRANSITION,
                    fmt::format("cannot submit order {}: {}", order_id, step.reason));
    }
    if (broker_ref.empty()) {
        return fail(StagingErrorCode::INVALID_REQUEST,
                    fmt::format("cannot submit order {}: broker reference is empty", order_id));
    }

    const long long now = utils::nowMs();
    const std::string who = resolveActor(actor);
    StatusChange change;
    change.expected = order.status;
    change.next = OrderStatus::SUBMITTED;
    change.expected_version = order.version;
    change.broker_ref = broker_ref;
    change.audit = {now, toString(JournalEventType::ORDER_SUBMITTED), who, "broker ref " + broker_ref};

    const LedgerStatus status = safeCompareAndSet(order_id, change);
    if (status != LedgerStatus::OK) {
        LOG_WARN("[Lifecycle] submit {} failed: {}", order_id, toString(status));
        return fail(fromLedgerStatus(status, StagingErrorCode::STAGING_CONFLICT),
                    fmt::format("submit of order {} failed: {}", order_id, toString(status)));
    }

    publish(JournalEventType::ORDER_SUBMITTED, order.strategy_id, order_id, who, change.audit.note, now);
    LOG_INFO("[Lifecycle] order {} submitted ({})", order_id, broker_ref);
    return ok();
}

OperationResult LifecycleController::markFilled(const std::string& order_id, Price price, int quantity,
                                                const std::string& actor) {
    const auto lookup = safeGetOrder(order_id);
    if (!lookup.found()) {
        return fail(fromLedgerStatus(lookup.status, StagingErrorCode::STAGING_CONFLICT),
                    fmt::format("order {}: {}", order_id, toString(lookup.status)));
    }

    const OrderRecord& order = lookup.record;
    if (lookup.partition == LedgerPartition::HISTORY ||
        (order.status != OrderStatus::SUBMITTED && order.status != OrderStatus::PARTIALLY_FILLED)) {
        return fail(StagingErrorCode::INVALID_TRANSITION,
                    fmt::format("cannot fill order {} in status {}", order_id, toString(order.status)));
    }
    if (!std::isfinite(price) || price <= 0.0 || quantity <= 0) {
        return fail(StagingErrorCode::INVALID_REQUEST,
                    fmt::format("invalid fill for order {}: price {:.4f}, quantity {}", order_id, price, quantity));
    }

    const long long requested_total = static_cast<long long>(order.filled_quantity) + quantity;
    if (requested_total > order.leg.quantity) {
        return fail(StagingErrorCode::INVALID_REQUEST,
                    fmt::format("fill of {} would overfill order {} ({} of {} already filled)",
                                quantity, order_id, order.filled_quantity, order.leg.quantity));
    }
    const int total_quantity = static_cast<int>(requested_total);

    const double prior_notional = order.filled_price.value_or(0.0) * order.filled_quantity;
    const Price average_price = (prior_notional + price * quantity) / total_quantity;
    const OrderStatus target = OrderLifecycleStateMachine::fillTarget(total_quantity, order.leg.quantity);
    const auto step = OrderLifecycleStateMachine::transition(order.status, target);
    if (!step.allowed) {
        return fail(StagingErrorCode::INVALID_TRANSITION,
                    fmt::format("cannot fill order {}: {}", order_id, step.reason));
    }

    const long long now = utils::nowMs();
    const std::string who = resolveActor(actor);
    const JournalEventType event = target == OrderStatus::FILLED
        ? JournalEventType::ORDER_FILLED
        : JournalEventType::ORDER_PARTIALLY_FILLED;

    StatusChange change;
    change.expected = order.status;
    change.next = target;
    change.expected_version = order.version;
    change.filled_price = average_price;
    change.filled_quantity = total_quantity;
    change.audit = {now, toString(event), who,
                    fmt::format("{} @ {:.4f} ({} of {})", quantity, price, total_quantity, order.leg.quantity)};

    const LedgerStatus status = safeCompareAndSet(order_id, change);
    if (status != LedgerStatus::OK) {
        LOG_WARN("[Lifecycle] fill {} failed: {}", order_id, toString(status));
        return fail(fromLedgerStatus(status, StagingErrorCode::STAGING_CONFLICT),
                    fmt::format("fill of order {} failed: {}", order_id, toString(status)));
    }

    nlohmann::json payload;
    payload["price"] = price;
    payload["quantity"] = quantity;
    payload["filled_quantity"] = total_quantity;
    payload["average_price"] = average_price;
    publish(event, order.strategy_id, order_id, who, change.audit.note, now, payload);
    LOG_INFO("[Lifecycle] order {} {} - {} @ {:.4f} ({}/{})", order_id, toString(target),
             quantity, price, total_quantity, order.leg.quantity);

    if (target == OrderStatus::FILLED) {
        archiveIfSettled(order.strategy_id);
    }
    return ok();
}

Amount LifecycleController::recordTradeResult(Amount pnl, const std::string& trade_date) {
    const std::string date = trade_date.empty() ? currentTradeDate() : trade_date;
    const Amount total = daily_losses_->recordTradeResult(date, pnl);

    nlohmann::json payload;
    payload["trade_date"] = date;
    payload["pnl"] = pnl;
    payload["daily_loss"] = total;
    publish(JournalEventType::TRADE_RESULT_RECORDED, "", "", resolveActor(""),
            fmt::format("{} pnl {:.2f}", date, pnl), utils::nowMs(), payload);
    return total;
}

void LifecycleController::archiveIfSettled(const std::string& strategy_id) {
    const auto snapshot = getStrategy(strategy_id);
    if (!snapshot.found() || snapshot.partition == LedgerPartition::HISTORY) {
        return;
    }

    std::vector<OrderStatus> statuses;
    for (const auto& order : snapshot.record.orders) {
        statuses.push_back(order.status);
    }
    if (!OrderLifecycleStateMachine::allTerminal(statuses)) {
        return;
    }

    const LedgerStatus status = safeArchive(strategy_id);
    if (status == LedgerStatus::OK) {
        const std::string aggregate = toString(snapshot.record.aggregate_status);
        nlohmann::json payload;
        payload["aggregate_status"] = aggregate;
        publish(JournalEventType::STRATEGY_ARCHIVED, strategy_id, "", resolveActor(""),
                "aggregate " + aggregate, utils::nowMs(), payload);
        LOG_INFO("[Lifecycle] strategy {} archived ({})", strategy_id, aggregate);
    } else if (status != LedgerStatus::READ_ONLY) {
        // Status writes already landed; the strategy stays in the active partition.
        LOG_ERROR("[Lifecycle] archiving {} failed: {}", strategy_id, toString(status));
    }
}

// ===== Read-only projections =====

LedgerLookup<StrategySnapshot> LifecycleController::getStrategy(const std::string& strategy_id) const {
    LedgerLookup<StrategySnapshot> out;
    const auto strategy = safeGetStrategy(strategy_id);
    out.status = strategy.status;
    if (!strategy.found()) {
        return out;
    }

    out.partition = strategy.partition;
    out.record.record = strategy.record;
    out.record.partition = strategy.partition;

    std::vector<OrderStatus> statuses;
    for (const auto& order_id : strategy.record.order_ids) {
        auto order = safeGetOrder(order_id);
        if (!order.found()) {
            out.status = order.status;
            return out;
        }
        statuses.push_back(order.record.status);
        out.record.orders.push_back(std::move(order.record));
    }
    out.record.aggregate_status = OrderLifecycleStateMachine::aggregate(statuses);
    return out;
}

LedgerLookup<OrderRecord> LifecycleController::getOrder(const std::string& order_id) const {
    return safeGetOrder(order_id);
}

LedgerList<StrategySnapshot> LifecycleController::listStrategies(LedgerPartition partition) const {
    LedgerList<StrategySnapshot> out;
    const auto strategies = safeListStrategies(partition);
    out.status = strategies.status;
    if (strategies.status != LedgerStatus::OK) {
        return out;
    }

    for (const auto& strategy : strategies.records) {
        auto snapshot = getStrategy(strategy.id);
        if (snapshot.status == LedgerStatus::BACKEND_UNAVAILABLE) {
            out.status = snapshot.status;
            out.records.clear();
            return out;
        }
        // A strategy archived between the two reads is skipped.
        if (snapshot.found() && snapshot.partition == partition) {
            out.records.push_back(std::move(snapshot.record));
        }
    }
    return out;
}

LedgerList<OrderRecord> LifecycleController::listOrders(const OrderFilter& filter) const {
    return safeListOrders(filter);
}

LedgerList<OrderRecord> LifecycleController::getApprovedOrders() const {
    OrderFilter filter;
    filter.status = OrderStatus::APPROVED;
    filter.partition = LedgerPartition::ACTIVE;
    return safeListOrders(filter);
}

LedgerList<AuditRecord> LifecycleController::getAuditTrail(const std::string& strategy_id) const {
    LedgerList<AuditRecord> out;
    const auto snapshot = getStrategy(strategy_id);
    out.status = snapshot.status;
    if (!snapshot.found()) {
        return out;
    }

    for (const auto& order : snapshot.record.orders) {
        for (const auto& entry : order.audit_trail) {
            out.records.push_back({order.id, entry});
        }
    }
    std::stable_sort(out.records.begin(), out.records.end(),
                     [](const AuditRecord& a, const AuditRecord& b) { return a.entry.ts_ms < b.entry.ts_ms; });
    return out;
}

OrderSummary LifecycleController::getOrderSummary() const {
    OrderSummary summary;

    OrderFilter active;
    active.partition = LedgerPartition::ACTIVE;
    const auto orders = safeListOrders(active);

    OrderFilter archived;
    archived.partition = LedgerPartition::HISTORY;
    const auto history = safeListOrders(archived);

    const auto strategies = safeListStrategies(LedgerPartition::ACTIVE);

    for (LedgerStatus status : {orders.status, history.status, strategies.status}) {
        if (status != LedgerStatus::OK) {
            summary.status = status;
            return summary;
        }
    }

    summary.total_active = orders.records.size();
    summary.total_strategies = strategies.records.size();
    summary.history_count = history.records.size();
    for (const auto& order : orders.records) {
        summary.by_status[toString(order.status)]++;
    }
    return summary;
}

std::string LifecycleController::currentTradeDate() const {
    return utils::tradeDateFor(utils::nowMs(), settings_.trade_date_utc_offset_minutes);
}

// ===== Helpers =====

std::string LifecycleController::nextStrategyId(long long now_ms) {
    const unsigned long long seq = ++id_sequence_;
    return fmt::format("STRAT_{}_{:06d}", utils::formatFileStamp(now_ms), seq);
}

std::string LifecycleController::resolveActor(const std::string& actor) const {
    return actor.empty() ? settings_.default_actor : actor;
}

void LifecycleController::publish(JournalEventType type, const std::string& strategy_id,
                                  const std::string& order_id, const std::string& actor,
                                  const std::string& note, long long ts_ms, nlohmann::json payload) {
    Logger::getInstance().logAudit(strategy_id, order_id, toString(type), actor, note, ts_ms);
    if (!journal_) {
        return;
    }

    JournalEvent event;
    event.ts_ms = ts_ms;
    event.type = type;
    event.strategy_id = strategy_id;
    event.order_id = order_id;
    event.actor = actor;
    event.note = note;
    event.payload = std::move(payload);

    // The ledger's own audit trail is authoritative; a journal miss is reported, not fatal.
    try {
        if (!journal_->append(event)) {
            LOG_ERROR("[Lifecycle] audit journal append failed for {} {}", toString(type), strategy_id);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] audit journal error for {} {}: {}", toString(type), strategy_id, e.what());
    }
}

LedgerStatus LifecycleController::safeInsert(const StrategyRecord& strategy,
                                             const std::vector<OrderRecord>& orders) {
    try {
        return ledger_->insertStrategy(strategy, orders);
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] ledger insert {} threw: {}", strategy.id, e.what());
        return LedgerStatus::BACKEND_UNAVAILABLE;
    }
}

LedgerStatus LifecycleController::safeCompareAndSet(const std::string& order_id, const StatusChange& change) {
    try {
        return ledger_->compareAndSetStatus(order_id, change);
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] ledger compare-and-set {} threw: {}", order_id, e.what());
        return LedgerStatus::BACKEND_UNAVAILABLE;
    }
}

LedgerStatus LifecycleController::safeArchive(const std::string& strategy_id) {
    try {
        return ledger_->moveStrategyToHistory(strategy_id);
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] ledger archive {} threw: {}", strategy_id, e.what());
        return LedgerStatus::BACKEND_UNAVAILABLE;
    }
}

LedgerLookup<OrderRecord> LifecycleController::safeGetOrder(const std::string& order_id) const {
    try {
        return ledger_->getOrder(order_id);
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] ledger read of order {} threw: {}", order_id, e.what());
        LedgerLookup<OrderRecord> out;
        out.status = LedgerStatus::BACKEND_UNAVAILABLE;
        return out;
    }
}

LedgerLookup<StrategyRecord> LifecycleController::safeGetStrategy(const std::string& strategy_id) const {
    try {
        return ledger_->getStrategy(strategy_id);
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] ledger read of strategy {} threw: {}", strategy_id, e.what());
        LedgerLookup<StrategyRecord> out;
        out.status = LedgerStatus::BACKEND_UNAVAILABLE;
        return out;
    }
}

LedgerList<OrderRecord> LifecycleController::safeListOrders(const OrderFilter& filter) const {
    try {
        return ledger_->listOrders(filter);
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] ledger order listing threw: {}", e.what());
        LedgerList<OrderRecord> out;
        out.status = LedgerStatus::BACKEND_UNAVAILABLE;
        return out;
    }
}

LedgerList<StrategyRecord> LifecycleController::safeListStrategies(LedgerPartition partition) const {
    try {
        return ledger_->listStrategies(partition);
    } catch (const std::exception& e) {
        LOG_ERROR("[Lifecycle] ledger strategy listing threw: {}", e.what());
        LedgerList<StrategyRecord> out;
        out.status = LedgerStatus::BACKEND_UNAVAILABLE;
        return out;
    }
}

OperationResult LifecycleController::ok() {
    OperationResult result;
    result.ok = true;
    return result;
}

OperationResult LifecycleController::fail(StagingErrorCode code, std::string message,
                                          std::vector<std::string> reasons) {
    OperationResult result;
    result.error.code = code;
    result.error.message = std::move(message);
    result.error.reasons = std::move(reasons);
    if (result.error.reasons.empty()) {
        result.error.reasons.push_back(result.error.message);
    }
    return result;
}

StagingErrorCode LifecycleController::fromLedgerStatus(LedgerStatus status, StagingErrorCode conflict_code) {
    switch (status) {
        case LedgerStatus::OK: return StagingErrorCode::NONE;
        case LedgerStatus::NOT_FOUND: return StagingErrorCode::NOT_FOUND;
        case LedgerStatus::CONFLICT: return conflict_code;
        case LedgerStatus::ALREADY_EXISTS: return StagingErrorCode::STAGING_CONFLICT;
        case LedgerStatus::READ_ONLY: return StagingErrorCode::INVALID_TRANSITION;
        case LedgerStatus::NOT_TERMINAL: return StagingErrorCode::INVALID_TRANSITION;
        case LedgerStatus::BACKEND_UNAVAILABLE: return StagingErrorCode::BACKEND_UNAVAILABLE;
    }
    return StagingErrorCode::BACKEND_UNAVAILABLE;
}

} // namespace core
} // namespace tradegate
