#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>

namespace tradegate {
namespace core {
namespace execution {

bool OrderLifecycleStateMachine::isTerminal(OrderStatus status) {
    return status == OrderStatus::FILLED ||
           status == OrderStatus::CANCELLED ||
           status == OrderStatus::REJECTED;
}

bool OrderLifecycleStateMachine::canTransition(OrderStatus from, OrderStatus to) {
    switch (from) {
        case OrderStatus::PENDING:
            return to == OrderStatus::STAGED;
        case OrderStatus::STAGED:
            return to == OrderStatus::APPROVED ||
                   to == OrderStatus::REJECTED ||
                   to == OrderStatus::CANCELLED;
        case OrderStatus::APPROVED:
            return to == OrderStatus::SUBMITTED ||
                   to == OrderStatus::REJECTED ||
                   to == OrderStatus::CANCELLED;
        case OrderStatus::SUBMITTED:
            return to == OrderStatus::PARTIALLY_FILLED || to == OrderStatus::FILLED;
        case OrderStatus::PARTIALLY_FILLED:
            return to == OrderStatus::PARTIALLY_FILLED || to == OrderStatus::FILLED;
        case OrderStatus::FILLED:
        case OrderStatus::CANCELLED:
        case OrderStatus::REJECTED:
            return false;
    }
    return false;
}

OrderLifecycleTransitionResult OrderLifecycleStateMachine::transition(
    OrderStatus current,
    OrderStatus requested
) {
    OrderLifecycleTransitionResult result;
    result.status = current;
    result.terminal = isTerminal(current);

    if (result.terminal) {
        result.reason = "order is terminal (" + toString(current) + ")";
        return result;
    }
    if (!canTransition(current, requested)) {
        result.reason = toString(current) + " -> " + toString(requested) + " is not a legal transition";
        return result;
    }

    result.allowed = true;
    result.status = requested;
    result.terminal = isTerminal(requested);
    return result;
}

OrderStatus OrderLifecycleStateMachine::fillTarget(int filled_quantity, int order_quantity) {
    if (filled_quantity >= order_quantity) {
        return OrderStatus::FILLED;
    }
    return OrderStatus::PARTIALLY_FILLED;
}

AggregateStatus OrderLifecycleStateMachine::aggregate(const std::vector<OrderStatus>& statuses) {
    if (statuses.empty()) {
        return AggregateStatus::IN_PROGRESS;
    }

    auto any = [&](OrderStatus s) {
        return std::find(statuses.begin(), statuses.end(), s) != statuses.end();
    };
    const bool all_filled = std::all_of(statuses.begin(), statuses.end(),
                                        [](OrderStatus s) { return s == OrderStatus::FILLED; });
    const bool progressed = any(OrderStatus::FILLED) ||
                            any(OrderStatus::SUBMITTED) ||
                            any(OrderStatus::PARTIALLY_FILLED);

    if (all_filled) {
        return AggregateStatus::FILLED;
    }
    if (any(OrderStatus::REJECTED) && !progressed) {
        return AggregateStatus::REJECTED;
    }
    if (any(OrderStatus::CANCELLED) && !progressed) {
        return AggregateStatus::CANCELLED;
    }
    if (allTerminal(statuses)) {
        return AggregateStatus::CLOSED;
    }
    return AggregateStatus::IN_PROGRESS;
}

bool OrderLifecycleStateMachine::allTerminal(const std::vector<OrderStatus>& statuses) {
    return std::all_of(statuses.begin(), statuses.end(), [](OrderStatus s) { return isTerminal(s); });
}

} // namespace execution
} // namespace core
} // namespace tradegate
