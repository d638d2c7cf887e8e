#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace tradegate {
namespace core {
namespace execution {

struct OrderLifecycleTransitionResult {
    bool allowed = false;
    OrderStatus status = OrderStatus::PENDING;
    bool terminal = false;
    std::string reason;
};

//   PENDING -> STAGED -> APPROVED -> SUBMITTED -> FILLED
//                     \-> REJECTED              \-> PARTIALLY_FILLED -> FILLED
//                     \-> CANCELLED (from STAGED/APPROVED)
class OrderLifecycleStateMachine {
public:
    static bool isTerminal(OrderStatus status);
    static bool canTransition(OrderStatus from, OrderStatus to);

    static OrderLifecycleTransitionResult transition(OrderStatus current, OrderStatus requested);

    // Status reached after a fill brings the cumulative quantity to filled_quantity.
    static OrderStatus fillTarget(int filled_quantity, int order_quantity);

    static AggregateStatus aggregate(const std::vector<OrderStatus>& statuses);
    static bool allTerminal(const std::vector<OrderStatus>& statuses);
};

} // namespace execution
} // namespace core
} // namespace tradegate
