#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace tradegate {

namespace {
std::string normalize(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}
} // namespace

std::string toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY: return "buy";
        case OrderSide::SELL: return "sell";
    }
    return "unknown";
}

std::string toString(OptionType type) {
    switch (type) {
        case OptionType::CALL: return "call";
        case OptionType::PUT: return "put";
    }
    return "unknown";
}

std::string toString(Archetype archetype) {
    switch (archetype) {
        case Archetype::IRON_CONDOR: return "iron_condor";
        case Archetype::PUT_CREDIT_SPREAD: return "put_credit_spread";
        case Archetype::CALL_CREDIT_SPREAD: return "call_credit_spread";
        case Archetype::COVERED_CALL: return "covered_call";
        case Archetype::LONG_STRADDLE: return "long_straddle";
        case Archetype::CUSTOM: return "custom";
    }
    return "unsupported";
}

std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::STAGED: return "STAGED";
        case OrderStatus::APPROVED: return "APPROVED";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

std::string toString(AggregateStatus status) {
    switch (status) {
        case AggregateStatus::IN_PROGRESS: return "IN_PROGRESS";
        case AggregateStatus::FILLED: return "FILLED";
        case AggregateStatus::REJECTED: return "REJECTED";
        case AggregateStatus::CANCELLED: return "CANCELLED";
        case AggregateStatus::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

std::optional<OrderSide> orderSideFromString(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "buy" || v == "buy_to_open" || v == "long") return OrderSide::BUY;
    if (v == "sell" || v == "sell_to_open" || v == "short") return OrderSide::SELL;
    return std::nullopt;
}

std::optional<OptionType> optionTypeFromString(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "call" || v == "c") return OptionType::CALL;
    if (v == "put" || v == "p") return OptionType::PUT;
    return std::nullopt;
}

std::optional<Archetype> archetypeFromString(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "iron_condor") return Archetype::IRON_CONDOR;
    if (v == "put_credit_spread") return Archetype::PUT_CREDIT_SPREAD;
    if (v == "call_credit_spread") return Archetype::CALL_CREDIT_SPREAD;
    if (v == "covered_call") return Archetype::COVERED_CALL;
    if (v == "long_straddle") return Archetype::LONG_STRADDLE;
    if (v == "custom") return Archetype::CUSTOM;
    return std::nullopt;
}

std::optional<OrderStatus> orderStatusFromString(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "pending") return OrderStatus::PENDING;
    if (v == "staged") return OrderStatus::STAGED;
    if (v == "approved") return OrderStatus::APPROVED;
    if (v == "submitted") return OrderStatus::SUBMITTED;
    if (v == "partially_filled") return OrderStatus::PARTIALLY_FILLED;
    if (v == "filled") return OrderStatus::FILLED;
    if (v == "cancelled" || v == "canceled") return OrderStatus::CANCELLED;
    if (v == "rejected") return OrderStatus::REJECTED;
    return std::nullopt;
}

} // namespace tradegate
