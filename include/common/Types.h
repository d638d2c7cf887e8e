#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

using Price = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OptionType { CALL, PUT };

// Fixed-shape strategies. The structural validator matches these exhaustively.
enum class Archetype {
    IRON_CONDOR,
    PUT_CREDIT_SPREAD,
    CALL_CREDIT_SPREAD,
    COVERED_CALL,
    LONG_STRADDLE,
    CUSTOM
};

enum class OrderStatus {
    PENDING,
    STAGED,
    APPROVED,
    SUBMITTED,
    PARTIALLY_FILLED,
    FILLED,
    CANCELLED,
    REJECTED
};

// Derived from the constituent order statuses, never stored.
// CLOSED: every order terminal, at least one filled, not all of them.
enum class AggregateStatus { IN_PROGRESS, FILLED, REJECTED, CANCELLED, CLOSED };

struct Leg {
    OrderSide side = OrderSide::BUY;
    OptionType instrument = OptionType::CALL;
    Price strike = 0.0;
    int quantity = 0;
};

struct StrategyCandidate {
    std::string id;
    std::string symbol;
    Archetype archetype = Archetype::CUSTOM;
    std::vector<Leg> legs;
    Amount declared_max_risk = 0.0;
    std::optional<Amount> declared_max_profit;
    std::map<std::string, std::string> metadata;
};

struct PositionHolding {
    std::string symbol;
    double quantity = 0.0;
    Price average_cost = 0.0;
};

// Point-in-time portfolio read. Never mutated by the staging core.
struct PortfolioSnapshot {
    Amount equity = 0.0;
    Amount cash = 0.0;
    std::vector<PositionHolding> positions;
    std::map<std::string, Amount> daily_realized_loss;  // trade date (YYYY-MM-DD) -> loss

    Amount dailyRealizedLoss(const std::string& trade_date) const {
        auto it = daily_realized_loss.find(trade_date);
        return it == daily_realized_loss.end() ? 0.0 : it->second;
    }
};

std::string toString(OrderSide side);
std::string toString(OptionType type);
std::string toString(Archetype archetype);
std::string toString(OrderStatus status);
std::string toString(AggregateStatus status);

std::optional<OrderSide> orderSideFromString(const std::string& value);
std::optional<OptionType> optionTypeFromString(const std::string& value);
std::optional<Archetype> archetypeFromString(const std::string& value);
std::optional<OrderStatus> orderStatusFromString(const std::string& value);

} // namespace tradegate
