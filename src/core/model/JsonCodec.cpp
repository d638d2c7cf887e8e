#include "core/model/JsonCodec.h"

#include <stdexcept>

namespace tradegate {

namespace {
// Value outside the enumeration; validation reports "unsupported archetype".
constexpr Archetype kUnsupportedArchetype = static_cast<Archetype>(-1);

OrderSide decodeSide(const std::string& value) {
    auto side = orderSideFromString(value);
    if (!side) {
        throw std::invalid_argument("unknown order side: " + value);
    }
    return *side;
}

OptionType decodeInstrument(const std::string& value) {
    auto instrument = optionTypeFromString(value);
    if (!instrument) {
        throw std::invalid_argument("unknown instrument: " + value);
    }
    return *instrument;
}

OrderStatus decodeStatus(const std::string& value) {
    auto status = orderStatusFromString(value);
    if (!status) {
        throw std::invalid_argument("unknown order status: " + value);
    }
    return *status;
}

std::string metadataValue(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}
} // namespace

void to_json(nlohmann::json& j, const Leg& leg) {
    j = nlohmann::json{
        {"side", toString(leg.side)},
        {"instrument", toString(leg.instrument)},
        {"strike", leg.strike},
        {"quantity", leg.quantity}
    };
}

void from_json(const nlohmann::json& j, Leg& leg) {
    leg.side = decodeSide(j.at("side").get<std::string>());
    leg.instrument = decodeInstrument(j.at("instrument").get<std::string>());
    leg.strike = j.at("strike").get<Price>();
    leg.quantity = j.at("quantity").get<int>();
}

void to_json(nlohmann::json& j, const StrategyCandidate& candidate) {
    j = nlohmann::json{
        {"id", candidate.id},
        {"symbol", candidate.symbol},
        {"archetype", toString(candidate.archetype)},
        {"legs", candidate.legs},
        {"declared_max_risk", candidate.declared_max_risk},
        {"metadata", candidate.metadata}
    };
    if (candidate.declared_max_profit) {
        j["declared_max_profit"] = *candidate.declared_max_profit;
    } else {
        j["declared_max_profit"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, StrategyCandidate& candidate) {
    candidate.id = j.value("id", std::string());
    candidate.symbol = j.value("symbol", std::string());
    candidate.archetype = archetypeFromString(j.value("archetype", std::string()))
                              .value_or(kUnsupportedArchetype);
    candidate.legs = j.at("legs").get<std::vector<Leg>>();
    candidate.declared_max_risk = j.at("declared_max_risk").get<Amount>();

    candidate.declared_max_profit.reset();
    auto profit = j.find("declared_max_profit");
    if (profit != j.end() && profit->is_number()) {
        candidate.declared_max_profit = profit->get<Amount>();
    }

    candidate.metadata.clear();
    auto metadata = j.find("metadata");
    if (metadata != j.end() && metadata->is_object()) {
        for (auto it = metadata->begin(); it != metadata->end(); ++it) {
            candidate.metadata[it.key()] = metadataValue(it.value());
        }
    }
}

void to_json(nlohmann::json& j, const PositionHolding& position) {
    j = nlohmann::json{
        {"symbol", position.symbol},
        {"quantity", position.quantity},
        {"average_cost", position.average_cost}
    };
}

void from_json(const nlohmann::json& j, PositionHolding& position) {
    position.symbol = j.value("symbol", std::string());
    position.quantity = j.value("quantity", 0.0);
    position.average_cost = j.value("average_cost", 0.0);
}

void to_json(nlohmann::json& j, const PortfolioSnapshot& portfolio) {
    j = nlohmann::json{
        {"equity", portfolio.equity},
        {"cash", portfolio.cash},
        {"positions", portfolio.positions},
        {"daily_realized_loss", portfolio.daily_realized_loss}
    };
}

void from_json(const nlohmann::json& j, PortfolioSnapshot& portfolio) {
    portfolio.equity = j.value("equity", 0.0);
    portfolio.cash = j.value("cash", 0.0);
    portfolio.positions = j.value("positions", std::vector<PositionHolding>());
    portfolio.daily_realized_loss = j.value("daily_realized_loss", std::map<std::string, Amount>());
}

namespace risk {

void to_json(nlohmann::json& j, const RiskAssessment& assessment) {
    j = nlohmann::json{
        {"approved", assessment.approved},
        {"risk_score", assessment.risk_score},
        {"violations", assessment.violations},
        {"warnings", assessment.warnings},
        {"max_loss", assessment.max_loss},
        {"position_exposure", assessment.position_exposure},
        {"portfolio_exposure", assessment.portfolio_exposure},
        {"required_margin", assessment.required_margin},
        {"margin_sufficient", assessment.margin_sufficient}
    };
}

void from_json(const nlohmann::json& j, RiskAssessment& assessment) {
    assessment.approved = j.value("approved", false);
    assessment.risk_score = j.value("risk_score", 0.0);
    assessment.violations = j.value("violations", std::vector<std::string>());
    assessment.warnings = j.value("warnings", std::vector<std::string>());
    assessment.max_loss = j.value("max_loss", 0.0);
    assessment.position_exposure = j.value("position_exposure", 0.0);
    assessment.portfolio_exposure = j.value("portfolio_exposure", 0.0);
    assessment.required_margin = j.value("required_margin", 0.0);
    assessment.margin_sufficient = j.value("margin_sufficient", true);
}

} // namespace risk

namespace core {

void to_json(nlohmann::json& j, const AuditEntry& entry) {
    j = nlohmann::json{
        {"ts_ms", entry.ts_ms},
        {"event", entry.event},
        {"actor", entry.actor},
        {"note", entry.note}
    };
}

void from_json(const nlohmann::json& j, AuditEntry& entry) {
    entry.ts_ms = j.value("ts_ms", 0LL);
    entry.event = j.value("event", std::string());
    entry.actor = j.value("actor", std::string());
    entry.note = j.value("note", std::string());
}

void to_json(nlohmann::json& j, const OrderRecord& order) {
    j = nlohmann::json{
        {"id", order.id},
        {"strategy_id", order.strategy_id},
        {"leg_index", order.leg_index},
        {"leg", order.leg},
        {"symbol", order.symbol},
        {"status", toString(order.status)},
        {"created_at_ms", order.created_at_ms},
        {"updated_at_ms", order.updated_at_ms},
        {"filled_quantity", order.filled_quantity},
        {"broker_ref", order.broker_ref},
        {"version", order.version},
        {"audit_trail", order.audit_trail}
    };
    if (order.filled_price) {
        j["filled_price"] = *order.filled_price;
    } else {
        j["filled_price"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, OrderRecord& order) {
    order.id = j.value("id", std::string());
    order.strategy_id = j.value("strategy_id", std::string());
    order.leg_index = j.value("leg_index", static_cast<std::size_t>(0));
    order.leg = j.at("leg").get<Leg>();
    order.symbol = j.value("symbol", std::string());
    order.status = decodeStatus(j.value("status", std::string("PENDING")));
    order.created_at_ms = j.value("created_at_ms", 0LL);
    order.updated_at_ms = j.value("updated_at_ms", 0LL);
    order.filled_quantity = j.value("filled_quantity", 0);
    order.broker_ref = j.value("broker_ref", std::string());
    order.version = j.value("version", static_cast<std::uint64_t>(0));
    order.audit_trail = j.value("audit_trail", std::vector<AuditEntry>());

    order.filled_price.reset();
    auto price = j.find("filled_price");
    if (price != j.end() && price->is_number()) {
        order.filled_price = price->get<Price>();
    }
}

void to_json(nlohmann::json& j, const StrategyRecord& strategy) {
    j = nlohmann::json{
        {"id", strategy.id},
        {"candidate", strategy.candidate},
        {"assessment", strategy.assessment},
        {"order_ids", strategy.order_ids},
        {"created_at_ms", strategy.created_at_ms},
        {"trade_date", strategy.trade_date}
    };
}

void from_json(const nlohmann::json& j, StrategyRecord& strategy) {
    strategy.id = j.value("id", std::string());
    strategy.candidate = j.at("candidate").get<StrategyCandidate>();
    strategy.assessment = j.value("assessment", risk::RiskAssessment());
    strategy.order_ids = j.value("order_ids", std::vector<std::string>());
    strategy.created_at_ms = j.value("created_at_ms", 0LL);
    strategy.trade_date = j.value("trade_date", std::string());
}

void to_json(nlohmann::json& j, const StrategySnapshot& snapshot) {
    j = nlohmann::json{
        {"strategy", snapshot.record},
        {"orders", snapshot.orders},
        {"aggregate_status", toString(snapshot.aggregate_status)},
        {"partition", toString(snapshot.partition)}
    };
}

void to_json(nlohmann::json& j, const StagingError& error) {
    j = nlohmann::json{
        {"code", toString(error.code)},
        {"message", error.message},
        {"reasons", error.reasons}
    };
    if (error.assessment) {
        j["assessment"] = *error.assessment;
    }
}

} // namespace core

} // namespace tradegate
