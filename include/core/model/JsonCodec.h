#pragma once

#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "core/model/StagingTypes.h"
#include "risk/RiskAssessor.h"

// nlohmann adl_serializer hooks. Enums travel as the strings produced by
// toString(); decoding throws std::invalid_argument on an unknown side,
// instrument or status. An unknown archetype is decoded as a value outside
// the enumeration so the structural validator reports it. A candidate's legs
// and declared max risk, and a leg's strike and quantity, are required: a
// missing key throws nlohmann::json::out_of_range.

namespace tradegate {

void to_json(nlohmann::json& j, const Leg& leg);
void from_json(const nlohmann::json& j, Leg& leg);

void to_json(nlohmann::json& j, const StrategyCandidate& candidate);
void from_json(const nlohmann::json& j, StrategyCandidate& candidate);

void to_json(nlohmann::json& j, const PositionHolding& position);
void from_json(const nlohmann::json& j, PositionHolding& position);

void to_json(nlohmann::json& j, const PortfolioSnapshot& portfolio);
void from_json(const nlohmann::json& j, PortfolioSnapshot& portfolio);

namespace risk {
void to_json(nlohmann::json& j, const RiskAssessment& assessment);
void from_json(const nlohmann::json& j, RiskAssessment& assessment);
} // namespace risk

namespace core {
void to_json(nlohmann::json& j, const AuditEntry& entry);
void from_json(const nlohmann::json& j, AuditEntry& entry);

void to_json(nlohmann::json& j, const OrderRecord& order);
void from_json(const nlohmann::json& j, OrderRecord& order);

void to_json(nlohmann::json& j, const StrategyRecord& strategy);
void from_json(const nlohmann::json& j, StrategyRecord& strategy);

// Write-only: snapshots are projections and never read back.
void to_json(nlohmann::json& j, const StrategySnapshot& snapshot);

void to_json(nlohmann::json& j, const StagingError& error);
} // namespace core

} // namespace tradegate
