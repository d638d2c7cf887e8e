#include "risk/RiskAssessor.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace tradegate {
namespace risk {

namespace {
bool isEnabled(double limit) {
    return std::isfinite(limit) && limit > 0.0;
}

// Weighted ratio capped to [0, weight]; a disabled limit contributes nothing.
double scoreTerm(double weight, double value, double limit) {
    if (!isEnabled(limit) || !std::isfinite(value)) {
        return 0.0;
    }
    return std::clamp(weight * value / limit, 0.0, weight);
}

bool hasUsablePositionData(const PositionHolding& position) {
    return std::isfinite(position.quantity) && std::isfinite(position.average_cost) &&
           position.average_cost >= 0.0;
}

void checkLimit(const char* rule, const char* what, const char* limit_name,
                double value, double limit, std::vector<std::string>& violations) {
    if (!isEnabled(limit)) {
        violations.push_back(fmt::format("{}: {} is not a positive limit ({:.2f}), check fails closed",
                                         rule, limit_name, limit));
        return;
    }
    if (!std::isfinite(value)) {
        violations.push_back(fmt::format("{}: {} is not a finite amount, check fails closed", rule, what));
        return;
    }
    if (value > limit) {
        violations.push_back(fmt::format("{}: {} {:.2f} exceeds {} {:.2f}",
                                         rule, what, value, limit_name, limit));
    }
}
} // namespace

RiskAssessor::RiskAssessor(const RiskLimits& limits)
    : limits_(limits) {}

RiskAssessment RiskAssessor::assess(
    const StrategyCandidate& candidate,
    const PortfolioSnapshot& portfolio,
    Amount daily_loss_so_far
) const {
    RiskAssessment assessment;
    const double max_risk = candidate.declared_max_risk;
    const double prior_loss = std::isfinite(daily_loss_so_far) ? std::max(0.0, daily_loss_so_far) : 0.0;

    if (!std::isfinite(max_risk) || max_risk < 0.0) {
        assessment.violations.push_back(
            fmt::format("declared max risk must be a non-negative amount, found {:.2f}", max_risk));
    }
    if (!isEnabled(limits_.contract_multiplier)) {
        assessment.violations.push_back(
            fmt::format("configuration: contract_multiplier must be positive, found {:.2f}",
                        limits_.contract_multiplier));
    }

    for (const auto& position : portfolio.positions) {
        if (!hasUsablePositionData(position)) {
            assessment.violations.push_back(
                fmt::format("portfolio-exposure limit: invalid position data for {}", position.symbol));
        }
    }

    assessment.max_loss = max_risk;
    assessment.position_exposure = max_risk;
    assessment.portfolio_exposure = calculateHeldExposure(portfolio) + assessment.position_exposure;
    const double projected_daily_loss = prior_loss + assessment.position_exposure;

    checkLimit("position-size limit", "position exposure", "max_position_size",
               assessment.position_exposure, limits_.max_position_size, assessment.violations);
    checkLimit("per-trade limit", "max loss", "max_loss_per_trade",
               assessment.max_loss, limits_.max_loss_per_trade, assessment.violations);
    checkLimit("portfolio-exposure limit", "portfolio exposure", "max_portfolio_exposure",
               assessment.portfolio_exposure, limits_.max_portfolio_exposure, assessment.violations);
    checkLimit("daily-loss limit", "potential daily loss", "max_loss_per_day",
               projected_daily_loss, limits_.max_loss_per_day, assessment.violations);

    if (candidate.archetype == Archetype::COVERED_CALL) {
        checkCoveredCallShares(candidate, portfolio, assessment.violations);
    }

    assessment.risk_score = calculateRiskScore(
        assessment.position_exposure, assessment.portfolio_exposure, projected_daily_loss);

    if (assessment.risk_score > kHighRiskScore) {
        assessment.warnings.push_back("High risk score - proceed with caution");
    } else if (assessment.risk_score > kModerateRiskScore) {
        assessment.warnings.push_back("Moderate risk score");
    }

    const MarginCheck margin = checkMarginRequirements(candidate, portfolio);
    assessment.required_margin = margin.required;
    assessment.margin_sufficient = margin.sufficient;

    assessment.approved = assessment.violations.empty();

    if (assessment.approved) {
        LOG_INFO("[Risk] {} {} approved - score {:.1f}, exposure {:.2f}/{:.2f}",
                 candidate.id, candidate.symbol, assessment.risk_score,
                 assessment.position_exposure, assessment.portfolio_exposure);
    } else {
        LOG_WARN("[Risk] {} {} rejected - score {:.1f}, {} violation(s): {}",
                 candidate.id, candidate.symbol, assessment.risk_score,
                 assessment.violations.size(), assessment.violations.front());
    }

    return assessment;
}

MarginCheck RiskAssessor::checkMarginRequirements(
    const StrategyCandidate& candidate,
    const PortfolioSnapshot& portfolio
) const {
    MarginCheck check;
    check.required = candidate.declared_max_risk;
    check.available = portfolio.cash;
    check.sufficient = std::isfinite(check.required) && check.available >= check.required;
    return check;
}

Amount RiskAssessor::calculateHeldExposure(const PortfolioSnapshot& portfolio) const {
    const double multiplier = isEnabled(limits_.contract_multiplier) ? limits_.contract_multiplier : 0.0;
    double exposure = 0.0;
    for (const auto& position : portfolio.positions) {
        if (!hasUsablePositionData(position)) {
            continue;
        }
        exposure += std::fabs(position.quantity) * position.average_cost * multiplier;
    }
    return exposure;
}

double RiskAssessor::calculateRiskScore(Amount position_exposure, Amount portfolio_exposure,
                                        Amount projected_daily_loss) const {
    double score = 0.0;
    score += scoreTerm(kPositionWeight, position_exposure, limits_.max_position_size);
    score += scoreTerm(kPortfolioWeight, portfolio_exposure, limits_.max_portfolio_exposure);
    score += scoreTerm(kDailyLossWeight, projected_daily_loss, limits_.max_loss_per_day);
    return std::clamp(score, 0.0, 100.0);
}

void RiskAssessor::checkCoveredCallShares(const StrategyCandidate& candidate,
                                          const PortfolioSnapshot& portfolio,
                                          std::vector<std::string>& violations) const {
    double contracts = 0.0;
    for (const auto& leg : candidate.legs) {
        if (leg.instrument == OptionType::CALL && leg.side == OrderSide::SELL) {
            contracts += std::max(0, leg.quantity);
        }
    }
    const double multiplier = isEnabled(limits_.contract_multiplier) ? limits_.contract_multiplier : 0.0;
    const double shares_required = contracts * multiplier;

    double shares_owned = 0.0;
    for (const auto& position : portfolio.positions) {
        if (position.symbol == candidate.symbol && position.quantity > 0.0) {
            shares_owned += position.quantity;
        }
    }

    if (shares_owned < shares_required) {
        violations.push_back(fmt::format("covered_call: requires {:.0f} shares of {}, owned {:.0f}",
                                         shares_required, candidate.symbol, shares_owned));
    }
}

} // namespace risk
} // namespace tradegate
