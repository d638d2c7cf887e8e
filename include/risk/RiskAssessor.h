#pragma once

#include <string>
#include <vector>

#include "common/Types.h"
#include "risk/RiskLimits.h"

namespace tradegate {
namespace risk {

struct RiskAssessment {
    bool approved = false;
    double risk_score = 0.0;            // [0, 100]
    std::vector<std::string> violations; // non-empty => approved == false
    std::vector<std::string> warnings;
    Amount max_loss = 0.0;
    Amount position_exposure = 0.0;
    Amount portfolio_exposure = 0.0;

    // Informational only, never a violation.
    Amount required_margin = 0.0;
    bool margin_sufficient = true;
};

struct MarginCheck {
    bool sufficient = false;
    Amount required = 0.0;
    Amount available = 0.0;
};

// Multi-factor pre-trade gate. Stateless apart from the limits it was built
// with; safe to call repeatedly and from several threads.
class RiskAssessor {
public:
    static constexpr double kPositionWeight = 40.0;
    static constexpr double kPortfolioWeight = 30.0;
    static constexpr double kDailyLossWeight = 30.0;
    static constexpr double kHighRiskScore = 75.0;
    static constexpr double kModerateRiskScore = 50.0;

    explicit RiskAssessor(const RiskLimits& limits);

    RiskAssessment assess(
        const StrategyCandidate& candidate,
        const PortfolioSnapshot& portfolio,
        Amount daily_loss_so_far
    ) const;

    // Required margin is the declared max risk; available margin is cash.
    MarginCheck checkMarginRequirements(
        const StrategyCandidate& candidate,
        const PortfolioSnapshot& portfolio
    ) const;

    // Sum of |quantity| * average cost * contract multiplier over all holdings.
    // Holdings with a non-finite quantity or a negative or non-finite cost are
    // left out here; assess() reports them as violations.
    Amount calculateHeldExposure(const PortfolioSnapshot& portfolio) const;

    const RiskLimits& limits() const { return limits_; }

private:
    double calculateRiskScore(Amount position_exposure, Amount portfolio_exposure,
                              Amount projected_daily_loss) const;
    void checkCoveredCallShares(const StrategyCandidate& candidate, const PortfolioSnapshot& portfolio,
                                std::vector<std::string>& violations) const;

    RiskLimits limits_;
};

} // namespace risk
} // namespace tradegate
