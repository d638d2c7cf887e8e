#pragma once

namespace tradegate {
namespace risk {

// A non-positive or non-finite limit never means "unlimited": the matching
// check always fails and the score term contributes nothing.
struct RiskLimits {
    double max_position_size = 10000.0;
    double max_portfolio_exposure = 50000.0;
    double max_loss_per_trade = 1000.0;
    double max_loss_per_day = 5000.0;
    double contract_multiplier = 100.0;
};

} // namespace risk
} // namespace tradegate
