#include "risk/DailyLossTracker.h"
#include "common/Logger.h"

#include <cmath>

namespace tradegate {
namespace risk {

Amount DailyLossTracker::recordTradeResult(const std::string& trade_date, Amount pnl) {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& total = losses_[trade_date];

    if (!std::isfinite(pnl)) {
        LOG_WARN("[DailyLoss] ignoring non-finite pnl for {}", trade_date);
        return total;
    }
    if (pnl < 0.0) {
        total += -pnl;
        LOG_INFO("[DailyLoss] {} loss +{:.2f} (total {:.2f})", trade_date, -pnl, total);
    }
    return total;
}

Amount DailyLossTracker::lossFor(const std::string& trade_date) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = losses_.find(trade_date);
    return it == losses_.end() ? 0.0 : it->second;
}

std::map<std::string, Amount> DailyLossTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return losses_;
}

} // namespace risk
} // namespace tradegate
