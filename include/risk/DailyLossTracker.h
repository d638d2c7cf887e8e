#pragma once

#include <map>
#include <mutex>
#include <string>

#include "common/Types.h"

namespace tradegate {
namespace risk {

// Realized loss per trade date. Totals only ever grow; readers may see a
// slightly stale value but never a negative one or a dropped increment.
class DailyLossTracker {
public:
    DailyLossTracker() = default;

    // Records a realized P&L. Gains are ignored; a loss adds its magnitude.
    // Returns the date's running loss after the update.
    Amount recordTradeResult(const std::string& trade_date, Amount pnl);

    Amount lossFor(const std::string& trade_date) const;
    std::map<std::string, Amount> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Amount> losses_;
};

} // namespace risk
} // namespace tradegate
