#include "validation/StructuralValidator.h"

#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace tradegate {
namespace validation {

namespace {
struct LegCounts {
    int calls = 0;
    int puts = 0;
    int buys = 0;
    int sells = 0;
};

LegCounts countLegs(const std::vector<Leg>& legs) {
    LegCounts counts;
    for (const auto& leg : legs) {
        (leg.instrument == OptionType::CALL ? counts.calls : counts.puts)++;
        (leg.side == OrderSide::BUY ? counts.buys : counts.sells)++;
    }
    return counts;
}

const char* plural(int n, const char* one, const char* many) {
    return n == 1 ? one : many;
}
} // namespace

std::vector<StructuralError> StructuralValidator::validate(const StrategyCandidate& candidate) {
    std::vector<StructuralError> errors;

    switch (candidate.archetype) {
        case Archetype::IRON_CONDOR:
            validateLegFields(candidate, errors);
            validateIronCondor(candidate, errors);
            return errors;
        case Archetype::PUT_CREDIT_SPREAD:
            validateLegFields(candidate, errors);
            validateCreditSpread(candidate, OptionType::PUT, errors);
            return errors;
        case Archetype::CALL_CREDIT_SPREAD:
            validateLegFields(candidate, errors);
            validateCreditSpread(candidate, OptionType::CALL, errors);
            return errors;
        case Archetype::COVERED_CALL:
            validateLegFields(candidate, errors);
            validateCoveredCall(candidate, errors);
            return errors;
        case Archetype::LONG_STRADDLE:
            validateLegFields(candidate, errors);
            validateLongStraddle(candidate, errors);
            return errors;
        case Archetype::CUSTOM:
            // No shape rules; risk assessment is the only gate beyond the leg fields.
            validateLegFields(candidate, errors);
            return errors;
    }

    return {"unsupported archetype"};
}

void StructuralValidator::validateLegFields(const StrategyCandidate& candidate,
                                            std::vector<StructuralError>& errors) {
    const std::string name = toString(candidate.archetype);
    for (std::size_t i = 0; i < candidate.legs.size(); ++i) {
        const auto& leg = candidate.legs[i];
        if (!std::isfinite(leg.strike) || leg.strike <= 0.0) {
            errors.push_back(fmt::format("{}: leg {} strike must be positive, found {:.2f}", name, i, leg.strike));
        }
        if (leg.quantity <= 0) {
            errors.push_back(fmt::format("{}: leg {} quantity must be positive, found {}", name, i, leg.quantity));
        }
    }
}

bool StructuralValidator::expectLegCount(const StrategyCandidate& candidate, std::size_t expected,
                                         std::vector<StructuralError>& errors) {
    if (candidate.legs.size() == expected) {
        return true;
    }
    // Shape rules below assume the right leg count, so stop here.
    errors.push_back(fmt::format("{}: expected {} {}, found {}",
                                 toString(candidate.archetype), expected,
                                 plural(static_cast<int>(expected), "leg", "legs"),
                                 candidate.legs.size()));
    return false;
}

void StructuralValidator::validateIronCondor(const StrategyCandidate& candidate,
                                             std::vector<StructuralError>& errors) {
    if (!expectLegCount(candidate, 4, errors)) {
        return;
    }

    const LegCounts counts = countLegs(candidate.legs);
    if (counts.calls != 2 || counts.puts != 2) {
        errors.push_back(fmt::format("iron_condor: expected 2 calls and 2 puts, found {} {} and {} {}",
                                     counts.calls, plural(counts.calls, "call", "calls"),
                                     counts.puts, plural(counts.puts, "put", "puts")));
        return;
    }

    for (OptionType group : {OptionType::PUT, OptionType::CALL}) {
        int buys = 0;
        int sells = 0;
        for (const auto& leg : candidate.legs) {
            if (leg.instrument != group) continue;
            (leg.side == OrderSide::BUY ? buys : sells)++;
        }
        if (buys != 1 || sells != 1) {
            errors.push_back(fmt::format("iron_condor: {} legs must be one buy and one sell, found {} {} and {} {}",
                                         toString(group), buys, plural(buys, "buy", "buys"),
                                         sells, plural(sells, "sell", "sells")));
        }
    }

    double max_put = 0.0;
    double min_call = 0.0;
    bool first_put = true;
    bool first_call = true;
    for (const auto& leg : candidate.legs) {
        if (leg.instrument == OptionType::PUT) {
            max_put = first_put ? leg.strike : std::max(max_put, leg.strike);
            first_put = false;
        } else {
            min_call = first_call ? leg.strike : std::min(min_call, leg.strike);
            first_call = false;
        }
    }
    if (max_put >= min_call) {
        errors.push_back(fmt::format("iron_condor: put strikes must be below call strikes "
                                     "(highest put {:.2f} >= lowest call {:.2f})",
                                     max_put, min_call));
    }
}

void StructuralValidator::validateCreditSpread(const StrategyCandidate& candidate, OptionType instrument,
                                               std::vector<StructuralError>& errors) {
    const std::string name = toString(candidate.archetype);
    if (!expectLegCount(candidate, 2, errors)) {
        return;
    }

    for (std::size_t i = 0; i < candidate.legs.size(); ++i) {
        if (candidate.legs[i].instrument != instrument) {
            errors.push_back(fmt::format("{}: leg {} instrument must be {}, found {}",
                                         name, i, toString(instrument),
                                         toString(candidate.legs[i].instrument)));
        }
    }

    const LegCounts counts = countLegs(candidate.legs);
    if (counts.buys != 1 || counts.sells != 1) {
        errors.push_back(fmt::format("{}: expected one buy and one sell, found {} {} and {} {}",
                                     name, counts.buys, plural(counts.buys, "buy", "buys"),
                                     counts.sells, plural(counts.sells, "sell", "sells")));
        return;
    }

    const Leg& sold = candidate.legs[0].side == OrderSide::SELL ? candidate.legs[0] : candidate.legs[1];
    const Leg& bought = candidate.legs[0].side == OrderSide::BUY ? candidate.legs[0] : candidate.legs[1];

    // The short strike sits nearer the money: above the long put, below the long call.
    if (instrument == OptionType::PUT && !(sold.strike > bought.strike)) {
        errors.push_back(fmt::format("{}: sold strike {:.2f} must be above bought strike {:.2f}",
                                     name, sold.strike, bought.strike));
    } else if (instrument == OptionType::CALL && !(sold.strike < bought.strike)) {
        errors.push_back(fmt::format("{}: sold strike {:.2f} must be below bought strike {:.2f}",
                                     name, sold.strike, bought.strike));
    }
}

void StructuralValidator::validateCoveredCall(const StrategyCandidate& candidate,
                                              std::vector<StructuralError>& errors) {
    if (!expectLegCount(candidate, 1, errors)) {
        return;
    }

    const Leg& leg = candidate.legs.front();
    if (leg.instrument != OptionType::CALL) {
        errors.push_back(fmt::format("covered_call: leg 0 instrument must be call, found {}",
                                     toString(leg.instrument)));
    }
    if (leg.side != OrderSide::SELL) {
        errors.push_back(fmt::format("covered_call: leg 0 side must be sell, found {}", toString(leg.side)));
    }
}

void StructuralValidator::validateLongStraddle(const StrategyCandidate& candidate,
                                               std::vector<StructuralError>& errors) {
    if (!expectLegCount(candidate, 2, errors)) {
        return;
    }

    const LegCounts counts = countLegs(candidate.legs);
    if (counts.calls != 1 || counts.puts != 1) {
        errors.push_back(fmt::format("long_straddle: expected one call and one put, found {} {} and {} {}",
                                     counts.calls, plural(counts.calls, "call", "calls"),
                                     counts.puts, plural(counts.puts, "put", "puts")));
    }
    if (counts.sells != 0) {
        errors.push_back(fmt::format("long_straddle: all legs must be buys, found {} {}",
                                     counts.sells, plural(counts.sells, "sell", "sells")));
    }
    if (candidate.legs[0].strike != candidate.legs[1].strike) {
        errors.push_back(fmt::format("long_straddle: strikes must match, found {:.2f} and {:.2f}",
                                     candidate.legs[0].strike, candidate.legs[1].strike));
    }
}

} // namespace validation
} // namespace tradegate
