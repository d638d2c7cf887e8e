#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace tradegate {
namespace validation {

// One human-readable message per violated rule, prefixed with the archetype.
using StructuralError = std::string;

// Checks a candidate's leg composition against its declared archetype.
// Pure and deterministic: the same candidate always yields the same errors.
class StructuralValidator {
public:
    static std::vector<StructuralError> validate(const StrategyCandidate& candidate);

private:
    static void validateLegFields(const StrategyCandidate& candidate, std::vector<StructuralError>& errors);
    static bool expectLegCount(const StrategyCandidate& candidate, std::size_t expected,
                               std::vector<StructuralError>& errors);

    static void validateIronCondor(const StrategyCandidate& candidate, std::vector<StructuralError>& errors);
    static void validateCreditSpread(const StrategyCandidate& candidate, OptionType instrument,
                                     std::vector<StructuralError>& errors);
    static void validateCoveredCall(const StrategyCandidate& candidate, std::vector<StructuralError>& errors);
    static void validateLongStraddle(const StrategyCandidate& candidate, std::vector<StructuralError>& errors);
};

} // namespace validation
} // namespace tradegate
