#pragma once

#include <filesystem>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/model/StagingTypes.h"

namespace tradegate {
namespace core {

// Persists staged strategies as reviewable JSON drafts:
//   <drafts_dir>/<yyyymmdd_HHMMSS>_<SYMBOL>_<archetype>_<id>.json
class StrategyDraftWriter {
public:
    explicit StrategyDraftWriter(std::filesystem::path drafts_dir);

    // Returns the written path, or nullopt when the file could not be written.
    std::optional<std::filesystem::path> write(
        const StrategySnapshot& snapshot,
        const nlohmann::json& meta = nlohmann::json::object()
    ) const;

    std::filesystem::path draftPathFor(const StrategyRecord& strategy) const;

    static std::string sanitizeFileComponent(const std::string& value);

private:
    std::filesystem::path drafts_dir_;
};

} // namespace core
} // namespace tradegate
