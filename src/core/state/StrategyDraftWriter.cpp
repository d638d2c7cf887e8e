#include "core/state/StrategyDraftWriter.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

#include "common/Logger.h"
#include "common/TradeDate.h"
#include "core/model/JsonCodec.h"

namespace tradegate {
namespace core {

namespace {
constexpr std::size_t kMaxComponentLength = 80;
}

StrategyDraftWriter::StrategyDraftWriter(std::filesystem::path drafts_dir)
    : drafts_dir_(std::move(drafts_dir)) {}

std::string StrategyDraftWriter::sanitizeFileComponent(const std::string& value) {
    std::string out;
    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.') {
            out.push_back(c);
        }
        if (out.size() >= kMaxComponentLength) {
            break;
        }
    }
    return out.empty() ? "UNK" : out;
}

std::filesystem::path StrategyDraftWriter::draftPathFor(const StrategyRecord& strategy) const {
    std::string symbol = strategy.candidate.symbol;
    std::transform(symbol.begin(), symbol.end(), symbol.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    const std::string name = utils::formatFileStamp(strategy.created_at_ms) + "_" +
                             sanitizeFileComponent(symbol) + "_" +
                             sanitizeFileComponent(toString(strategy.candidate.archetype)) + "_" +
                             sanitizeFileComponent(strategy.id) + ".json";
    return drafts_dir_ / name;
}

std::optional<std::filesystem::path> StrategyDraftWriter::write(
    const StrategySnapshot& snapshot,
    const nlohmann::json& meta
) const {
    nlohmann::json raw;
    raw["version"] = 1;
    raw["created_utc"] = utils::formatUtcIso(utils::nowMs());
    raw["type"] = "trade_draft";
    raw["trade"] = snapshot;
    raw["meta"] = meta.is_object() ? meta : nlohmann::json::object();

    std::error_code ec;
    std::filesystem::create_directories(drafts_dir_, ec);
    if (ec) {
        LOG_ERROR("[DraftWriter] cannot create {}: {}", drafts_dir_.string(), ec.message());
        return std::nullopt;
    }

    const auto path = draftPathFor(snapshot.record);
    auto tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            LOG_ERROR("[DraftWriter] cannot open {}", tmp_path.string());
            return std::nullopt;
        }
        out << raw.dump(2);
        if (!out) {
            LOG_ERROR("[DraftWriter] write to {} failed", tmp_path.string());
            return std::nullopt;
        }
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        // Windows can fail rename over existing file; fallback to copy+remove.
        ec.clear();
        std::filesystem::copy_file(tmp_path, path, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            LOG_ERROR("[DraftWriter] cannot move draft into {}: {}", path.string(), ec.message());
            return std::nullopt;
        }
        std::filesystem::remove(tmp_path, ec);
    }

    LOG_INFO("[DraftWriter] draft written: {}", path.string());
    return path;
}

} // namespace core
} // namespace tradegate
