#include "common/Config.h"
#include "common/Logger.h"
#include "core/model/JsonCodec.h"
#include "core/orchestration/LifecycleController.h"
#include "core/state/AuditJournalJsonl.h"
#include "core/state/InMemoryStagingLedger.h"
#include "core/state/StrategyDraftWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace tradegate;

namespace {
constexpr int kExitStaged = 0;
constexpr int kExitError = 1;
constexpr int kExitRejected = 2;

nlohmann::json readJsonFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }
    return nlohmann::json::parse(in);
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: TradeGateStage <config.json> <candidate.json> <portfolio.json>\n";
        return kExitError;
    }

    try {
        auto& cfg = Config::getInstance();
        cfg.load(argv[1]);
        Logger::getInstance().initialize(cfg.getLogDir(), cfg.getLogLevel());

        const StrategyCandidate candidate = readJsonFile(argv[2]).get<StrategyCandidate>();
        const PortfolioSnapshot portfolio = readJsonFile(argv[3]).get<PortfolioSnapshot>();

        const auto settings = cfg.getStagingSettings();
        auto ledger = std::make_shared<core::InMemoryStagingLedger>();
        auto journal = std::make_shared<core::AuditJournalJsonl>(settings.audit_journal_path);
        core::LifecycleController controller(ledger, cfg.getRiskLimits(), settings, nullptr, journal);

        const auto result = controller.stageStrategy(candidate, portfolio);
        nlohmann::json report;
        report["ok"] = result.ok;
        if (result.assessment) {
            report["assessment"] = *result.assessment;
        }

        if (!result.ok) {
            report["error"] = result.error;
            std::cout << report.dump(2) << "\n";
            const bool rejected = result.error.code == core::StagingErrorCode::STRUCTURAL_ERROR ||
                                  result.error.code == core::StagingErrorCode::RISK_REJECTED;
            return rejected ? kExitRejected : kExitError;
        }

        report["strategy_id"] = result.strategy_id;
        const auto snapshot = controller.getStrategy(result.strategy_id);
        if (snapshot.found()) {
            nlohmann::json meta;
            meta["source"] = "TradeGateStage";
            meta["candidate_id"] = candidate.id;
            core::StrategyDraftWriter writer(settings.drafts_dir);
            if (auto path = writer.write(snapshot.record, meta)) {
                report["draft"] = path->string();
            } else {
                std::cerr << "Draft could not be written to " << settings.drafts_dir << "\n";
            }
        }

        std::cout << report.dump(2) << "\n";
        return kExitStaged;
    } catch (const std::exception& e) {
        std::cerr << "Staging failed: " << e.what() << "\n";
        return kExitError;
    }
}
