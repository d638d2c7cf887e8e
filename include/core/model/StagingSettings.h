#pragma once

#include <string>

namespace tradegate {
namespace core {

struct StagingSettings {
    std::string audit_journal_path = "logs/audit_journal.jsonl";
    std::string drafts_dir = "drafts";
    int trade_date_utc_offset_minutes = 0;
    std::string default_actor = "system";
};

} // namespace core
} // namespace tradegate
