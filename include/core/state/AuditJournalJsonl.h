#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>

#include "core/contracts/IAuditJournal.h"

namespace tradegate {
namespace core {

// One JSON object per line; sequence numbers continue across restarts.
class AuditJournalJsonl : public IAuditJournal {
public:
    explicit AuditJournalJsonl(std::filesystem::path file_path);

    bool append(const JournalEvent& event) override;
    std::vector<JournalEvent> readFrom(std::uint64_t seq_inclusive) override;
    std::uint64_t lastSeq() const override;

private:
    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace tradegate
