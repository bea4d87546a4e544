#pragma once

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

#include "coop_ledger/interfaces/ledger_event_sink.h"

namespace coop_ledger {

// Append-only JSONL journal of committed entries. Sequence numbers continue
// from the highest `seq` already present in the file.
class LocalWalLedgerEventSink : public ILedgerEventSink {
public:
    explicit LocalWalLedgerEventSink(std::string wal_path);
    ~LocalWalLedgerEventSink() override;

    bool PublishJournalPosted(const JournalPostedEvent& event) override;
    bool Flush() override;

    bool is_open() const;

private:
    static std::string EscapeJsonString(const std::string& input);
    std::uint64_t ComputeNextSeq() const;

    std::string wal_path_;
    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::uint64_t seq_{0};
};

}  // namespace coop_ledger
