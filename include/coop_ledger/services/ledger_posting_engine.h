#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "coop_ledger/contracts/errors.h"
#include "coop_ledger/contracts/types.h"
#include "coop_ledger/core/ledger_config.h"
#include "coop_ledger/core/unit_of_work.h"

namespace coop_ledger {

struct PostingRequest {
    std::string tenant_id;
    std::string description;
    std::vector<PostingLine> lines;
    std::string effective_date;
    std::string reverses_entry_id;
};

struct PostingResult {
    JournalEntry journal_entry;
    std::vector<LedgerLine> ledger_lines;
};

class LedgerPostingEngine {
public:
    explicit LedgerPostingEngine(LedgerRuntimeConfig runtime = {});

    // Writes one balanced journal entry and its lines inside `uow` and stages
    // a JournalPosted event for delivery after commit.
    bool Post(UnitOfWork* uow,
              const PostingRequest& request,
              PostingResult* result,
              ControlError* error) const;

    // Posts the mirror image of `entry_id` with debit and credit swapped.
    // An empty `effective_date` reuses the original entry's date.
    bool Reverse(UnitOfWork* uow,
                 const std::string& tenant_id,
                 const std::string& entry_id,
                 const std::string& description_prefix,
                 const std::string& effective_date,
                 PostingResult* result,
                 ControlError* error) const;

    // Shape and account checks without writing anything.
    bool Validate(const ILedgerStore& store,
                  const PostingRequest& request,
                  ControlError* error) const;

    static std::string FormatEntryNumber(const std::string& prefix, int year, std::int64_t sequence);

private:
    bool ValidateAccounts(const ILedgerStore& store,
                          const PostingRequest& request,
                          std::vector<Account>* accounts,
                          ControlError* error) const;

    LedgerRuntimeConfig runtime_;
};

}  // namespace coop_ledger
