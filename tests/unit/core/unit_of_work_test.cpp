#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "coop_ledger/core/in_memory_ledger_event_queue.h"
#include "coop_ledger/core/in_memory_ledger_store.h"
#include "coop_ledger/core/unit_of_work.h"

namespace coop_ledger {

namespace {

JournalPostedEvent MakeEvent(const std::string& entry_id) {
    JournalPostedEvent event;
    event.tenant_id = "t1";
    event.journal_entry_id = entry_id;
    event.entry_number = "JE-2025-000001";
    event.effective_date = "2025-03-14";
    event.total_debit = 10.0;
    return event;
}

Account MakeAccount(const std::string& id) {
    Account account;
    account.id = id;
    account.tenant_id = "t1";
    account.code = "00-10000-00-" + id;
    return account;
}

}  // namespace

TEST(UnitOfWorkTest, PublishesStagedEventsOnlyAfterCommit) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    auto queue = std::make_shared<InMemoryLedgerEventQueue>();
    UnitOfWork uow(store, queue);
    std::string error;
    ASSERT_TRUE(uow.Begin(&error)) << error;
    uow.StageEvent(MakeEvent("je-1"));
    uow.StageEvent(MakeEvent("je-2"));
    EXPECT_EQ(uow.staged_event_count(), 2U);
    EXPECT_EQ(queue->size(), 0U);

    ASSERT_TRUE(uow.Commit(&error)) << error;
    EXPECT_FALSE(uow.active());
    const auto events = queue->Drain();
    ASSERT_EQ(events.size(), 2U);
    EXPECT_EQ(events[0].journal_entry_id, "je-1");
    EXPECT_EQ(events[1].journal_entry_id, "je-2");
    EXPECT_GT(events[0].committed_ts_ns, 0);
}

TEST(UnitOfWorkTest, RollbackDiscardsEventsAndWrites) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    auto queue = std::make_shared<InMemoryLedgerEventQueue>();
    UnitOfWork uow(store, queue);
    std::string error;
    ASSERT_TRUE(uow.Begin(&error));
    ASSERT_TRUE(uow.store().InsertAccount(MakeAccount("a1"), &error));
    uow.StageEvent(MakeEvent("je-1"));
    ASSERT_TRUE(uow.Rollback(&error));

    EXPECT_EQ(queue->size(), 0U);
    Account account;
    bool found = true;
    ASSERT_TRUE(store->GetAccount("a1", &account, &found, &error));
    EXPECT_FALSE(found);
}

TEST(UnitOfWorkTest, DestructorRollsBackUncommittedWork) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    auto queue = std::make_shared<InMemoryLedgerEventQueue>();
    std::string error;
    {
        UnitOfWork uow(store, queue);
        ASSERT_TRUE(uow.Begin(&error));
        ASSERT_TRUE(uow.store().InsertAccount(MakeAccount("a1"), &error));
        uow.StageEvent(MakeEvent("je-1"));
    }
    EXPECT_EQ(queue->size(), 0U);
    Account account;
    bool found = true;
    ASSERT_TRUE(store->GetAccount("a1", &account, &found, &error));
    EXPECT_FALSE(found);

    // The transaction lock was released by the rollback.
    UnitOfWork next(store, queue);
    EXPECT_TRUE(next.Begin(&error)) << error;
    EXPECT_TRUE(next.Commit(&error)) << error;
}

TEST(UnitOfWorkTest, CountsEventsTheSinkRejects) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    auto queue = std::make_shared<InMemoryLedgerEventQueue>(1);
    UnitOfWork uow(store, queue);
    std::string error;
    ASSERT_TRUE(uow.Begin(&error));
    uow.StageEvent(MakeEvent("je-1"));
    uow.StageEvent(MakeEvent("je-2"));
    ASSERT_TRUE(uow.Commit(&error));
    EXPECT_EQ(queue->size(), 1U);
    EXPECT_EQ(queue->dropped(), 1U);
    EXPECT_EQ(uow.undelivered_event_count(), 1U);
}

TEST(UnitOfWorkTest, RejectsDoubleBeginAndCommitWithoutBegin) {
    auto store = std::make_shared<InMemoryLedgerStore>();
    UnitOfWork uow(store, nullptr);
    std::string error;
    EXPECT_FALSE(uow.Commit(&error));
    EXPECT_EQ(error, "unit of work is not active");
    ASSERT_TRUE(uow.Begin(&error));
    EXPECT_FALSE(uow.Begin(&error));
    EXPECT_EQ(error, "unit of work already active");
    EXPECT_TRUE(uow.Commit(&error));
}

TEST(UnitOfWorkTest, NullStoreFailsToBegin) {
    UnitOfWork uow(nullptr, nullptr);
    std::string error;
    EXPECT_FALSE(uow.Begin(&error));
    EXPECT_EQ(error, "ledger store is null");
}

}  // namespace coop_ledger
