// =============================================================================
// ledger_test.cpp
// =============================================================================
// Unit tests for agrovest::Ledger: staged recording and the read queries.
// =============================================================================

#include "agrovest/errors/engine_error.hpp"
#include "agrovest/ledger/ledger.hpp"
#include "agrovest/store/store.hpp"
#include "agrovest/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

using agrovest::EngineError;
namespace domain = agrovest::domain;

class LedgerTest : public ::testing::Test {
 protected:
  agrovest::SimulationTimeProvider clock{1700000000000LL};
  agrovest::Store store;
  agrovest::Ledger ledger{store, clock};

  void record(domain::UserId user, domain::TransactionType type,
              std::int64_t units, const std::string& description) {
    auto txn = store.begin();
    domain::LedgerEntry entry;
    entry.user_id = user;
    entry.type = type;
    entry.amount = domain::Money::fromUnits(units);
    entry.description = description;
    ledger.record(txn, entry);
    txn.commit();
    clock.advance_by(1000);
  }
};

TEST_F(LedgerTest, RecordStampsTimeAndId) {
  auto txn = store.begin();
  domain::LedgerEntry entry;
  entry.user_id = 1;
  entry.amount = domain::Money::fromUnits(200);
  auto recorded = ledger.record(txn, entry);
  txn.commit();

  EXPECT_NE(recorded.id, 0u);
  EXPECT_EQ(recorded.created_at, 1700000000000LL);
  ASSERT_EQ(store.ledger().size(), 1u);
}

TEST_F(LedgerTest, NegativeAmountRejected) {
  auto txn = store.begin();
  domain::LedgerEntry entry;
  entry.user_id = 1;
  entry.amount = domain::Money::fromUnits(-5);
  EXPECT_THROW(ledger.record(txn, entry), EngineError);
}

TEST_F(LedgerTest, RolledBackEntryIsNotVisible) {
  {
    auto txn = store.begin();
    domain::LedgerEntry entry;
    entry.user_id = 1;
    entry.amount = domain::Money::fromUnits(5);
    ledger.record(txn, entry);
  }
  EXPECT_TRUE(ledger.entriesForUser(1).empty());
}

TEST_F(LedgerTest, QueriesAreNewestFirstAndFiltered) {
  record(1, domain::TransactionType::Investment, 100, "Investment in Maize");
  record(1, domain::TransactionType::Refund, 100, "Refund for cancelled");
  record(2, domain::TransactionType::Investment, 50, "other user");
  record(1, domain::TransactionType::Investment, 50, "Investment in Rice");

  auto all = ledger.entriesForUser(1);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all.front().description, "Investment in Rice");
  EXPECT_EQ(all.back().description, "Investment in Maize");

  auto investments =
      ledger.entriesByType(1, domain::TransactionType::Investment);
  EXPECT_EQ(investments.size(), 2u);

  auto latest = ledger.recent(1, 1);
  ASSERT_EQ(latest.size(), 1u);
  EXPECT_EQ(latest[0].description, "Investment in Rice");

  EXPECT_EQ(ledger.total(1, domain::TransactionType::Investment),
            domain::Money::fromUnits(150));
}
