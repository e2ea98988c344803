#include <gtest/gtest.h>

#include "ledger_fixture.hpp"

namespace {

using namespace ledger_test;
using ledger::Errc;
using ledger::U256;

class JournalTest : public LedgerTest {};

TEST_F(JournalTest, EventsDeliveredOnlyAtOutermostCommit) {
  {
    ledger::Transaction outer(ledger_.journal());
    prepare(2);
    EXPECT_TRUE(sink_.events.empty());
    EXPECT_EQ(ledger_.journal().depth(), 1);
    outer.commit();
  }
  EXPECT_EQ(sink_.events.size(), 1u);
  EXPECT_EQ(ledger_.journal().depth(), 0);
}

TEST_F(JournalTest, UncommittedOuterUndoesLedgerAndCollateral) {
  Bytes32 cond;
  {
    ledger::Transaction outer(ledger_.journal());
    cond = prepare(2);
    ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);
    EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(100));
  }

  EXPECT_EQ(ledger_.outcome_slot_count(cond), 0u);
  EXPECT_EQ(position(ALICE, cond, 0), U256(0));
  EXPECT_EQ(usdc_->balance_of(ALICE), U256(1000));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(0));
  EXPECT_EQ(usdc_->allowance(ALICE, CUSTODY), U256(1000));
  EXPECT_TRUE(ledger_.state().conditions().empty());
  EXPECT_TRUE(sink_.events.empty());
}

TEST_F(JournalTest, FailedInnerKeepsEarlierWorkOfOuter) {
  {
    ledger::Transaction outer(ledger_.journal());
    auto cond = prepare(2);
    expect_errc([&] { prepare(2); }, Errc::AlreadyPrepared);
    expect_errc([&] { ledger_.split_position(CAROL, USDC, ledger::ROOT_SLOT, cond, 5); },
                Errc::CollateralTransferFailed);
    EXPECT_EQ(ledger_.outcome_slot_count(cond), 2u);
    outer.commit();
  }
  EXPECT_EQ(sink_.events.size(), 1u);
  EXPECT_EQ(sink_.count<ledger::ConditionPreparation>(), 1u);
}

TEST_F(JournalTest, ZeroBalancesAreNotStored) {
  auto cond = prepare(2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 10);
  EXPECT_EQ(ledger_.state().all_balances().size(), 2u);

  ledger_.merge_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 10);
  EXPECT_TRUE(ledger_.state().all_balances().empty());
  EXPECT_EQ(usdc_->balances().count(CUSTODY), 0u);
}

} // namespace
