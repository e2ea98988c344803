#include <gtest/gtest.h>

#include "ledger_fixture.hpp"

namespace {

using namespace ledger_test;
using ledger::Errc;
using ledger::U256;

class PositionTest : public LedgerTest {
protected:
  U256 key(const Bytes32 &cond, uint64_t index, const U256 &parent = ledger::ROOT_SLOT) const {
    return ledger::position_key(USDC, ledger::payout_slot_id(parent, cond, index));
  }
};

// 包一层 InMemoryCollateral, 可以让付款失败
class FlakyCollateral : public ledger::CollateralToken {
public:
  explicit FlakyCollateral(ledger::InMemoryCollateral &inner) : inner_(inner) {}

  bool transfer_from(const Address &payer, const Address &custody, const U256 &amount) override {
    return inner_.transfer_from(payer, custody, amount);
  }
  bool transfer(const Address &custody, const Address &payee, const U256 &amount) override {
    return !fail_payout && inner_.transfer(custody, payee, amount);
  }

  bool fail_payout = false;

private:
  ledger::InMemoryCollateral &inner_;
};

TEST_F(PositionTest, SplitFromCollateral) {
  auto cond = prepare(2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);

  EXPECT_EQ(usdc_->balance_of(ALICE), U256(900));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(100));
  EXPECT_EQ(position(ALICE, cond, 0), U256(100));
  EXPECT_EQ(position(ALICE, cond, 1), U256(100));

  ASSERT_EQ(sink_.count<ledger::PositionSplit>(), 1u);
  const auto &ev = std::get<ledger::PositionSplit>(sink_.events.back());
  EXPECT_EQ(ev.stakeholder, ALICE);
  EXPECT_EQ(ev.collateral, USDC);
  EXPECT_EQ(ev.parent_slot_id, ledger::ROOT_SLOT);
  EXPECT_EQ(ev.condition_id, cond);
  EXPECT_EQ(ev.amount, U256(100));
}

TEST_F(PositionTest, MergeUndoesSplit) {
  auto cond = prepare(3);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);
  ledger_.merge_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 40);

  EXPECT_EQ(usdc_->balance_of(ALICE), U256(940));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(60));
  for (uint64_t i = 0; i < 3; ++i)
    EXPECT_EQ(position(ALICE, cond, i), U256(60));

  ledger_.merge_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 60);
  EXPECT_EQ(usdc_->balance_of(ALICE), U256(1000));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(0));
  EXPECT_TRUE(ledger_.state().all_balances().empty());
  EXPECT_EQ(sink_.count<ledger::PositionMerge>(), 2u);
}

TEST_F(PositionTest, SplitRequiresPreparedCondition) {
  auto cond = ledger::Ledger::get_condition_id(ORACLE, question(5), 2);
  expect_errc([&] { ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 10); },
              Errc::ConditionNotPrepared);
  expect_errc([&] { ledger_.merge_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 10); },
              Errc::ConditionNotPrepared);
}

TEST_F(PositionTest, CollateralPullFailureLeavesNoTrace) {
  auto cond = prepare(2);
  size_t before = sink_.events.size();

  // CAROL 没有余额也没有授权
  expect_errc([&] { ledger_.split_position(CAROL, USDC, ledger::ROOT_SLOT, cond, 10); },
              Errc::CollateralTransferFailed);
  // 未登记的抵押品
  expect_errc([&] { ledger_.split_position(ALICE, addr(0xdd), ledger::ROOT_SLOT, cond, 10); },
              Errc::CollateralTransferFailed);
  // 超过授权
  expect_errc([&] { ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 1001); },
              Errc::CollateralTransferFailed);

  EXPECT_EQ(position(CAROL, cond, 0), U256(0));
  EXPECT_EQ(position(ALICE, cond, 0), U256(0));
  EXPECT_EQ(usdc_->balance_of(ALICE), U256(1000));
  EXPECT_EQ(sink_.events.size(), before);
}

TEST_F(PositionTest, MergeFailureRestoresEarlierDebits) {
  auto cond = prepare(2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);
  ledger_.transfer(ALICE, ALICE, BOB, key(cond, 1), 100);

  expect_errc([&] { ledger_.merge_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 50); },
              Errc::InsufficientBalance);
  EXPECT_EQ(position(ALICE, cond, 0), U256(100));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(100));
}

TEST_F(PositionTest, CollateralPayoutFailureRollsBackMerge) {
  FlakyCollateral flaky(*usdc_);
  Address token = addr(0xc2);
  ledger_.add_collateral(token, &flaky);
  auto cond = prepare(2);
  U256 k0 = ledger::position_key(token, ledger::payout_slot_id(ledger::ROOT_SLOT, cond, 0));

  ledger_.split_position(ALICE, token, ledger::ROOT_SLOT, cond, 100);
  flaky.fail_payout = true;

  expect_errc([&] { ledger_.merge_position(ALICE, token, ledger::ROOT_SLOT, cond, 100); },
              Errc::CollateralTransferFailed);
  EXPECT_EQ(ledger_.balance_of(ALICE, k0), U256(100));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(100));
}

TEST_F(PositionTest, NestedSplitAndMerge) {
  auto a = prepare(2, 1);
  auto b = prepare(3, 2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, a, 100);

  U256 a0 = ledger::payout_slot_id(ledger::ROOT_SLOT, a, 0);
  ledger_.split_position(ALICE, USDC, a0, b, 60);

  EXPECT_EQ(position(ALICE, a, 0), U256(40));
  EXPECT_EQ(position(ALICE, a, 1), U256(100));
  for (uint64_t i = 0; i < 3; ++i)
    EXPECT_EQ(position(ALICE, b, i, a0), U256(60));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(100));

  // 嵌套 slot 与路径顺序无关
  U256 ab = ledger::Ledger::get_nested_slot_id(ledger::ROOT_SLOT, {{a, 0}, {b, 2}});
  U256 ba = ledger::Ledger::get_nested_slot_id(ledger::ROOT_SLOT, {{b, 2}, {a, 0}});
  EXPECT_EQ(ab, ba);
  EXPECT_EQ(ledger_.balance_of(ALICE, ledger::position_key(USDC, ab)), U256(60));

  ledger_.merge_position(ALICE, USDC, a0, b, 60);
  EXPECT_EQ(position(ALICE, a, 0), U256(100));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(100));
}

TEST_F(PositionTest, NestedSplitNeedsParentBalance) {
  auto a = prepare(2, 1);
  auto b = prepare(2, 2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, a, 10);
  U256 a0 = ledger::payout_slot_id(ledger::ROOT_SLOT, a, 0);

  expect_errc([&] { ledger_.split_position(ALICE, USDC, a0, b, 11); },
              Errc::InsufficientBalance);
  EXPECT_EQ(position(ALICE, a, 0), U256(10));
  EXPECT_EQ(position(ALICE, b, 0, a0), U256(0));
}

// prepare(2) → split 100 → 结果 [1,3] → 25 + 75 = 100
TEST_F(PositionTest, RedeemScenarioPaysOutEverything) {
  auto cond = prepare(2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);
  ledger_.safe_transfer(ALICE, ALICE, BOB, key(cond, 1), 100, {});
  resolve({1, 3});

  EXPECT_EQ(ledger_.redeem_payout(ALICE, USDC, ledger::ROOT_SLOT, cond), U256(25));
  EXPECT_EQ(ledger_.redeem_payout(BOB, USDC, ledger::ROOT_SLOT, cond), U256(75));

  EXPECT_EQ(usdc_->balance_of(ALICE), U256(925));
  EXPECT_EQ(usdc_->balance_of(BOB), U256(1075));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(0));
  EXPECT_EQ(position(ALICE, cond, 0), U256(0));
  EXPECT_EQ(position(BOB, cond, 1), U256(0));

  const auto &ev = std::get<ledger::PayoutRedemption>(sink_.events.back());
  EXPECT_EQ(ev.redeemer, BOB);
  EXPECT_EQ(ev.payout, U256(75));
}

TEST_F(PositionTest, RedeemIsIdempotent) {
  auto cond = prepare(2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);
  resolve({1, 1});

  EXPECT_EQ(ledger_.redeem_payout(ALICE, USDC, ledger::ROOT_SLOT, cond), U256(100));
  EXPECT_EQ(ledger_.redeem_payout(ALICE, USDC, ledger::ROOT_SLOT, cond), U256(0));
  EXPECT_EQ(usdc_->balance_of(ALICE), U256(1000));
  EXPECT_EQ(sink_.count<ledger::PayoutRedemption>(), 2u);
}

TEST_F(PositionTest, RedeemBeforeResolutionFails) {
  auto cond = prepare(2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);
  expect_errc([&] { ledger_.redeem_payout(ALICE, USDC, ledger::ROOT_SLOT, cond); },
              Errc::ResultNotReceived);
  EXPECT_EQ(position(ALICE, cond, 0), U256(100));
}

TEST_F(PositionTest, RedeemTruncatesAndKeepsDust) {
  auto cond = prepare(3);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 10);
  resolve({1, 1, 1});

  EXPECT_EQ(ledger_.redeem_payout(ALICE, USDC, ledger::ROOT_SLOT, cond), U256(9));
  EXPECT_EQ(usdc_->balance_of(CUSTODY), U256(1));
}

TEST_F(PositionTest, NestedRedeemCreditsParentPosition) {
  auto a = prepare(2, 1);
  auto b = prepare(2, 2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, a, 100);
  U256 a0 = ledger::payout_slot_id(ledger::ROOT_SLOT, a, 0);
  ledger_.split_position(ALICE, USDC, a0, b, 100);
  resolve({0, 1}, 2);

  EXPECT_EQ(ledger_.redeem_payout(ALICE, USDC, a0, b), U256(100));
  EXPECT_EQ(position(ALICE, a, 0), U256(100));
  EXPECT_EQ(usdc_->balance_of(ALICE), U256(900));
}

TEST_F(PositionTest, CustodyMatchesOutstandingPositions) {
  auto cond = prepare(2);
  ledger_.split_position(ALICE, USDC, ledger::ROOT_SLOT, cond, 100);
  ledger_.split_position(BOB, USDC, ledger::ROOT_SLOT, cond, 50);
  ledger_.transfer(ALICE, ALICE, BOB, key(cond, 0), 30);
  ledger_.merge_position(BOB, USDC, ledger::ROOT_SLOT, cond, 50);

  for (uint64_t i = 0; i < 2; ++i) {
    U256 total = position(ALICE, cond, i) + position(BOB, cond, i);
    EXPECT_EQ(total, usdc_->balance_of(CUSTODY)) << "outcome " << i;
  }
  EXPECT_EQ(usdc_->balance_of(ALICE) + usdc_->balance_of(BOB) + usdc_->balance_of(CUSTODY),
            U256(2000));
}

} // namespace
