#include <gtest/gtest.h>

#include "ledger_fixture.hpp"

namespace {

using namespace ledger_test;
using ledger::Errc;
using ledger::U256;

class ConditionTest : public LedgerTest {};

TEST_F(ConditionTest, PrepareStoresSlotsAndEmits) {
  auto id = prepare(3);

  EXPECT_EQ(id, ledger::Ledger::get_condition_id(ORACLE, question(1), 3));
  EXPECT_EQ(ledger_.outcome_slot_count(id), 3u);
  for (size_t i = 0; i < 3; ++i)
    EXPECT_EQ(ledger_.payout_numerator(id, i), U256(0));
  EXPECT_EQ(ledger_.payout_denominator(id), U256(0));

  ASSERT_EQ(sink_.events.size(), 1u);
  const auto &ev = std::get<ledger::ConditionPreparation>(sink_.events[0]);
  EXPECT_EQ(ev.condition_id, id);
  EXPECT_EQ(ev.oracle, ORACLE);
  EXPECT_EQ(ev.question_id, question(1));
  EXPECT_EQ(ev.outcome_slot_count, 3u);

  const auto *rec = ledger_.conditions().find(id);
  ASSERT_NE(rec, nullptr);
  EXPECT_EQ(rec->oracle, ORACLE);
}

TEST_F(ConditionTest, PrepareTwiceFails) {
  prepare(2);
  expect_errc([&] { prepare(2); }, Errc::AlreadyPrepared);
  EXPECT_EQ(sink_.events.size(), 1u);
}

TEST_F(ConditionTest, SameQuestionDifferentCountIsDistinct) {
  auto two = prepare(2);
  auto three = prepare(3);
  EXPECT_NE(two, three);
  EXPECT_EQ(ledger_.outcome_slot_count(two), 2u);
  EXPECT_EQ(ledger_.outcome_slot_count(three), 3u);
}

TEST_F(ConditionTest, OutcomeCountBounds) {
  expect_errc([&] { prepare(0); }, Errc::InvalidOutcomeCount);
  expect_errc([&] { prepare(ledger::MAX_OUTCOME_SLOTS + 1); }, Errc::InvalidOutcomeCount);

  auto single = prepare(1, 2);
  EXPECT_EQ(ledger_.outcome_slot_count(single), 1u);
  auto widest = prepare(ledger::MAX_OUTCOME_SLOTS, 3);
  EXPECT_EQ(ledger_.outcome_slot_count(widest), ledger::MAX_OUTCOME_SLOTS);
}

TEST_F(ConditionTest, UnknownConditionReadsAsUnprepared) {
  auto id = ledger::Ledger::get_condition_id(ORACLE, question(9), 2);
  EXPECT_EQ(ledger_.outcome_slot_count(id), 0u);
  EXPECT_EQ(ledger_.payout_numerator(id, 0), U256(0));
  EXPECT_EQ(ledger_.conditions().find(id), nullptr);
}

} // namespace
