#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "ledger/hash.hpp"
#include "ledger/ids.hpp"
#include "ledger_fixture.hpp"

namespace {

using namespace ledger_test;
using ledger::U256;

TEST(HashTest, Sha3KnownVectors) {
  EXPECT_EQ(ledger::sha3_256(ledger::Bytes{}).hex(),
            "0xa7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");

  std::string abc = "abc";
  ledger::Bytes data(abc.begin(), abc.end());
  EXPECT_EQ(ledger::sha3_256(data).hex(),
            "0x3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(HashTest, PackerIsTightlyPacked) {
  ledger::Packer p;
  p.address(ALICE).bytes32(question(7)).word(2);
  ASSERT_EQ(p.data().size(), 20u + 32u + 32u);
  EXPECT_EQ(p.data()[19], 0xa1);
  EXPECT_EQ(p.data()[51], 7);
  EXPECT_EQ(p.data()[83], 2);
}

TEST(HashTest, WordParsing) {
  EXPECT_EQ(ledger::parse_word("0x10"), U256(16));
  EXPECT_EQ(ledger::parse_word("1000"), U256(1000));
  EXPECT_EQ(ledger::parse_word(ledger::word_hex(U256(12345))), U256(12345));
  EXPECT_EQ(ledger::word_hex(U256(1)).size(), 66u);

  U256 max = std::numeric_limits<U256>::max();
  EXPECT_EQ(ledger::parse_word(ledger::word_dec(max)), max);
  EXPECT_THROW(ledger::parse_word(ledger::word_dec(max) + "0"), std::invalid_argument);
  EXPECT_THROW(ledger::parse_word("0x" + std::string(65, 'f')), std::invalid_argument);
  EXPECT_THROW(ledger::parse_word("12a"), std::invalid_argument);
  EXPECT_THROW(ledger::parse_word(""), std::invalid_argument);
}

TEST(IdsTest, ConditionIdDependsOnEveryInput) {
  auto base = ledger::condition_id(ORACLE, question(1), 2);
  EXPECT_EQ(base, ledger::condition_id(ORACLE, question(1), 2));
  EXPECT_NE(base, ledger::condition_id(ALICE, question(1), 2));
  EXPECT_NE(base, ledger::condition_id(ORACLE, question(2), 2));
  EXPECT_NE(base, ledger::condition_id(ORACLE, question(1), 3));
}

TEST(IdsTest, SlotIdAdditionWrapsModulo256Bits) {
  auto cond = ledger::condition_id(ORACLE, question(1), 2);
  U256 max = std::numeric_limits<U256>::max();

  U256 from_root = ledger::payout_slot_id(ledger::ROOT_SLOT, cond, 0);
  U256 from_max = ledger::payout_slot_id(max, cond, 0);
  EXPECT_EQ(from_max + 1, from_root);
  EXPECT_NE(ledger::payout_slot_id(ledger::ROOT_SLOT, cond, 1), from_root);
}

TEST(IdsTest, NestedSlotIsOrderIndependent) {
  auto a = ledger::condition_id(ORACLE, question(1), 2);
  auto b = ledger::condition_id(ORACLE, question(2), 3);

  U256 ab = ledger::nested_slot_id(ledger::ROOT_SLOT, {{a, 0}, {b, 1}});
  U256 ba = ledger::nested_slot_id(ledger::ROOT_SLOT, {{b, 1}, {a, 0}});
  EXPECT_EQ(ab, ba);
  EXPECT_EQ(ab, ledger::payout_slot_id(ledger::payout_slot_id(ledger::ROOT_SLOT, a, 0), b, 1));
  EXPECT_EQ(ledger::nested_slot_id(U256(42), {}), U256(42));
}

TEST(IdsTest, PositionKeyIsPerCollateral) {
  auto cond = ledger::condition_id(ORACLE, question(1), 2);
  U256 slot = ledger::payout_slot_id(ledger::ROOT_SLOT, cond, 0);
  EXPECT_NE(ledger::position_key(USDC, slot), ledger::position_key(addr(0xc1), slot));
  EXPECT_EQ(ledger::position_key(USDC, slot), ledger::Ledger::get_position_key(USDC, slot));
}

} // namespace
