#pragma once

// ============================================================================
// Condition Registry + Oracle Result Intake
// ============================================================================

#include "errors.hpp"
#include "events.hpp"
#include "ids.hpp"
#include "journal.hpp"
#include "state.hpp"

#include <string>
#include <vector>

namespace ledger {

static constexpr uint64_t MAX_OUTCOME_SLOTS = 256;

class ConditionRegistry {
public:
  ConditionRegistry(LedgerState &state, Journal &journal) : state_(state), journal_(journal) {}

  Bytes32 prepare_condition(const Address &oracle, const Bytes32 &question_id,
                            uint64_t outcome_slot_count) {
    if (outcome_slot_count == 0 || outcome_slot_count > MAX_OUTCOME_SLOTS)
      throw LedgerError(Errc::InvalidOutcomeCount,
                        "outcome slot count must be in [1, " + std::to_string(MAX_OUTCOME_SLOTS) +
                            "], got " + std::to_string(outcome_slot_count));

    Bytes32 id = condition_id(oracle, question_id, outcome_slot_count);
    Transaction tx(journal_);

    if (!state_.numerators(id).empty())
      throw LedgerError(Errc::AlreadyPrepared, "condition " + id.hex());

    state_.put_condition(id, ConditionRecord{oracle, question_id, outcome_slot_count});
    state_.init_numerators(id, outcome_slot_count);
    journal_.emit(ConditionPreparation{id, oracle, question_id, outcome_slot_count});

    tx.commit();
    return id;
  }

  // 0 = 未准备
  uint64_t outcome_slot_count(const Bytes32 &id) const { return state_.numerators(id).size(); }

  U256 payout_numerator(const Bytes32 &id, size_t index) const {
    const auto &slots = state_.numerators(id);
    return index < slots.size() ? slots[index] : U256(0);
  }

  const std::vector<U256> &payout_numerators(const Bytes32 &id) const {
    return state_.numerators(id);
  }

  U256 payout_denominator(const Bytes32 &id) const { return state_.denominator(id); }

  const ConditionRecord *find(const Bytes32 &id) const { return state_.find_condition(id); }

  // ==========================================================================
  // 结果上报: result 为 outcomeSlotCount 个 32 字节大端整数
  //
  // conditionId 由调用者地址推导, 冒充者只会落到一个未准备的 id 上
  // ==========================================================================
  Bytes32 receive_result(const Address &caller, const Bytes32 &question_id, const Bytes &result) {
    if (result.empty() || result.size() % WORD_BYTES != 0)
      throw LedgerError(Errc::MalformedResult,
                        "result length " + std::to_string(result.size()) +
                            " is not a positive multiple of " + std::to_string(WORD_BYTES));

    uint64_t count = result.size() / WORD_BYTES;
    Bytes32 id = condition_id(caller, question_id, count);
    Transaction tx(journal_);

    if (state_.numerators(id).size() != count)
      throw LedgerError(Errc::OutcomeCountMismatch,
                        "condition " + id.hex() + " was not prepared with " +
                            std::to_string(count) + " outcome slots");
    if (!state_.denominator(id).is_zero())
      throw LedgerError(Errc::AlreadyResolved, "condition " + id.hex());

    U256 den = 0;
    for (size_t i = 0; i < count; ++i) {
      U256 num = read_word(result.data() + i * WORD_BYTES);
      if (!state_.numerators(id)[i].is_zero())
        throw LedgerError(Errc::PayoutAlreadySet,
                          "condition " + id.hex() + " slot " + std::to_string(i));
      state_.set_numerator(id, i, num);
      den = checked_add(den, num, "payout denominator of " + id.hex());
    }

    if (den.is_zero())
      throw LedgerError(Errc::AllZeroPayout, "condition " + id.hex());
    state_.set_denominator(id, den);

    journal_.emit(ConditionResolution{id, caller, question_id, count, result});

    tx.commit();
    return id;
  }

private:
  LedgerState &state_;
  Journal &journal_;
};

// 把 payout 向量编码成上报字节
inline Bytes pack_result(const std::vector<U256> &payouts) {
  Bytes out(payouts.size() * WORD_BYTES);
  for (size_t i = 0; i < payouts.size(); ++i)
    write_word(payouts[i], out.data() + i * WORD_BYTES);
  return out;
}

} // namespace ledger
