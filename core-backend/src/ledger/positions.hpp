#pragma once

// ============================================================================
// Position Ledger - split / merge / redeem
//
// 1. Split  - 1 份父篮子 → outcomeSlotCount 份子篮子 (每个 outcome 一份)
//    root 父篮子: 从调用者拉取抵押品进 custody; 否则扣父 position
// 2. Merge  - 逆操作, 所有子篮子各扣 amount, 退抵押品或加回父 position
// 3. Redeem - 结算后按 numerator/denominator 折算子篮子, 截断产生的零头不处理
//
// 抵押品守恒: split/merge 不创造也不销毁价值, redeem 只会向下取整.
// ============================================================================

#include "collateral.hpp"
#include "conditions.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "ids.hpp"
#include "journal.hpp"
#include "state.hpp"

#include <string>

namespace ledger {

class PositionLedger {
public:
  PositionLedger(LedgerState &state, Journal &journal, const ConditionRegistry &conditions,
                 CollateralDirectory &collateral, const Address &custody)
      : state_(state), journal_(journal), conditions_(conditions), collateral_(collateral),
        custody_(custody) {}

  void split_position(const Address &caller, const Address &collateral,
                      const U256 &parent_slot_id, const Bytes32 &cond_id, const U256 &amount) {
    uint64_t count = require_prepared(cond_id);
    Transaction tx(journal_);

    if (parent_slot_id == ROOT_SLOT)
      pull_collateral(caller, collateral, amount);
    else
      state_.debit(caller, position_key(collateral, parent_slot_id), amount);

    for (uint64_t i = 0; i < count; ++i)
      state_.credit(caller, child_key(collateral, parent_slot_id, cond_id, i), amount);

    journal_.emit(PositionSplit{caller, collateral, parent_slot_id, cond_id, amount});
    tx.commit();
  }

  void merge_position(const Address &caller, const Address &collateral,
                      const U256 &parent_slot_id, const Bytes32 &cond_id, const U256 &amount) {
    uint64_t count = require_prepared(cond_id);
    Transaction tx(journal_);

    for (uint64_t i = 0; i < count; ++i)
      state_.debit(caller, child_key(collateral, parent_slot_id, cond_id, i), amount);

    pay_out(caller, collateral, parent_slot_id, amount);

    journal_.emit(PositionMerge{caller, collateral, parent_slot_id, cond_id, amount});
    tx.commit();
  }

  // 返回本次赎回的总额; 无可赎回时返回 0 但仍然发事件
  U256 redeem_payout(const Address &caller, const Address &collateral,
                     const U256 &parent_slot_id, const Bytes32 &cond_id) {
    U256 den = conditions_.payout_denominator(cond_id);
    if (den.is_zero())
      throw LedgerError(Errc::ResultNotReceived, "condition " + cond_id.hex());
    uint64_t count = require_prepared(cond_id);

    Transaction tx(journal_);

    U256 total = 0;
    for (uint64_t i = 0; i < count; ++i) {
      U256 key = child_key(collateral, parent_slot_id, cond_id, i);
      U256 bal = state_.balance(caller, key);
      if (bal.is_zero())
        continue;
      U256 weighted = checked_mul(bal, conditions_.payout_numerator(cond_id, i),
                                  "redemption of " + word_hex(key));
      total = checked_add(total, weighted / den, "redemption total");
      state_.set_balance(caller, key, 0);
    }

    if (!total.is_zero())
      pay_out(caller, collateral, parent_slot_id, total);

    journal_.emit(PayoutRedemption{caller, collateral, parent_slot_id, cond_id, total});
    tx.commit();
    return total;
  }

  const Address &custody() const { return custody_; }

private:
  uint64_t require_prepared(const Bytes32 &cond_id) const {
    uint64_t count = conditions_.outcome_slot_count(cond_id);
    if (count == 0)
      throw LedgerError(Errc::ConditionNotPrepared, "condition " + cond_id.hex());
    return count;
  }

  static U256 child_key(const Address &collateral, const U256 &parent_slot_id,
                        const Bytes32 &cond_id, uint64_t index) {
    return position_key(collateral, payout_slot_id(parent_slot_id, cond_id, index));
  }

  void pull_collateral(const Address &payer, const Address &collateral, const U256 &amount) {
    CollateralToken *token = collateral_.find(collateral);
    if (!token || !token->transfer_from(payer, custody_, amount))
      throw LedgerError(Errc::CollateralTransferFailed,
                        "pull " + word_dec(amount) + " of " + collateral.hex() + " from " +
                            payer.hex());
  }

  // root: custody 付抵押品; 否则记入父 position
  void pay_out(const Address &payee, const Address &collateral, const U256 &parent_slot_id,
               const U256 &amount) {
    if (parent_slot_id != ROOT_SLOT) {
      state_.credit(payee, position_key(collateral, parent_slot_id), amount);
      return;
    }
    CollateralToken *token = collateral_.find(collateral);
    if (!token || !token->transfer(custody_, payee, amount))
      throw LedgerError(Errc::CollateralTransferFailed,
                        "pay " + word_dec(amount) + " of " + collateral.hex() + " to " +
                            payee.hex());
  }

  LedgerState &state_;
  Journal &journal_;
  const ConditionRegistry &conditions_;
  CollateralDirectory &collateral_;
  Address custody_;
};

} // namespace ledger
