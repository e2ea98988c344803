#pragma once

// ============================================================================
// Multi-Asset Transfer Layer - 每个 positionKey 视为一种资产 id
//
// 与 PositionLedger 共用同一张 position_balance 表, 不另存余额.
// ============================================================================

#include "errors.hpp"
#include "events.hpp"
#include "journal.hpp"
#include "receiver.hpp"
#include "state.hpp"

#include <string>
#include <vector>

namespace ledger {

class MultiAssetLedger {
public:
  MultiAssetLedger(LedgerState &state, Journal &journal, const ReceiverDirectory &receivers)
      : state_(state), journal_(journal), receivers_(receivers) {}

  void transfer(const Address &caller, const Address &from, const Address &to, const U256 &id,
                const U256 &value) {
    Transaction tx(journal_);
    move(caller, from, to, id, value);
    journal_.emit(Transfer{caller, from, to, id, value});
    tx.commit();
  }

  // 目标登记了 receiver 时必须回 ON_RECEIVED_SELECTOR, 否则整体回滚
  void safe_transfer(const Address &caller, const Address &from, const Address &to,
                     const U256 &id, const U256 &value, const Bytes &data) {
    Transaction tx(journal_);
    move(caller, from, to, id, value);
    journal_.emit(Transfer{caller, from, to, id, value});

    if (TokenReceiver *r = receivers_.find(to)) {
      uint32_t ack = r->on_received(caller, from, id, value, data);
      if (ack != ON_RECEIVED_SELECTOR)
        throw LedgerError(Errc::TransferRejectedByReceiver,
                          to.hex() + " answered " + selector_hex(ack));
    }
    tx.commit();
  }

  void safe_batch_transfer(const Address &caller, const Address &from, const Address &to,
                           const std::vector<U256> &ids, const std::vector<U256> &values,
                           const Bytes &data) {
    if (ids.size() != values.size())
      throw LedgerError(Errc::LengthMismatch, std::to_string(ids.size()) + " ids, " +
                                                  std::to_string(values.size()) + " values");
    Transaction tx(journal_);
    for (size_t i = 0; i < ids.size(); ++i)
      move(caller, from, to, ids[i], values[i]);
    journal_.emit(TransferBatch{caller, from, to, ids, values});

    if (TokenReceiver *r = receivers_.find(to)) {
      uint32_t ack = r->on_batch_received(caller, from, ids, values, data);
      if (ack != ON_BATCH_RECEIVED_SELECTOR)
        throw LedgerError(Errc::TransferRejectedByReceiver,
                          to.hex() + " answered " + selector_hex(ack));
    }
    tx.commit();
  }

  // newValue == 0 总是允许; 否则链上当前值必须等于 currentValue (防抢跑)
  void approve(const Address &caller, const Address &spender, const U256 &id,
               const U256 &current_value, const U256 &new_value) {
    Transaction tx(journal_);
    U256 live = state_.allowance(id, caller, spender);
    if (!new_value.is_zero() && live != current_value)
      throw LedgerError(Errc::StaleApproval, "allowance of " + spender.hex() + " is " +
                                                 word_dec(live) + ", caller expected " +
                                                 word_dec(current_value));
    state_.set_allowance(id, caller, spender, new_value);
    journal_.emit(Approval{caller, spender, id, new_value});
    tx.commit();
  }

  U256 balance_of(const Address &owner, const U256 &id) const { return state_.balance(owner, id); }

  std::vector<U256> balance_of_batch(const std::vector<Address> &owners,
                                     const std::vector<U256> &ids) const {
    if (owners.size() != ids.size())
      throw LedgerError(Errc::LengthMismatch, std::to_string(owners.size()) + " owners, " +
                                                  std::to_string(ids.size()) + " ids");
    std::vector<U256> out;
    out.reserve(ids.size());
    for (size_t i = 0; i < ids.size(); ++i)
      out.push_back(state_.balance(owners[i], ids[i]));
    return out;
  }

  U256 allowance_of(const Address &owner, const Address &spender, const U256 &id) const {
    return state_.allowance(id, owner, spender);
  }

private:
  void move(const Address &caller, const Address &from, const Address &to, const U256 &id,
            const U256 &value) {
    if (caller != from) {
      U256 allowed = state_.allowance(id, from, caller);
      if (allowed < value)
        throw LedgerError(Errc::InsufficientAllowance,
                          caller.hex() + " may move " + word_dec(allowed) + " of " +
                              word_hex(id) + " for " + from.hex() + ", needs " +
                              word_dec(value));
      state_.set_allowance(id, from, caller, allowed - value);
    }
    state_.debit(from, id, value);
    state_.credit(to, id, value);
  }

  static std::string selector_hex(uint32_t sel) {
    uint8_t b[4] = {uint8_t(sel >> 24), uint8_t(sel >> 16), uint8_t(sel >> 8), uint8_t(sel)};
    return to_hex(b, 4);
  }

  LedgerState &state_;
  Journal &journal_;
  const ReceiverDirectory &receivers_;
};

} // namespace ledger
