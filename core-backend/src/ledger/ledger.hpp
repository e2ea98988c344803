#pragma once

// ============================================================================
// Ledger - 持有全部状态, 对外暴露两套接口:
//   position 操作 (prepare / resolve / split / merge / redeem)
//   资产接口     (transfer / safe transfer / approve / balance / allowance)
// 两者操作同一张 position_balance 表.
//
// 单线程串行: 每个调用是一个原子事务, 失败抛 LedgerError 且无任何残留.
// ============================================================================

#include "collateral.hpp"
#include "conditions.hpp"
#include "events.hpp"
#include "ids.hpp"
#include "journal.hpp"
#include "multi_asset.hpp"
#include "positions.hpp"
#include "receiver.hpp"
#include "state.hpp"

#include <vector>

namespace ledger {

class Ledger {
public:
  explicit Ledger(const Address &custody, EventSink *sink = nullptr)
      : journal_(sink), state_(journal_), conditions_(state_, journal_),
        positions_(state_, journal_, conditions_, collateral_, custody),
        assets_(state_, journal_, receivers_) {}

  Ledger(const Ledger &) = delete;
  Ledger &operator=(const Ledger &) = delete;

  // --- Condition Registry / Oracle Result Intake -----------------------------
  Bytes32 prepare_condition(const Address &oracle, const Bytes32 &question_id,
                            uint64_t outcome_slot_count) {
    return conditions_.prepare_condition(oracle, question_id, outcome_slot_count);
  }

  Bytes32 receive_result(const Address &caller, const Bytes32 &question_id, const Bytes &result) {
    return conditions_.receive_result(caller, question_id, result);
  }

  uint64_t outcome_slot_count(const Bytes32 &cond_id) const {
    return conditions_.outcome_slot_count(cond_id);
  }
  U256 payout_numerator(const Bytes32 &cond_id, size_t index) const {
    return conditions_.payout_numerator(cond_id, index);
  }
  U256 payout_denominator(const Bytes32 &cond_id) const {
    return conditions_.payout_denominator(cond_id);
  }

  // --- Slot Identifier Deriver ------------------------------------------------
  static Bytes32 get_condition_id(const Address &oracle, const Bytes32 &question_id,
                                  uint64_t outcome_slot_count) {
    return condition_id(oracle, question_id, outcome_slot_count);
  }
  static U256 get_payout_slot_id(const U256 &parent, const Bytes32 &cond_id, uint64_t index) {
    return payout_slot_id(parent, cond_id, index);
  }
  static U256 get_nested_slot_id(const U256 &parent, const std::vector<SlotStep> &steps) {
    return nested_slot_id(parent, steps);
  }
  static U256 get_position_key(const Address &collateral, const U256 &slot_id) {
    return position_key(collateral, slot_id);
  }

  // --- Position Ledger ------------------------------------------------------
  void split_position(const Address &caller, const Address &collateral, const U256 &parent,
                      const Bytes32 &cond_id, const U256 &amount) {
    positions_.split_position(caller, collateral, parent, cond_id, amount);
  }
  void merge_position(const Address &caller, const Address &collateral, const U256 &parent,
                      const Bytes32 &cond_id, const U256 &amount) {
    positions_.merge_position(caller, collateral, parent, cond_id, amount);
  }
  U256 redeem_payout(const Address &caller, const Address &collateral, const U256 &parent,
                     const Bytes32 &cond_id) {
    return positions_.redeem_payout(caller, collateral, parent, cond_id);
  }

  // --- Multi-Asset Transfer Layer ---------------------------------------------
  void transfer(const Address &caller, const Address &from, const Address &to, const U256 &id,
                const U256 &value) {
    assets_.transfer(caller, from, to, id, value);
  }
  void safe_transfer(const Address &caller, const Address &from, const Address &to,
                     const U256 &id, const U256 &value, const Bytes &data = {}) {
    assets_.safe_transfer(caller, from, to, id, value, data);
  }
  void safe_batch_transfer(const Address &caller, const Address &from, const Address &to,
                           const std::vector<U256> &ids, const std::vector<U256> &values,
                           const Bytes &data = {}) {
    assets_.safe_batch_transfer(caller, from, to, ids, values, data);
  }
  void approve(const Address &caller, const Address &spender, const U256 &id,
               const U256 &current_value, const U256 &new_value) {
    assets_.approve(caller, spender, id, current_value, new_value);
  }
  U256 balance_of(const Address &owner, const U256 &id) const {
    return assets_.balance_of(owner, id);
  }
  std::vector<U256> balance_of_batch(const std::vector<Address> &owners,
                                     const std::vector<U256> &ids) const {
    return assets_.balance_of_batch(owners, ids);
  }
  U256 allowance_of(const Address &owner, const Address &spender, const U256 &id) const {
    return assets_.allowance_of(owner, spender, id);
  }

  // --- 协作方 / 内部访问 --------------------------------------------------------
  void add_collateral(const Address &token_addr, CollateralToken *token) {
    collateral_.add(token_addr, token);
  }
  void add_receiver(const Address &addr, TokenReceiver *receiver) { receivers_.add(addr, receiver); }
  void remove_receiver(const Address &addr) { receivers_.remove(addr); }
  void set_event_sink(EventSink *sink) { journal_.set_sink(sink); }

  const Address &custody() const { return positions_.custody(); }
  Journal &journal() { return journal_; }
  LedgerState &state() { return state_; }
  const LedgerState &state() const { return state_; }
  const CollateralDirectory &collateral() const { return collateral_; }
  const ConditionRegistry &conditions() const { return conditions_; }

private:
  Journal journal_;
  LedgerState state_;
  CollateralDirectory collateral_;
  ReceiverDirectory receivers_;
  ConditionRegistry conditions_;
  PositionLedger positions_;
  MultiAssetLedger assets_;
};

} // namespace ledger
