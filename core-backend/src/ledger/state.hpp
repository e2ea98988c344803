#pragma once

// ============================================================================
// LedgerState - 持久化的五张表
//
//   condition           conditionId -> (oracle, questionId, outcomeSlotCount)
//   payout_numerator    conditionId -> [numerator; outcomeSlotCount]
//   payout_denominator  conditionId -> Σ numerators
//   position_balance    (owner, positionKey) -> amount
//   allowance           (positionKey, owner, spender) -> amount
//
// 所有写操作都先往 Journal 记 undo. 值为 0 的余额/授权不存储.
// 写过的 key 记在 touched 里, 落盘时只重写这些行.
// ============================================================================

#include "errors.hpp"
#include "journal.hpp"
#include "types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace ledger {

inline U256 checked_add(const U256 &a, const U256 &b, const std::string &what) {
  U256 r = a + b;
  if (r < a)
    throw LedgerError(Errc::Overflow, what);
  return r;
}

inline U256 checked_mul(const U256 &a, const U256 &b, const std::string &what) {
  if (a.is_zero() || b.is_zero())
    return 0;
  U256 r = a * b;
  if (r / a != b)
    throw LedgerError(Errc::Overflow, what);
  return r;
}

struct ConditionRecord {
  Address oracle;
  Bytes32 question_id;
  uint64_t outcome_slot_count = 0;
};

using BalanceKey = std::pair<Address, U256>;                // (owner, positionKey)
using AllowanceKey = std::tuple<U256, Address, Address>;    // (positionKey, owner, spender)

class LedgerState {
public:
  explicit LedgerState(Journal &journal) : journal_(journal) {}

  LedgerState(const LedgerState &) = delete;
  LedgerState &operator=(const LedgerState &) = delete;

  // --- condition ------------------------------------------------------------
  const ConditionRecord *find_condition(const Bytes32 &id) const {
    auto it = conditions_.find(id);
    return it == conditions_.end() ? nullptr : &it->second;
  }

  void put_condition(const Bytes32 &id, const ConditionRecord &rec) {
    restore_on_undo(conditions_, id);
    conditions_[id] = rec;
    touched_.conditions.insert(id);
  }

  // --- payout numerators / denominator ----------------------------------------
  const std::vector<U256> &numerators(const Bytes32 &id) const {
    static const std::vector<U256> empty;
    auto it = numerators_.find(id);
    return it == numerators_.end() ? empty : it->second;
  }

  void init_numerators(const Bytes32 &id, uint64_t count) {
    restore_on_undo(numerators_, id);
    numerators_[id].assign(count, U256(0));
    touched_.conditions.insert(id);
  }

  void set_numerator(const Bytes32 &id, size_t index, const U256 &value) {
    auto &slots = numerators_.at(id);
    U256 prev = slots.at(index);
    journal_.record([this, id, index, prev]() { numerators_.at(id)[index] = prev; });
    slots[index] = value;
    touched_.conditions.insert(id);
  }

  U256 denominator(const Bytes32 &id) const { return get_or_zero(denominators_, id); }

  void set_denominator(const Bytes32 &id, const U256 &value) {
    put_word(denominators_, id, value);
    touched_.conditions.insert(id);
  }

  // --- position balance -------------------------------------------------------
  U256 balance(const Address &owner, const U256 &key) const {
    return get_or_zero(balances_, BalanceKey{owner, key});
  }

  void set_balance(const Address &owner, const U256 &key, const U256 &value) {
    put_word(balances_, BalanceKey{owner, key}, value);
    touched_.balances.insert(BalanceKey{owner, key});
  }

  void credit(const Address &owner, const U256 &key, const U256 &amount) {
    set_balance(owner, key, checked_add(balance(owner, key), amount,
                                        "balance of " + owner.hex() + " at " + word_hex(key)));
  }

  void debit(const Address &owner, const U256 &key, const U256 &amount) {
    U256 have = balance(owner, key);
    if (have < amount)
      throw LedgerError(Errc::InsufficientBalance,
                        owner.hex() + " holds " + word_dec(have) + " of " + word_hex(key) +
                            ", needs " + word_dec(amount));
    set_balance(owner, key, have - amount);
  }

  // --- allowance --------------------------------------------------------------
  U256 allowance(const U256 &key, const Address &owner, const Address &spender) const {
    return get_or_zero(allowances_, AllowanceKey{key, owner, spender});
  }

  void set_allowance(const U256 &key, const Address &owner, const Address &spender,
                     const U256 &value) {
    put_word(allowances_, AllowanceKey{key, owner, spender}, value);
    touched_.allowances.insert(AllowanceKey{key, owner, spender});
  }

  // --- 只读视图 (持久化用) ----------------------------------------------------
  const std::map<Bytes32, ConditionRecord> &conditions() const { return conditions_; }
  const std::map<Bytes32, std::vector<U256>> &all_numerators() const { return numerators_; }
  const std::map<Bytes32, U256> &all_denominators() const { return denominators_; }
  const std::map<BalanceKey, U256> &all_balances() const { return balances_; }
  const std::map<AllowanceKey, U256> &all_allowances() const { return allowances_; }

  // 回滚后标记保留, 下次落盘按当前值重写
  struct Touched {
    std::set<Bytes32> conditions;
    std::set<BalanceKey> balances;
    std::set<AllowanceKey> allowances;
  };
  const Touched &touched() const { return touched_; }
  void clear_touched() { touched_ = Touched{}; }

private:
  template <typename K>
  static U256 get_or_zero(const std::map<K, U256> &m, const K &k) {
    auto it = m.find(k);
    return it == m.end() ? U256(0) : it->second;
  }

  // 恢复 key 的旧值 (不存在则删除)
  template <typename K, typename V>
  void restore_on_undo(std::map<K, V> &m, const K &k) {
    auto it = m.find(k);
    std::optional<V> prev;
    if (it != m.end())
      prev = it->second;
    journal_.record([&m, k, prev]() {
      if (prev)
        m[k] = *prev;
      else
        m.erase(k);
    });
  }

  template <typename K>
  void put_word(std::map<K, U256> &m, const K &k, const U256 &value) {
    restore_on_undo(m, k);
    if (value.is_zero())
      m.erase(k);
    else
      m[k] = value;
  }

  Journal &journal_;
  std::map<Bytes32, ConditionRecord> conditions_;
  std::map<Bytes32, std::vector<U256>> numerators_;
  std::map<Bytes32, U256> denominators_;
  std::map<BalanceKey, U256> balances_;
  std::map<AllowanceKey, U256> allowances_;
  Touched touched_;
};

} // namespace ledger
