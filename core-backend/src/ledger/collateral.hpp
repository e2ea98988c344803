#pragma once

// ============================================================================
// 抵押品资产 (外部协作方)
// ============================================================================

#include "journal.hpp"
#include "state.hpp"
#include "types.hpp"

#include <limits>
#include <map>
#include <memory>
#include <set>
#include <utility>

namespace ledger {

// 严格 bool 返回, 任何 false 都让调用方整体回滚
class CollateralToken {
public:
  virtual ~CollateralToken() = default;

  // custody 作为 spender, 把 amount 从 payer 拉到 custody
  virtual bool transfer_from(const Address &payer, const Address &custody, const U256 &amount) = 0;

  // custody 付给 payee
  virtual bool transfer(const Address &custody, const Address &payee, const U256 &amount) = 0;
};

class CollateralDirectory {
public:
  void add(const Address &token_addr, CollateralToken *token) { tokens_[token_addr] = token; }

  CollateralToken *find(const Address &token_addr) const {
    auto it = tokens_.find(token_addr);
    return it == tokens_.end() ? nullptr : it->second;
  }

  const std::map<Address, CollateralToken *> &all() const { return tokens_; }

private:
  std::map<Address, CollateralToken *> tokens_;
};

// ============================================================================
// InMemoryCollateral - ERC20 式余额 + 授权
//
// 与账本共用 Journal, 所以外层操作失败时转账也一起撤销.
// ============================================================================
class InMemoryCollateral : public CollateralToken {
public:
  explicit InMemoryCollateral(Journal &journal) : journal_(journal) {}

  bool transfer_from(const Address &payer, const Address &custody, const U256 &amount) override {
    U256 allowed = allowance(payer, custody);
    if (allowed < amount || balance_of(payer) < amount || !can_receive(payer, custody, amount))
      return false;
    set(allowances_, {payer, custody}, allowed - amount);
    touched_allowances_.insert(std::make_pair(payer, custody));
    move(payer, custody, amount);
    return true;
  }

  bool transfer(const Address &custody, const Address &payee, const U256 &amount) override {
    if (balance_of(custody) < amount || !can_receive(custody, payee, amount))
      return false;
    move(custody, payee, amount);
    return true;
  }

  void approve(const Address &owner, const Address &spender, const U256 &amount) {
    set(allowances_, {owner, spender}, amount);
    touched_allowances_.insert(std::make_pair(owner, spender));
  }

  // 创世/测试注资
  void mint(const Address &to, const U256 &amount) {
    set(balances_, to, checked_add(balance_of(to), amount, "collateral supply"));
    touched_holders_.insert(to);
  }

  U256 balance_of(const Address &owner) const {
    auto it = balances_.find(owner);
    return it == balances_.end() ? U256(0) : it->second;
  }

  U256 allowance(const Address &owner, const Address &spender) const {
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? U256(0) : it->second;
  }

  const std::map<Address, U256> &balances() const { return balances_; }
  const std::map<std::pair<Address, Address>, U256> &allowances() const { return allowances_; }

  // 自上次落盘以来改过的 holder / (owner, spender)
  const std::set<Address> &touched_holders() const { return touched_holders_; }
  const std::set<std::pair<Address, Address>> &touched_allowances() const {
    return touched_allowances_;
  }
  void clear_touched() {
    touched_holders_.clear();
    touched_allowances_.clear();
  }

private:
  bool can_receive(const Address &from, const Address &to, const U256 &amount) const {
    return from == to || balance_of(to) <= std::numeric_limits<U256>::max() - amount;
  }

  void move(const Address &from, const Address &to, const U256 &amount) {
    set(balances_, from, balance_of(from) - amount);
    set(balances_, to, balance_of(to) + amount);
    touched_holders_.insert(from);
    touched_holders_.insert(to);
  }

  template <typename K>
  void set(std::map<K, U256> &m, const K &k, const U256 &value) {
    auto it = m.find(k);
    U256 prev = it == m.end() ? U256(0) : it->second;
    journal_.record([&m, k, prev]() {
      if (prev.is_zero())
        m.erase(k);
      else
        m[k] = prev;
    });
    if (value.is_zero())
      m.erase(k);
    else
      m[k] = value;
  }

  Journal &journal_;
  std::map<Address, U256> balances_;
  std::map<std::pair<Address, Address>, U256> allowances_;
  std::set<Address> touched_holders_;
  std::set<std::pair<Address, Address>> touched_allowances_;
};

// 进程内持有的全部 InMemoryCollateral, 按地址索引
class CollateralBank {
public:
  explicit CollateralBank(Journal &journal) : journal_(journal) {}

  InMemoryCollateral &get_or_create(const Address &token_addr) {
    auto it = tokens_.find(token_addr);
    if (it == tokens_.end())
      it = tokens_.emplace(token_addr, std::make_unique<InMemoryCollateral>(journal_)).first;
    return *it->second;
  }

  InMemoryCollateral *find(const Address &token_addr) const {
    auto it = tokens_.find(token_addr);
    return it == tokens_.end() ? nullptr : it->second.get();
  }

  const std::map<Address, std::unique_ptr<InMemoryCollateral>> &tokens() const { return tokens_; }

private:
  Journal &journal_;
  std::map<Address, std::unique_ptr<InMemoryCollateral>> tokens_;
};

} // namespace ledger
