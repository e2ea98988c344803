#pragma once

// ============================================================================
// LedgerStore - 账本状态 <-> DuckDB
//
// save: 事件 INSERT + 改过的状态行 (DELETE/INSERT) + meta, 放在一个事务里
// load: 启动时按表恢复; 发生在事务外, 不产生 undo 记录
// ============================================================================

#include "../core/database.hpp"
#include "../ledger/ledger.hpp"
#include "event_log.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

class LedgerStore {
public:
  explicit LedgerStore(Database &db) : db_(db) {}

  // staged: 外层 Transaction 里尚未投递的事件, 与状态改动同一事务写入.
  // 失败时抛出, 由调用方回滚账本.
  void save(ledger::Ledger &l, ledger::CollateralBank &bank, EventLog &log,
            const std::vector<ledger::Event> &staged = {}) {
    std::vector<std::string> stmts = log.pending();
    for (auto &row : log.render(staged))
      stmts.push_back(std::move(row));
    size_t event_rows = stmts.size();

    auto &st = l.state();
    const auto &touched = st.touched();

    for (const auto &id : touched.conditions) {
      std::string key = q(id.hex());
      stmts.push_back("DELETE FROM condition WHERE condition_id = " + key);
      stmts.push_back("DELETE FROM payout_numerator WHERE condition_id = " + key);
      stmts.push_back("DELETE FROM payout_denominator WHERE condition_id = " + key);

      const auto *rec = st.find_condition(id);
      if (!rec)
        continue;
      std::ostringstream ss;
      ss << "INSERT INTO condition VALUES (" << key << ", " << q(rec->oracle.hex()) << ", "
         << q(rec->question_id.hex()) << ", " << rec->outcome_slot_count << ")";
      stmts.push_back(ss.str());

      const auto &slots = st.numerators(id);
      for (size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].is_zero())
          continue;
        std::ostringstream ns;
        ns << "INSERT INTO payout_numerator VALUES (" << key << ", " << i << ", "
           << q(ledger::word_dec(slots[i])) << ")";
        stmts.push_back(ns.str());
      }

      auto den = st.denominator(id);
      if (!den.is_zero())
        stmts.push_back("INSERT INTO payout_denominator VALUES (" + key + ", " +
                        q(ledger::word_dec(den)) + ")");
    }

    for (const auto &[owner, id] : touched.balances) {
      stmts.push_back("DELETE FROM position_balance WHERE owner = " + q(owner.hex()) +
                      " AND position_id = " + q(ledger::word_hex(id)));
      auto amount = st.balance(owner, id);
      if (!amount.is_zero())
        stmts.push_back("INSERT INTO position_balance VALUES (" + q(owner.hex()) + ", " +
                        q(ledger::word_hex(id)) + ", " + q(ledger::word_dec(amount)) + ")");
    }

    for (const auto &[id, owner, spender] : touched.allowances) {
      stmts.push_back("DELETE FROM allowance WHERE position_id = " + q(ledger::word_hex(id)) +
                      " AND owner = " + q(owner.hex()) + " AND spender = " + q(spender.hex()));
      auto amount = st.allowance(id, owner, spender);
      if (!amount.is_zero())
        stmts.push_back("INSERT INTO allowance VALUES (" + q(ledger::word_hex(id)) + ", " +
                        q(owner.hex()) + ", " + q(spender.hex()) + ", " +
                        q(ledger::word_dec(amount)) + ")");
    }

    for (const auto &[token, coll] : bank.tokens()) {
      std::string t = q(token.hex());
      for (const auto &holder : coll->touched_holders()) {
        stmts.push_back("DELETE FROM collateral_balance WHERE token = " + t +
                        " AND holder = " + q(holder.hex()));
        auto amount = coll->balance_of(holder);
        if (!amount.is_zero())
          stmts.push_back("INSERT INTO collateral_balance VALUES (" + t + ", " + q(holder.hex()) +
                          ", " + q(ledger::word_dec(amount)) + ")");
      }
      for (const auto &[owner, spender] : coll->touched_allowances()) {
        stmts.push_back("DELETE FROM collateral_allowance WHERE token = " + t + " AND owner = " +
                        q(owner.hex()) + " AND spender = " + q(spender.hex()));
        auto amount = coll->allowance(owner, spender);
        if (!amount.is_zero())
          stmts.push_back("INSERT INTO collateral_allowance VALUES (" + t + ", " + q(owner.hex()) +
                          ", " + q(spender.hex()) + ", " + q(ledger::word_dec(amount)) + ")");
      }
    }

    int64_t next_seq = log.next_seq() + static_cast<int64_t>(staged.size());
    stmts.push_back(meta("event_seq", std::to_string(next_seq)));
    stmts.push_back(meta("initialized", "1"));

    db_.atomic_execute(stmts);

    log.clear_pending();
    log.mark_saved(staged.size());
    st.clear_touched();
    for (const auto &[token, coll] : bank.tokens())
      coll->clear_touched();

    if (event_rows > 0)
      std::cout << "[Store] 已保存 " << event_rows << " 条事件, "
                << st.all_balances().size() << " 个持仓" << std::endl;
  }

  // 库里没有快照返回 false
  bool load(ledger::Ledger &l, ledger::CollateralBank &bank, EventLog &log) {
    if (db_.get_meta("initialized") != "1")
      return false;

    auto &st = l.state();

    for (const auto &row : db_.query_json("SELECT * FROM condition")) {
      auto id = ledger::Bytes32::from_hex(row["condition_id"].get<std::string>());
      uint64_t count = row["outcome_slot_count"].get<uint64_t>();
      st.put_condition(id, ledger::ConditionRecord{
                               ledger::Address::from_hex(row["oracle"].get<std::string>()),
                               ledger::Bytes32::from_hex(row["question_id"].get<std::string>()),
                               count});
      st.init_numerators(id, count);
    }

    for (const auto &row : db_.query_json("SELECT * FROM payout_numerator"))
      st.set_numerator(ledger::Bytes32::from_hex(row["condition_id"].get<std::string>()),
                       row["outcome_index"].get<size_t>(), word(row["numerator"]));

    for (const auto &row : db_.query_json("SELECT * FROM payout_denominator"))
      st.set_denominator(ledger::Bytes32::from_hex(row["condition_id"].get<std::string>()),
                         word(row["denominator"]));

    for (const auto &row : db_.query_json("SELECT * FROM position_balance"))
      st.set_balance(addr(row["owner"]), word(row["position_id"]), word(row["amount"]));

    for (const auto &row : db_.query_json("SELECT * FROM allowance"))
      st.set_allowance(word(row["position_id"]), addr(row["owner"]), addr(row["spender"]),
                       word(row["amount"]));

    for (const auto &row : db_.query_json("SELECT * FROM collateral_balance"))
      token(l, bank, row["token"]).mint(addr(row["holder"]), word(row["amount"]));

    for (const auto &row : db_.query_json("SELECT * FROM collateral_allowance"))
      token(l, bank, row["token"]).approve(addr(row["owner"]), addr(row["spender"]),
                                           word(row["amount"]));

    std::string seq = db_.get_meta("event_seq");
    if (!seq.empty())
      log.set_next_seq(std::stoll(seq));

    st.clear_touched();
    for (const auto &[token, coll] : bank.tokens())
      coll->clear_touched();

    std::cout << "[Store] 已加载 " << st.conditions().size() << " 个 condition, "
              << st.all_balances().size() << " 个持仓, " << bank.tokens().size()
              << " 种抵押品" << std::endl;
    return true;
  }

private:
  static std::string q(const std::string &s) { return "'" + s + "'"; }

  static std::string meta(const std::string &key, const std::string &value) {
    return "INSERT OR REPLACE INTO ledger_meta VALUES (" + q(key) + ", " + q(value) + ")";
  }

  static ledger::U256 word(const json &v) { return ledger::parse_word(v.get<std::string>()); }
  static ledger::Address addr(const json &v) {
    return ledger::Address::from_hex(v.get<std::string>());
  }

  static ledger::InMemoryCollateral &token(ledger::Ledger &l, ledger::CollateralBank &bank,
                                           const json &v) {
    auto a = addr(v);
    auto &t = bank.get_or_create(a);
    l.add_collateral(a, &t);
    return t;
  }

  Database &db_;
};
