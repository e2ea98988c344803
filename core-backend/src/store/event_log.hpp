#pragma once

// ============================================================================
// EventLog - 已提交事件 → 控制台 + 待写入的 INSERT 语句
//
// 语句先缓存, 由 LedgerStore::save 与状态快照放在同一个 DuckDB 事务里落盘.
// 服务层在 commit 之前用 render() 把 journal 里的事件一起写入,
// 之后 commit 投递过来的事件只记日志不再缓存 (mark_saved).
// ============================================================================

#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../ledger/events.hpp"

class EventLog : public ledger::EventSink {
public:
  explicit EventLog(int64_t next_seq = 1, bool verbose = true)
      : next_seq_(next_seq), verbose_(verbose) {}

  void on_event(const ledger::Event &e) override {
    int64_t seq = next_seq_++;
    if (saved_ahead_ > 0)
      --saved_ahead_;
    else
      std::visit([&](const auto &ev) { append(pending_, seq, ev); }, e);
    if (verbose_)
      std::cout << "[Ledger] #" << seq << " " << ledger::event_name(e) << std::endl;
  }

  // 落盘成功后才清空, 失败的话下次 save 重试
  const std::vector<std::string> &pending() const { return pending_; }
  void clear_pending() { pending_.clear(); }

  // 尚未投递的事件, 按投递后的 seq 编号
  std::vector<std::string> render(const std::vector<ledger::Event> &events) const {
    std::vector<std::string> rows;
    int64_t seq = next_seq_;
    for (const auto &e : events) {
      std::visit([&](const auto &ev) { append(rows, seq, ev); }, e);
      ++seq;
    }
    return rows;
  }

  // 接下来 n 个事件已随快照落盘
  void mark_saved(size_t n) { saved_ahead_ = n; }

  int64_t next_seq() const { return next_seq_; }
  void set_next_seq(int64_t seq) { next_seq_ = seq; }

private:
  using Rows = std::vector<std::string>;

  static std::string q(const std::string &s) { return "'" + s + "'"; }
  static std::string dec(const ledger::U256 &v) { return q(ledger::word_dec(v)); }
  static std::string hex(const ledger::U256 &v) { return q(ledger::word_hex(v)); }
  template <size_t N>
  static std::string hex(const ledger::FixedBytes<N> &b) {
    return q(b.hex());
  }

  static void append(Rows &out, int64_t seq, const ledger::ConditionPreparation &e) {
    std::ostringstream ss;
    ss << "INSERT INTO condition_preparation VALUES (" << seq << ", " << hex(e.condition_id)
       << ", " << hex(e.oracle) << ", " << hex(e.question_id) << ", " << e.outcome_slot_count
       << ")";
    out.push_back(ss.str());
  }

  static void append(Rows &out, int64_t seq, const ledger::ConditionResolution &e) {
    std::ostringstream ss;
    ss << "INSERT INTO condition_resolution VALUES (" << seq << ", " << hex(e.condition_id)
       << ", " << hex(e.oracle) << ", " << hex(e.question_id) << ", " << e.outcome_slot_count
       << ", " << q(ledger::to_hex(e.result)) << ")";
    out.push_back(ss.str());
  }

  // split / merge 同构
  template <typename E>
  static void append_position(Rows &out, const char *table, int64_t seq, const E &e) {
    std::ostringstream ss;
    ss << "INSERT INTO " << table << " VALUES (" << seq << ", " << hex(e.stakeholder) << ", "
       << hex(e.collateral) << ", " << hex(e.parent_slot_id) << ", " << hex(e.condition_id)
       << ", " << dec(e.amount) << ")";
    out.push_back(ss.str());
  }

  static void append(Rows &out, int64_t seq, const ledger::PositionSplit &e) {
    append_position(out, "position_split", seq, e);
  }
  static void append(Rows &out, int64_t seq, const ledger::PositionMerge &e) {
    append_position(out, "position_merge", seq, e);
  }

  static void append(Rows &out, int64_t seq, const ledger::PayoutRedemption &e) {
    std::ostringstream ss;
    ss << "INSERT INTO payout_redemption VALUES (" << seq << ", " << hex(e.redeemer) << ", "
       << hex(e.collateral) << ", " << hex(e.parent_slot_id) << ", " << hex(e.condition_id)
       << ", " << dec(e.payout) << ")";
    out.push_back(ss.str());
  }

  static void append(Rows &out, int64_t seq, const ledger::Transfer &e) {
    append_transfer(out, seq, 0, e.op, e.from, e.to, e.id, e.value);
  }

  static void append(Rows &out, int64_t seq, const ledger::TransferBatch &e) {
    for (size_t i = 0; i < e.ids.size(); ++i)
      append_transfer(out, seq, i, e.op, e.from, e.to, e.ids[i], e.values[i]);
  }

  static void append(Rows &out, int64_t seq, const ledger::Approval &e) {
    std::ostringstream ss;
    ss << "INSERT INTO approval VALUES (" << seq << ", " << hex(e.owner) << ", " << hex(e.spender)
       << ", " << hex(e.id) << ", " << dec(e.value) << ")";
    out.push_back(ss.str());
  }

  static void append_transfer(Rows &out, int64_t seq, size_t batch_index,
                              const ledger::Address &op, const ledger::Address &from,
                              const ledger::Address &to, const ledger::U256 &id,
                              const ledger::U256 &value) {
    std::ostringstream ss;
    ss << "INSERT INTO transfer VALUES (" << seq << ", " << batch_index << ", " << hex(op) << ", "
       << hex(from) << ", " << hex(to) << ", " << hex(id) << ", " << dec(value) << ")";
    out.push_back(ss.str());
  }

  int64_t next_seq_;
  bool verbose_;
  size_t saved_ahead_ = 0;
  std::vector<std::string> pending_;
};
