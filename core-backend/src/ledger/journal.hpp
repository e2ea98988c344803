#pragma once

// ============================================================================
// Journal - 撤销日志 + 待投递事件
//
// 每个修改先记录 undo 闭包; Transaction 析构时若未 commit 则回滚到进入时的
// mark. 嵌套事务共用同一 journal, 只有最外层 commit 才清空 undo 并投递事件.
// ============================================================================

#include "events.hpp"

#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace ledger {

class Journal {
public:
  explicit Journal(EventSink *sink = nullptr) : sink_(sink) {}

  Journal(const Journal &) = delete;
  Journal &operator=(const Journal &) = delete;

  void set_sink(EventSink *sink) { sink_ = sink; }

  // 不在事务内的修改 (例如启动时加载快照) 不需要撤销
  void record(std::function<void()> undo) {
    if (depth_ > 0)
      undo_.push_back(std::move(undo));
  }

  void emit(Event e) { pending_.push_back(std::move(e)); }

  int depth() const { return depth_; }

  // 已发出但尚未投递的事件 (最外层 commit 前可见)
  const std::vector<Event> &pending() const { return pending_; }

private:
  friend class Transaction;

  void rollback_to(size_t undo_mark, size_t event_mark) {
    while (undo_.size() > undo_mark) {
      auto undo = std::move(undo_.back());
      undo_.pop_back();
      undo();
    }
    pending_.erase(pending_.begin() + static_cast<std::ptrdiff_t>(event_mark), pending_.end());
  }

  void flush() {
    undo_.clear();
    auto events = std::move(pending_);
    pending_.clear();
    if (!sink_)
      return;
    for (const auto &e : events)
      sink_->on_event(e);
  }

  EventSink *sink_;
  int depth_ = 0;
  std::vector<std::function<void()>> undo_;
  std::vector<Event> pending_;
};

class Transaction {
public:
  explicit Transaction(Journal &j)
      : j_(j), undo_mark_(j.undo_.size()), event_mark_(j.pending_.size()) {
    ++j_.depth_;
  }

  ~Transaction() {
    if (!committed_) {
      j_.rollback_to(undo_mark_, event_mark_);
      --j_.depth_;
    }
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    committed_ = true;
    if (--j_.depth_ == 0)
      j_.flush();
  }

private:
  Journal &j_;
  size_t undo_mark_;
  size_t event_mark_;
  bool committed_ = false;
};

} // namespace ledger
