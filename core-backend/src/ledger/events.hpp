#pragma once

// ============================================================================
// 事件 - 只在最外层事务提交后投递给 EventSink
// ============================================================================

#include "types.hpp"

#include <variant>
#include <vector>

namespace ledger {

struct ConditionPreparation {
  Bytes32 condition_id;
  Address oracle;
  Bytes32 question_id;
  uint64_t outcome_slot_count = 0;
};

struct ConditionResolution {
  Bytes32 condition_id;
  Address oracle;
  Bytes32 question_id;
  uint64_t outcome_slot_count = 0;
  Bytes result; // 原始上报字节, 供审计
};

struct PositionSplit {
  Address stakeholder;
  Address collateral;
  U256 parent_slot_id;
  Bytes32 condition_id;
  U256 amount;
};

struct PositionMerge {
  Address stakeholder;
  Address collateral;
  U256 parent_slot_id;
  Bytes32 condition_id;
  U256 amount;
};

struct PayoutRedemption {
  Address redeemer;
  Address collateral;
  U256 parent_slot_id;
  Bytes32 condition_id;
  U256 payout;
};

struct Transfer {
  Address op;
  Address from;
  Address to;
  U256 id;
  U256 value;
};

struct TransferBatch {
  Address op;
  Address from;
  Address to;
  std::vector<U256> ids;
  std::vector<U256> values;
};

struct Approval {
  Address owner;
  Address spender;
  U256 id;
  U256 value;
};

using Event = std::variant<ConditionPreparation, ConditionResolution, PositionSplit,
                           PositionMerge, PayoutRedemption, Transfer, TransferBatch, Approval>;

inline const char *event_name(const Event &e) {
  static const char *names[] = {"ConditionPreparation", "ConditionResolution", "PositionSplit",
                                "PositionMerge", "PayoutRedemption", "Transfer",
                                "TransferBatch", "Approval"};
  return names[e.index()];
}

class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void on_event(const Event &e) = 0;
};

} // namespace ledger
