#pragma once

// ============================================================================
// 标识符推导
//
// conditionId = H(oracle ‖ questionId ‖ uint256(outcomeSlotCount))
// slotId      = parentSlotId + H(conditionId ‖ uint256(index))   (mod 2^256)
// positionKey = H(collateral ‖ slotId)
//
// slotId == 0 表示 root (原始抵押品). 不同路径组合后可以落在同一 slotId,
// 例如 (A:0 然后 B:1) 与 (B:1 然后 A:0) 得到相同结果.
// ============================================================================

#include "hash.hpp"
#include "types.hpp"

#include <utility>
#include <vector>

namespace ledger {

inline const U256 ROOT_SLOT = 0;

// 一步嵌套: (conditionId, outcome index)
struct SlotStep {
  Bytes32 condition_id;
  uint64_t index = 0;
};

inline Bytes32 condition_id(const Address &oracle, const Bytes32 &question_id,
                            uint64_t outcome_slot_count) {
  return sha3_256(Packer().address(oracle).bytes32(question_id).word(outcome_slot_count));
}

inline U256 payout_slot_id(const U256 &parent_slot_id, const Bytes32 &cond_id, uint64_t index) {
  U256 term = bytes_to_word(sha3_256(Packer().bytes32(cond_id).word(index)));
  return parent_slot_id + term;
}

// 迭代折叠, 不递归
inline U256 nested_slot_id(U256 slot, const std::vector<SlotStep> &steps) {
  for (const auto &s : steps)
    slot = payout_slot_id(slot, s.condition_id, s.index);
  return slot;
}

inline U256 position_key(const Address &collateral, const U256 &slot_id) {
  return bytes_to_word(sha3_256(Packer().address(collateral).word(slot_id)));
}

} // namespace ledger
