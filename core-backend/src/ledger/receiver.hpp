#pragma once

// ============================================================================
// 接收方回调 - safe transfer 的目标若登记了 receiver, 必须返回固定 selector
// ============================================================================

#include "types.hpp"

#include <map>
#include <vector>

namespace ledger {

// bytes4(keccak256("onERC1155Received(address,address,uint256,uint256,bytes)"))
static constexpr uint32_t ON_RECEIVED_SELECTOR = 0xf23a6e61;
// bytes4(keccak256("onERC1155BatchReceived(address,address,uint256[],uint256[],bytes)"))
static constexpr uint32_t ON_BATCH_RECEIVED_SELECTOR = 0xbc197c81;

class TokenReceiver {
public:
  virtual ~TokenReceiver() = default;

  virtual uint32_t on_received(const Address &op, const Address &from, const U256 &id,
                               const U256 &value, const Bytes &data) = 0;

  virtual uint32_t on_batch_received(const Address &op, const Address &from,
                                     const std::vector<U256> &ids,
                                     const std::vector<U256> &values, const Bytes &data) = 0;
};

// 未登记的地址视为普通账户, 不回调
class ReceiverDirectory {
public:
  void add(const Address &addr, TokenReceiver *receiver) { receivers_[addr] = receiver; }
  void remove(const Address &addr) { receivers_.erase(addr); }

  TokenReceiver *find(const Address &addr) const {
    auto it = receivers_.find(addr);
    return it == receivers_.end() ? nullptr : it->second;
  }

private:
  std::map<Address, TokenReceiver *> receivers_;
};

} // namespace ledger
