#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ledger {

enum class Errc : uint8_t {
  AlreadyPrepared,
  InvalidOutcomeCount,
  MalformedResult,
  OutcomeCountMismatch,
  AlreadyResolved,
  PayoutAlreadySet,
  AllZeroPayout,
  ConditionNotPrepared,
  InsufficientBalance,
  InsufficientAllowance,
  StaleApproval,
  CollateralTransferFailed,
  TransferRejectedByReceiver,
  ResultNotReceived,
  Overflow,
  LengthMismatch,
};

inline const char *errc_name(Errc e) {
  switch (e) {
  case Errc::AlreadyPrepared:
    return "AlreadyPrepared";
  case Errc::InvalidOutcomeCount:
    return "InvalidOutcomeCount";
  case Errc::MalformedResult:
    return "MalformedResult";
  case Errc::OutcomeCountMismatch:
    return "OutcomeCountMismatch";
  case Errc::AlreadyResolved:
    return "AlreadyResolved";
  case Errc::PayoutAlreadySet:
    return "PayoutAlreadySet";
  case Errc::AllZeroPayout:
    return "AllZeroPayout";
  case Errc::ConditionNotPrepared:
    return "ConditionNotPrepared";
  case Errc::InsufficientBalance:
    return "InsufficientBalance";
  case Errc::InsufficientAllowance:
    return "InsufficientAllowance";
  case Errc::StaleApproval:
    return "StaleApproval";
  case Errc::CollateralTransferFailed:
    return "CollateralTransferFailed";
  case Errc::TransferRejectedByReceiver:
    return "TransferRejectedByReceiver";
  case Errc::ResultNotReceived:
    return "ResultNotReceived";
  case Errc::Overflow:
    return "Overflow";
  case Errc::LengthMismatch:
    return "LengthMismatch";
  }
  return "Unknown";
}

// 所有业务失败: 同步抛出, 整个操作回滚
class LedgerError : public std::runtime_error {
public:
  LedgerError(Errc code, const std::string &detail)
      : std::runtime_error(std::string(errc_name(code)) + ": " + detail), code_(code) {}

  Errc code() const { return code_; }
  const char *name() const { return errc_name(code_); }

private:
  Errc code_;
};

} // namespace ledger
