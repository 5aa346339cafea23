#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "primitives/transaction.hpp"

namespace ctwallet::consensus {

inline constexpr std::uint32_t kSighashAll = 0x01;
inline constexpr std::uint32_t kSighashSingle = 0x03;
inline constexpr std::uint32_t kSighashAnyoneCanPay = 0x80;

// Elements segwit v0 signature hash: BIP-143 extended with hashIssuance,
// the confidential amount of the spent output and per-input issuance data.
// `script_code` excludes its length prefix. ALL and SINGLE are supported,
// each optionally with ANYONECANPAY; anything else throws.
std::array<std::uint8_t, 32> ComputeSegwitV0Sighash(const primitives::Transaction& tx,
                                                    std::size_t input_index,
                                                    std::span<const std::uint8_t> script_code,
                                                    const primitives::ConfidentialValue& spent_value,
                                                    std::uint32_t hash_type = kSighashAll);

}  // namespace ctwallet::consensus
