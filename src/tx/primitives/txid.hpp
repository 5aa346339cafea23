#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "primitives/transaction.hpp"

namespace ctwallet::primitives {

// Double SHA-256 of the witness-stripped serialization.
Hash256 ComputeTxId(const Transaction& tx);
Hash256 ComputeWTxId(const Transaction& tx);

// Hex in display (byte-reversed) order, as used by Electrum servers.
std::string TxIdToHex(const Hash256& txid);

}  // namespace ctwallet::primitives
