#include "primitives/txid.hpp"

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/hex.hpp"

namespace ctwallet::primitives {

Hash256 ComputeTxId(const Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/false);
  return crypto::DoubleSha256(buffer);
}

Hash256 ComputeWTxId(const Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/true);
  return crypto::DoubleSha256(buffer);
}

std::string TxIdToHex(const Hash256& txid) { return util::HexEncodeReversed(txid); }

}  // namespace ctwallet::primitives
