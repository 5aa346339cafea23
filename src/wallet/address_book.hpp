#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "wallet/key_ring.hpp"

namespace ctwallet::wallet {

struct Address {
  Chain chain{Chain::kExternal};
  std::uint32_t index{0};
  std::vector<std::uint8_t> script_pubkey;
  crypto::CompressedPublicKey blinding_pubkey{};
  std::string confidential;    // what users are given
  std::string unconfidential;  // same script, no blinding key
  std::string scripthash;      // Electrum subscription key

  bool operator==(const Address&) const = default;
};

// Cache of derived addresses plus the per-chain "first unused" watermark.
// Every entry can be rebuilt from the KeyRing alone.
class AddressBook {
 public:
  explicit AddressBook(const KeyRing& keys);

  Address AddressFor(Chain chain, std::uint32_t index);
  // First unused index plus `offset`. Repeated calls return the same address
  // until sync (or a built transaction) marks it used.
  Address NextUnusedAddress(Chain chain, std::uint32_t offset = 0);
  // Indices 0..high_watermark inclusive.
  std::vector<Address> AllAddressesUpTo(Chain chain, std::uint32_t high_watermark);

  void MarkUsed(Chain chain, std::uint32_t index);
  std::uint32_t FirstUnusedIndex(Chain chain) const;
  // Restores watermarks loaded from the store; never moves them backwards.
  void RestoreWatermarks(std::uint32_t external_first_unused, std::uint32_t internal_first_unused);
  // Undoes MarkUsed calls whose effect was never persisted. Only lowers.
  void RewindWatermark(Chain chain, std::uint32_t first_unused);

  // Only searches addresses already derived.
  std::optional<Address> FindByScript(std::span<const std::uint8_t> script_pubkey) const;
  std::optional<Address> FindByScripthash(const std::string& scripthash) const;

 private:
  Address DeriveLocked(Chain chain, std::uint32_t index);

  const KeyRing& keys_;
  mutable std::mutex mutex_;
  std::array<std::map<std::uint32_t, Address>, 2> cache_{};
  std::map<std::vector<std::uint8_t>, std::pair<Chain, std::uint32_t>> by_script_;
  std::map<std::string, std::pair<Chain, std::uint32_t>> by_scripthash_;
  std::array<std::uint32_t, 2> first_unused_{0, 0};
};

}  // namespace ctwallet::wallet
