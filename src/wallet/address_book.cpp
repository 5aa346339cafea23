#include "wallet/address_book.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "crypto/confidential_address.hpp"
#include "script/script.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

namespace {

std::size_t Slot(Chain chain) { return static_cast<std::size_t>(chain); }

}  // namespace

AddressBook::AddressBook(const KeyRing& keys) : keys_(keys) {}

Address AddressBook::DeriveLocked(Chain chain, std::uint32_t index) {
  auto& cache = cache_[Slot(chain)];
  if (auto it = cache.find(index); it != cache.end()) {
    return it->second;
  }
  const auto pair = keys_.Derive(chain, index);
  Address address;
  address.chain = chain;
  address.index = index;
  address.script_pubkey = pair.script_pubkey;
  address.blinding_pubkey = pair.blinding_pubkey;
  script::ScriptHash160 script_hash{};
  if (!script::ExtractP2shHash(script::ScriptPubKey{pair.script_pubkey}, &script_hash)) {
    throw std::logic_error("derived script is not P2SH");
  }
  address.confidential =
      crypto::EncodeConfidentialAddress(keys_.network(), pair.blinding_pubkey, script_hash);
  address.unconfidential = crypto::EncodeUnconfidentialAddress(keys_.network(), script_hash);
  address.scripthash = script::ElectrumScriptHash(pair.script_pubkey);
  by_script_[address.script_pubkey] = {chain, index};
  by_scripthash_[address.scripthash] = {chain, index};
  cache.emplace(index, address);
  return address;
}

Address AddressBook::AddressFor(Chain chain, std::uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  return DeriveLocked(chain, index);
}

Address AddressBook::NextUnusedAddress(Chain chain, std::uint32_t offset) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t index = static_cast<std::uint64_t>(first_unused_[Slot(chain)]) + offset;
  if (index > kMaxDerivationIndex) {
    throw WalletError(ErrorCode::kDerivationRange, "address chain exhausted");
  }
  return DeriveLocked(chain, static_cast<std::uint32_t>(index));
}

std::vector<Address> AddressBook::AllAddressesUpTo(Chain chain, std::uint32_t high_watermark) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Address> out;
  out.reserve(static_cast<std::size_t>(high_watermark) + 1);
  for (std::uint32_t i = 0;; ++i) {
    out.push_back(DeriveLocked(chain, i));
    if (i == high_watermark) break;
  }
  return out;
}

void AddressBook::MarkUsed(Chain chain, std::uint32_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& first_unused = first_unused_[Slot(chain)];
  if (index >= first_unused && index < kMaxDerivationIndex) {
    first_unused = index + 1;
  }
}

std::uint32_t AddressBook::FirstUnusedIndex(Chain chain) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return first_unused_[Slot(chain)];
}

void AddressBook::RestoreWatermarks(std::uint32_t external_first_unused,
                                    std::uint32_t internal_first_unused) {
  std::lock_guard<std::mutex> lock(mutex_);
  first_unused_[0] = std::max(first_unused_[0], external_first_unused);
  first_unused_[1] = std::max(first_unused_[1], internal_first_unused);
}

void AddressBook::RewindWatermark(Chain chain, std::uint32_t first_unused) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& current = first_unused_[Slot(chain)];
  current = std::min(current, first_unused);
}

std::optional<Address> AddressBook::FindByScript(std::span<const std::uint8_t> script_pubkey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = by_script_.find(std::vector<std::uint8_t>(script_pubkey.begin(), script_pubkey.end()));
  if (it == by_script_.end()) {
    return std::nullopt;
  }
  return cache_[Slot(it->second.first)].at(it->second.second);
}

std::optional<Address> AddressBook::FindByScripthash(const std::string& scripthash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = by_scripthash_.find(scripthash);
  if (it == by_scripthash_.end()) {
    return std::nullopt;
  }
  return cache_[Slot(it->second.first)].at(it->second.second);
}

}  // namespace ctwallet::wallet
