#include "wallet/reservations.hpp"

namespace ctwallet::wallet {

bool UtxoReservations::Reserve(std::span<const primitives::OutPoint> outpoints) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& outpoint : outpoints) {
    if (reserved_.count(outpoint) != 0) {
      return false;
    }
  }
  reserved_.insert(outpoints.begin(), outpoints.end());
  return true;
}

void UtxoReservations::Release(std::span<const primitives::OutPoint> outpoints) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& outpoint : outpoints) {
    reserved_.erase(outpoint);
  }
}

void UtxoReservations::Prune(const std::set<primitives::OutPoint>& unspent) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = reserved_.begin(); it != reserved_.end();) {
    if (unspent.count(*it) == 0) {
      it = reserved_.erase(it);
    } else {
      ++it;
    }
  }
}

bool UtxoReservations::IsReserved(const primitives::OutPoint& outpoint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_.count(outpoint) != 0;
}

std::set<primitives::OutPoint> UtxoReservations::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return reserved_;
}

}  // namespace ctwallet::wallet
