#pragma once

#include <mutex>
#include <set>
#include <utility>
#include <span>
#include <vector>

#include "primitives/transaction.hpp"

namespace ctwallet::wallet {

// Outpoints promised to a build. A reserved outpoint is invisible to coin
// selection until it is released or observed spent.
class UtxoReservations {
 public:
  // All-or-nothing. Returns false if any outpoint is already reserved.
  bool Reserve(std::span<const primitives::OutPoint> outpoints);
  void Release(std::span<const primitives::OutPoint> outpoints);
  // Drops reservations for outpoints no longer in `unspent`.
  void Prune(const std::set<primitives::OutPoint>& unspent);

  bool IsReserved(const primitives::OutPoint& outpoint) const;
  std::set<primitives::OutPoint> Snapshot() const;

 private:
  mutable std::mutex mutex_;
  std::set<primitives::OutPoint> reserved_;
};

// Releases its outpoints on destruction unless Commit() was called.
class ReservationGuard {
 public:
  ReservationGuard(UtxoReservations& reservations, std::vector<primitives::OutPoint> outpoints)
      : reservations_(reservations), outpoints_(std::move(outpoints)) {}
  ~ReservationGuard() {
    if (!committed_) {
      reservations_.Release(outpoints_);
    }
  }
  ReservationGuard(const ReservationGuard&) = delete;
  ReservationGuard& operator=(const ReservationGuard&) = delete;

  void Commit() noexcept { committed_ = true; }

 private:
  UtxoReservations& reservations_;
  std::vector<primitives::OutPoint> outpoints_;
  bool committed_{false};
};

}  // namespace ctwallet::wallet
