#pragma once

#include <cstddef>
#include <functional>

namespace ctwallet::util {

// Fans a batch of independent jobs out to at most `max_workers` threads and
// joins all of them before returning. The first exception thrown by a job
// stops further jobs from starting and is rethrown after the join.
class BoundedWorkerPool {
 public:
  explicit BoundedWorkerPool(std::size_t max_workers);

  void ForEach(std::size_t count, const std::function<void(std::size_t)>& job) const;

  std::size_t max_workers() const noexcept { return max_workers_; }

 private:
  std::size_t max_workers_;
};

}  // namespace ctwallet::util
