#include "util/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace ctwallet::util {

BoundedWorkerPool::BoundedWorkerPool(std::size_t max_workers)
    : max_workers_(std::max<std::size_t>(1, max_workers)) {}

void BoundedWorkerPool::ForEach(std::size_t count,
                                const std::function<void(std::size_t)>& job) const {
  if (count == 0) {
    return;
  }
  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&]() {
    while (!failed.load(std::memory_order_acquire)) {
      const std::size_t index = next.fetch_add(1, std::memory_order_relaxed);
      if (index >= count) {
        return;
      }
      try {
        job(index);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed.store(true, std::memory_order_release);
        return;
      }
    }
  };

  const std::size_t workers = std::min(max_workers_, count);
  if (workers == 1) {
    worker();
  } else {
    std::vector<std::jthread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker);
    }
  }  // jthreads join here
  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace ctwallet::util
