#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace x1memo::util {

// Runs |task(index)| for every index in [begin, end) on at most |max_workers|
// threads. Indices are handed out in ascending order; completion order is
// unspecified. |task| must be safe to invoke concurrently and is expected to
// handle its own per-index failures. An exception escaping |task| stops the
// remaining work and is rethrown on the calling thread.
template <typename Task>
void ForEachBounded(std::uint64_t begin, std::uint64_t end, std::size_t max_workers,
                    Task&& task) {
  if (end <= begin) {
    return;
  }
  const std::uint64_t count = end - begin;
  std::size_t workers = std::max<std::size_t>(1, max_workers);
  if (count < workers) {
    workers = static_cast<std::size_t>(count);
  }
  std::atomic<std::uint64_t> next{begin};
  std::atomic<bool> stop{false};
  std::exception_ptr failure;
  std::mutex failure_mutex;

  auto worker = [&]() {
    while (!stop.load()) {
      const std::uint64_t index = next.fetch_add(1);
      if (index >= end) {
        return;
      }
      try {
        task(index);
      } catch (...) {
        std::lock_guard<std::mutex> lock(failure_mutex);
        if (!failure) {
          failure = std::current_exception();
        }
        stop.store(true);
        return;
      }
    }
  };

  if (workers == 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }
  if (failure) {
    std::rethrow_exception(failure);
  }
}

}  // namespace x1memo::util
