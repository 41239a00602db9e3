// seiri/basic/parallel.hpp - Minimal index-based worker pool
//
// Workers pull indices from a shared atomic counter until the range is
// exhausted. Callers write results into pre-sized per-index slots, so no
// locking is needed around the results.
//
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace seiri
{

/// Resolve a requested worker count (0 = hardware concurrency, at least 1).
[[nodiscard]] inline unsigned effective_jobs(unsigned requested) noexcept
{
  if (requested > 0) {
    return requested;
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? hw : 1U;
}

/**
 * Invoke fn(i) for every i in [0, count) on up to `jobs` threads.
 *
 * The first exception thrown by any invocation is rethrown on the calling
 * thread after all workers have joined.
 */
template <typename Fn>
void parallel_for(size_t count, unsigned jobs, Fn && fn)
{
  if (count == 0) {
    return;
  }

  const size_t worker_count = std::min<size_t>(effective_jobs(jobs), count);
  if (worker_count <= 1) {
    for (size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  std::atomic<bool> stop{false};
  std::vector<std::exception_ptr> errors(worker_count);
  std::vector<std::thread> workers;
  workers.reserve(worker_count);

  for (size_t w = 0; w < worker_count; ++w) {
    workers.emplace_back([&, w]() {
      while (!stop.load(std::memory_order_relaxed)) {
        const size_t i = next.fetch_add(1);
        if (i >= count) {
          break;
        }
        try {
          fn(i);
        } catch (...) {
          errors[w] = std::current_exception();
          stop.store(true, std::memory_order_relaxed);
        }
      }
    });
  }

  for (auto & t : workers) {
    t.join();
  }

  for (const auto & e : errors) {
    if (e) {
      std::rethrow_exception(e);
    }
  }
}

}  // namespace seiri
