// bird_typefix/driver/worker_pool.hpp - Fixed-size parallel loop
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>
#include <vector>

namespace bird_typefix
{

/// Number of workers for `count` tasks; `jobs == 0` means hardware concurrency.
[[nodiscard]] inline size_t worker_count(size_t count, uint32_t jobs)
{
  size_t n = jobs;
  if (n == 0) {
    n = std::thread::hardware_concurrency();
  }
  if (n == 0) {
    n = 2;
  }
  return std::max<size_t>(1, std::min(n, count));
}

/**
 * Call fn(i) for every i in [0, count), spread over worker threads.
 *
 * Indices are handed out through an atomic counter; fn must not throw and
 * must only touch state owned by index i.
 */
template <typename Fn>
void parallel_for(size_t count, uint32_t jobs, Fn && fn)
{
  if (count == 0) {
    return;
  }

  const size_t nthreads = worker_count(count, jobs);
  if (nthreads == 1) {
    for (size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  std::atomic<size_t> next(0);
  std::vector<std::thread> threads;
  threads.reserve(nthreads);
  for (size_t t = 0; t < nthreads; ++t) {
    threads.emplace_back([&]() {
      size_t i;
      while ((i = next.fetch_add(1)) < count) {
        fn(i);
      }
    });
  }
  for (auto & th : threads) {
    th.join();
  }
}

}  // namespace bird_typefix
