// src/batch.cpp
#include "npp/log.hpp"
#include "npp/npp.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <mpfr.h>

namespace npp {
namespace {

template <typename Index>
std::vector<PredictResult> run_batch(const std::vector<Index> &n,
                                     const PredictConfig &cfg,
                                     unsigned threads) {
  std::vector<PredictResult> results(n.size());
  if (n.empty())
    return results;

  if (threads == 0)
    threads = std::max(1u, std::thread::hardware_concurrency());
  threads = static_cast<unsigned>(
      std::min<std::size_t>(threads, n.size()));

  std::atomic<std::size_t> cursor{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto drain = [&] {
    for (;;) {
      if (failed.load(std::memory_order_relaxed))
        return;
      const std::size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
      if (i >= n.size())
        return;
      try {
        results[i] = predict(n[i], cfg);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error)
          first_error = std::current_exception();
        failed.store(true, std::memory_order_relaxed);
        return;
      }
    }
  };
  auto worker = [&] {
    drain();
    mpfr_free_cache(); // per-thread constant caches (gamma, log 2)
  };

  logger()->debug("predict_batch: {} indices on {} threads", n.size(),
                  threads);
  std::vector<std::thread> workers;
  workers.reserve(threads);
  for (unsigned t = 0; t < threads; ++t)
    workers.emplace_back(worker);
  for (auto &th : workers)
    th.join();

  if (first_error)
    std::rethrow_exception(first_error);
  return results;
}

} // namespace

std::vector<PredictResult> predict_batch(const std::vector<std::int64_t> &n,
                                         const PredictConfig &cfg,
                                         unsigned threads) {
  return run_batch(n, cfg, threads);
}

std::vector<PredictResult> predict_batch(const std::vector<std::string> &n,
                                         const PredictConfig &cfg,
                                         unsigned threads) {
  return run_batch(n, cfg, threads);
}

} // namespace npp
