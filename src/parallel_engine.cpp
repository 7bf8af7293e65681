#include "parallel_engine.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <numeric>
#include <thread>

namespace {

std::size_t resolve_thread_count(std::size_t requested) {
  if(requested > 0) return requested;
  auto hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<std::size_t>(hw);
}

} // namespace

ThreadPoolEngine::ThreadPoolEngine(std::size_t threads)
  : threads_(resolve_thread_count(threads)),
    pool_(threads_) {}

ThreadPoolEngine::~ThreadPoolEngine() {
  pool_.join();
}

void ThreadPoolEngine::for_each_parallel(std::size_t count, const WeightFn& weight, const Action& action) {
  begin_batch(count);
  if(count == 0) return;

  std::vector<std::size_t> order(count);
  std::iota(order.begin(), order.end(), 0);
  if(weight) {
    std::vector<uint64_t> weights(count);
    for(std::size_t i = 0; i < count; ++i) weights[i] = weight(i);
    std::stable_sort(order.begin(), order.end(),
                     [&](std::size_t a, std::size_t b){ return weights[a] > weights[b]; });
  }

  std::mutex batch_mutex;
  std::condition_variable batch_cv;
  std::size_t remaining = count;
  std::exception_ptr failure;
  std::atomic<bool> failed{false};

  for(auto index : order) {
    asio::post(pool_, [&, index]{
      if(!failed.load(std::memory_order_acquire)) {
        try {
          action(index);
        } catch(...) {
          std::lock_guard lg(batch_mutex);
          if(!failure) failure = std::current_exception();
          failed.store(true, std::memory_order_release);
        }
      }
      std::lock_guard lg(batch_mutex);
      if(--remaining == 0) batch_cv.notify_all();
    });
  }

  std::unique_lock lk(batch_mutex);
  batch_cv.wait(lk, [&]{ return remaining == 0; });
  if(failure) std::rethrow_exception(failure);
}

void SerialEngine::for_each_parallel(std::size_t count, const WeightFn&, const Action& action) {
  begin_batch(count);
  for(std::size_t i = 0; i < count; ++i) action(i);
}
