#pragma once

#include <asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

// Fan-out primitive used by the build strategies. for_each_parallel returns
// only after every item has been handled; if an action throws, items that
// have not started yet are skipped and the first exception is rethrown.
class ParallelEngine {
public:
  using WeightFn = std::function<uint64_t(std::size_t index)>;
  using Action = std::function<void(std::size_t index)>;

  virtual ~ParallelEngine() = default;

  virtual void for_each_parallel(std::size_t count, const WeightFn& weight, const Action& action) = 0;

  // Records one finished item of the current batch and returns the count so far.
  std::size_t progress() { return progress_.fetch_add(1, std::memory_order_acq_rel) + 1; }
  std::size_t completed() const { return progress_.load(std::memory_order_acquire); }
  std::size_t goal() const { return goal_.load(std::memory_order_acquire); }

protected:
  void begin_batch(std::size_t goal) {
    progress_.store(0, std::memory_order_release);
    goal_.store(goal, std::memory_order_release);
  }

private:
  std::atomic<std::size_t> progress_{0};
  std::atomic<std::size_t> goal_{0};
};

template<typename T, typename Weight, typename Fn>
void for_each_parallel(ParallelEngine& engine, std::vector<T>& items, Weight weight, Fn action) {
  engine.for_each_parallel(items.size(),
    [&](std::size_t index) -> uint64_t { return weight(items[index]); },
    [&](std::size_t index) { action(items[index]); });
}

// Runs each batch on an asio thread pool, heaviest items first.
class ThreadPoolEngine : public ParallelEngine {
public:
  // 0 picks std::thread::hardware_concurrency().
  explicit ThreadPoolEngine(std::size_t threads = 0);
  ~ThreadPoolEngine() override;

  void for_each_parallel(std::size_t count, const WeightFn& weight, const Action& action) override;

  std::size_t thread_count() const { return threads_; }

private:
  std::size_t threads_;
  asio::thread_pool pool_;
};

// Runs items inline, in index order, on the calling thread.
class SerialEngine : public ParallelEngine {
public:
  void for_each_parallel(std::size_t count, const WeightFn& weight, const Action& action) override;
};
