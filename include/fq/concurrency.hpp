#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace fq {

// Single-capacity, set-once handoff between racing workers and the
// thread that waits for a winner. The first publish fills the slot; every
// later publish is dropped without blocking.
template <typename T>
class HandoffSlot {
public:
  // Returns false when another value was already published.
  bool try_publish(T value)
  {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (published_) return false;
      published_ = true;
      value_.emplace(std::move(value));
    }
    cv_.notify_all();
    return true;
  }

  // Blocks up to `timeout` for a published value and takes it.
  template <typename Rep, typename Period>
  std::optional<T> take_for(const std::chrono::duration<Rep, Period>& timeout)
  {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_for(lk, timeout, [&]{ return value_.has_value(); });
    return take_locked();
  }

  // Non-blocking take.
  std::optional<T> try_take()
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return take_locked();
  }

  bool published() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return published_;
  }

private:
  std::optional<T> take_locked()
  {
    std::optional<T> out;
    out.swap(value_);
    return out;
  }

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::optional<T> value_;
  bool published_ = false;
};

// Completion barrier over a dynamic number of workers.
class WaitGroup {
public:
  void add(int n = 1);
  // Throws std::logic_error when nothing is pending.
  void done();

  // Wait until every added worker called done().
  void wait();

  // Returns false if workers were still pending when `timeout` elapsed.
  bool wait_for(std::chrono::milliseconds timeout);

  int pending() const;

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  int pending_ = 0;
};

} // namespace fq
