#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace showdown {

struct ProgressEvent {
  std::string message;
  int percent{0};
};

// Multi-producer FIFO of progress events. A closed channel drops new events
// and wakes any waiting consumer.
class ProgressChannel {
public:
  void push(ProgressEvent event);
  std::optional<ProgressEvent> try_pop();
  // Blocks until an event arrives, the channel closes, or the timeout lapses.
  std::optional<ProgressEvent> pop(std::chrono::milliseconds timeout);
  void close();
  bool closed() const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> events_;
  bool closed_{false};
};

class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

// Optional progress sink and cancellation flag handed to long pipelines.
struct RunContext {
  ProgressChannel *progress{nullptr};
  const CancellationToken *cancel{nullptr};

  void report(const std::string &message, int percent) const {
    if (progress)
      progress->push(ProgressEvent{message, percent});
  }
  // Throws Cancelled when cancellation was requested.
  void check_cancelled(const std::string &step) const;
};

} // namespace showdown
