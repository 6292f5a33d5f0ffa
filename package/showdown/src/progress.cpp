#include "showdown/progress.hpp"
#include "showdown/errors.hpp"

#include <utility>

namespace showdown {

void ProgressChannel::push(ProgressEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_)
      return;
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty())
    return std::nullopt;
  ProgressEvent ev = std::move(events_.front());
  events_.pop_front();
  return ev;
}

std::optional<ProgressEvent>
ProgressChannel::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [&] { return !events_.empty() || closed_; });
  if (events_.empty())
    return std::nullopt;
  ProgressEvent ev = std::move(events_.front());
  events_.pop_front();
  return ev;
}

void ProgressChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ProgressChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t ProgressChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

void RunContext::check_cancelled(const std::string &step) const {
  if (cancel && cancel->cancelled())
    throw Cancelled("Cancelled before " + step);
}

} // namespace showdown
