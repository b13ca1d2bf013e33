#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <variant>

namespace mbf_session {

struct StdoutChunk {
  std::string data;
};

struct StdoutClosed {};

struct ProcessExited {
  int exit_code;
};

struct DeviceDisconnected {};

// Signals the streaming phase reacts to, from whichever source fires first.
using SessionEvent =
    std::variant<StdoutChunk, StdoutClosed, ProcessExited, DeviceDisconnected>;

/**
 * @brief Multi-producer, single-consumer queue of session events.
 *
 * Producers (the stdout reader thread, the disconnect listener) push; the
 * session thread blocks in wait() until any of them has something. Events
 * from one producer keep their order.
 */
class EventChannel {
public:
  void push(SessionEvent event) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(event));
    }
    cv_.notify_one();
  }

  SessionEvent wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !queue_.empty(); });
    SessionEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<SessionEvent> queue_;
};

} // namespace mbf_session
