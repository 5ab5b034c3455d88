#pragma once

#include <chrono>

// Pause before destructive work. SIGINT or SIGTERM during the pause aborts
// with InterruptedError; nothing is cleaned up.
class CancellationWindow {
public:
  explicit CancellationWindow(std::chrono::milliseconds duration);

  void wait() const;

  // Blocks on an asio timer raced against a signal set.
  static void wait_for_signal_or_timeout(std::chrono::milliseconds duration);

private:
  std::chrono::milliseconds duration_;
};
