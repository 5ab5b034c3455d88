#include "cancellation_window.hpp"

#include <asio.hpp>

#include <csignal>

#include "errors.hpp"

CancellationWindow::CancellationWindow(std::chrono::milliseconds duration)
  : duration_(duration.count() < 0 ? std::chrono::milliseconds(0) : duration) {}

void CancellationWindow::wait() const {
  if(duration_.count() == 0) return;
  wait_for_signal_or_timeout(duration_);
}

void CancellationWindow::wait_for_signal_or_timeout(std::chrono::milliseconds duration) {
  asio::io_context io;
  asio::steady_timer timer(io, duration);
  asio::signal_set signals(io, SIGINT, SIGTERM);
  int received = 0;

  timer.async_wait([&](const std::error_code& ec) {
    if(ec == asio::error::operation_aborted) return;
    signals.cancel();
  });
  signals.async_wait([&](const std::error_code& ec, int signal_number) {
    if(ec) return;
    received = signal_number;
    timer.cancel();
  });

  io.run();
  if(received != 0) {
    throw InterruptedError(received);
  }
}
