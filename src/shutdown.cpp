#include <pastekeep/shutdown.hpp>
#include <pastekeep/store.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <thread>

namespace pastekeep {

namespace {
// Raised from the signal handler; lock-free so the handler touches nothing else.
std::atomic<bool> g_signal_received{false};

constexpr auto kSignalPollInterval = std::chrono::milliseconds(100);
}  // namespace

ShutdownHandler::ShutdownHandler() = default;

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::RegisterStore(Store* store) {
  if (!store) return;

  std::lock_guard<std::mutex> lock(mutex_);
  // Avoid duplicates
  for (const auto* s : stores_) {
    if (s == store) return;
  }
  stores_.push_back(store);
}

void ShutdownHandler::UnregisterStore(Store* store) {
  if (!store) return;

  std::lock_guard<std::mutex> lock(mutex_);
  stores_.erase(std::remove(stores_.begin(), stores_.end(), store), stores_.end());
}

void ShutdownHandler::SignalHandler(int signum) {
  (void)signum;
  g_signal_received.store(true);
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (handlers_installed_) {
    return true;  // Already installed
  }

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;  // Restart interrupted syscalls

  // Install SIGTERM handler
  if (sigaction(SIGTERM, &sa, &old_sigterm_) != 0) {
    return false;
  }

  // Install SIGINT handler (Ctrl+C)
  if (sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    return false;
  }

  // Install SIGHUP handler (terminal hangup)
  if (sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    return false;
  }

  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!handlers_installed_) {
    return;
  }

  sigaction(SIGTERM, &old_sigterm_, nullptr);
  sigaction(SIGINT, &old_sigint_, nullptr);
  sigaction(SIGHUP, &old_sighup_, nullptr);

  handlers_installed_ = false;
}

void ShutdownHandler::RequestShutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_requested_.store(true);
  }
  cv_.notify_all();
}

bool ShutdownHandler::Shutdown() {
  shutdown_requested_.store(true);

  // Atomically check and set the started flag
  bool expected = false;
  if (!shutdown_started_.compare_exchange_strong(expected, true)) {
    // Already shutting down, wait for completion
    while (!shutdown_complete_.load()) {
      std::this_thread::yield();
    }
    return false;
  }

  // Copy under lock to avoid holding it while callbacks and Close() run
  std::vector<Store*> stores_copy;
  std::vector<std::function<void()>> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stores_copy = stores_;
    callbacks_copy = callbacks_;
    stores_.clear();
  }

  for (const auto& callback : callbacks_copy) {
    if (callback) {
      callback();
    }
  }

  rocksdb::Status first_error;
  for (Store* store : stores_copy) {
    if (!store) continue;
    rocksdb::Status s = store->Close();
    if (first_error.ok() && !s.ok()) first_error = s;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    close_status_ = first_error;
  }

  shutdown_complete_.store(true);
  cv_.notify_all();
  return true;
}

bool ShutdownHandler::IsShutdownRequested() const {
  return shutdown_requested_.load() || g_signal_received.load();
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!IsShutdownRequested()) {
      cv_.wait_for(lock, kSignalPollInterval);
    }
  }
  Shutdown();
}

rocksdb::Status ShutdownHandler::CloseStatus() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return close_status_;
}

}  // namespace pastekeep
