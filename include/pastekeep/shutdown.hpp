#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include <rocksdb/status.h>

namespace pastekeep {

class Store;  // Forward declaration

/**
 * ShutdownHandler provides graceful shutdown for a pastekeep process.
 *
 * Usage:
 *   1. Create a ShutdownHandler instance (typically one per process)
 *   2. Register stores with RegisterStore() and stop hooks with OnShutdown()
 *   3. Call InstallSignalHandlers() to catch SIGTERM/SIGINT/SIGHUP
 *   4. Call WaitForShutdown() from main()
 *
 * The signal handler only raises a flag. WaitForShutdown() notices it and
 * runs Shutdown() on the waiting thread: callbacks first (in registration
 * order), then every registered store is closed. Callbacks therefore get a
 * chance to stop users of a store before it goes away.
 *
 * Destroying the handler performs Shutdown() if it has not run, so declare it
 * after the stores and threads its hooks refer to.
 *
 * Thread-safe: All methods can be called from any thread.
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  // Non-copyable, non-movable
  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Register a store for automatic shutdown.
   * The store pointer must remain valid until Unregister() or shutdown.
   */
  void RegisterStore(Store* store);

  void UnregisterStore(Store* store);

  /**
   * Install signal handlers for SIGTERM, SIGINT, and SIGHUP.
   * Returns true if handlers were installed successfully.
   *
   * Note: This modifies global signal handlers. Only call once per process.
   */
  bool InstallSignalHandlers();

  void RestoreSignalHandlers();

  /** Ask for shutdown from normal (non-signal) context. */
  void RequestShutdown();

  /**
   * Run callbacks, then close all registered stores.
   * Idempotent: returns true if shutdown was performed, false if it already ran.
   */
  bool Shutdown();

  bool IsShutdownRequested() const;

  /**
   * Register a custom callback to run during shutdown, before stores are
   * closed, in registration order.
   */
  void OnShutdown(std::function<void()> callback);

  /** Block until shutdown is requested, then perform it. */
  void WaitForShutdown();

  /** First error returned by a store Close() during Shutdown(), or OK. */
  rocksdb::Status CloseStatus() const;

 private:
  static void SignalHandler(int signum);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Store*> stores_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_started_{false};
  std::atomic<bool> shutdown_complete_{false};
  rocksdb::Status close_status_;
  bool handlers_installed_ = false;

  // Original signal handlers to restore
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

}  // namespace pastekeep
