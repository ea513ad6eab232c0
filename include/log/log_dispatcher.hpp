// llmlink log: LogDispatcher, bounded asynchronous log shipping
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <thread>

#include "log/log_record.hpp"
#include "log/log_transport.hpp"

namespace ll {

struct DispatcherOptions {
  std::size_t capacity = 256;
  // Upper bound on how long close() waits for the queue to drain.
  std::chrono::milliseconds drain_timeout{2000};
  // Deliver on the caller's thread instead of queuing (deterministic tests).
  bool synchronous = false;
};

// Producers call enqueue() and never wait on the network. One worker thread
// forwards queued records to the transport in FIFO order.
//
// When the queue is full the oldest queued record is evicted to make room for
// the new one (counted by dropped()). After close() has been called the
// dispatcher rejects new records (counted by rejected()).
//
// Stopped means close() has returned, not that the transport is idle: a send
// still running past the drain deadline (on the detached worker, or on the
// producer thread in synchronous mode) keeps the transport open and closes it
// when that send returns.
class LogDispatcher {
public:
  enum class State { Running, Draining, Stopped };

  // Throws LinkError(InvalidConfig) for a null transport or zero capacity.
  LogDispatcher(std::unique_ptr<LogTransport> transport, DispatcherOptions opts = {});
  ~LogDispatcher();

  LogDispatcher(const LogDispatcher&) = delete;
  LogDispatcher& operator=(const LogDispatcher&) = delete;

  // Non-blocking. Returns false when the record was not accepted. In
  // synchronous mode the record is sent before returning.
  bool enqueue(LogRecord record);

  // Drains within drain_timeout, then stops the worker and closes the
  // transport. In synchronous mode, waits at most drain_timeout for a send in
  // progress. Safe to call more than once.
  void close();

  State state() const;
  std::uint64_t dropped() const;
  std::uint64_t delivered() const;
  std::uint64_t failed() const;
  std::uint64_t rejected() const;
  std::size_t queued() const;
  bool drain_timed_out() const;
  const DispatcherOptions& options() const { return opts_; }

private:
  struct Shared;

  static void run_loop(std::shared_ptr<Shared> shared);
  static void deliver(Shared& shared, const LogRecord& record);

  DispatcherOptions opts_;
  std::shared_ptr<Shared> shared_;
  std::thread worker_;
};

const char* state_name(LogDispatcher::State state);

}  // namespace ll
