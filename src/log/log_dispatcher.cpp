// llmlink log: LogDispatcher implementation
#include "log/log_dispatcher.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <utility>

#include "ll_types.hpp"

namespace ll {

namespace {
// Extra time close() gives the worker to exit once the queue is settled.
constexpr std::chrono::milliseconds kExitGrace{100};
}  // namespace

// Owned jointly by the dispatcher and its worker, so a worker detached after
// the drain deadline can still finish its last send safely.
struct LogDispatcher::Shared {
    std::unique_ptr<LogTransport> transport;
    std::size_t capacity = 0;

    mutable std::mutex mutex;
    std::condition_variable work_cv;  // worker: queue non-empty or stop
    std::condition_variable idle_cv;  // close(): progress made / worker exited
    std::deque<LogRecord> queue;
    State state = State::Running;
    bool stop_requested = false;
    bool in_flight = false;
    bool worker_done = false;
    bool drain_timed_out = false;
    std::uint64_t dropped = 0;
    std::uint64_t delivered = 0;
    std::uint64_t failed = 0;
    std::uint64_t rejected = 0;

    std::timed_mutex send_mutex;  // synchronous mode: one transport call at a time
    bool transport_closed = false;  // guarded by mutex

    // Claims the single transport close; true when the caller must perform it.
    bool claim_close_locked() {
        if (transport_closed) return false;
        transport_closed = true;
        return true;
    }

    void close_transport() {
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (!claim_close_locked()) return;
        }
        release_transport();
    }

    void release_transport() {
        try {
            transport->close();
        } catch (const std::exception&) {
            // Closing is best effort as well.
        } catch (...) {
            // Non-standard exception types included.
        }
    }
};

const char* state_name(LogDispatcher::State state) {
    switch (state) {
        case LogDispatcher::State::Running: return "running";
        case LogDispatcher::State::Draining: return "draining";
        case LogDispatcher::State::Stopped: return "stopped";
    }
    return "?";
}

LogDispatcher::LogDispatcher(std::unique_ptr<LogTransport> transport, DispatcherOptions opts)
    : opts_(opts), shared_(std::make_shared<Shared>()) {
    if (!transport) throw LinkError(LinkErrc::InvalidConfig, "LogDispatcher requires a transport");
    if (opts_.capacity == 0)
        throw LinkError(LinkErrc::InvalidConfig, "LogDispatcher capacity must be at least 1");
    shared_->transport = std::move(transport);
    shared_->capacity = opts_.capacity;
    if (!opts_.synchronous) worker_ = std::thread(&LogDispatcher::run_loop, shared_);
}

LogDispatcher::~LogDispatcher() { close(); }

void LogDispatcher::deliver(Shared& shared, const LogRecord& record) {
    bool ok = false;
    try {
        shared.transport->send(record);
        ok = true;
    } catch (const std::exception&) {
        // Remote logging must never destabilise the caller; counted below.
    } catch (...) {
        // Same for transports throwing non-standard types.
    }
    std::lock_guard<std::mutex> lk(shared.mutex);
    if (ok)
        ++shared.delivered;
    else
        ++shared.failed;
}

bool LogDispatcher::enqueue(LogRecord record) {
    Shared& s = *shared_;
    if (opts_.synchronous) {
        std::lock_guard<std::timed_mutex> send_lk(s.send_mutex);
        {
            std::lock_guard<std::mutex> lk(s.mutex);
            if (s.state != State::Running) {
                ++s.rejected;
                return false;
            }
            s.in_flight = true;
        }
        deliver(s, record);
        bool close_now = false;
        {
            std::lock_guard<std::mutex> lk(s.mutex);
            s.in_flight = false;
            // close() gave up waiting for this send; the transport is ours to close.
            if (s.state == State::Stopped) close_now = s.claim_close_locked();
        }
        if (close_now) s.release_transport();
        return true;
    }

    {
        std::lock_guard<std::mutex> lk(s.mutex);
        if (s.state != State::Running) {
            ++s.rejected;
            return false;
        }
        // Eviction and insertion share this critical section.
        if (s.queue.size() >= s.capacity) {
            s.queue.pop_front();
            ++s.dropped;
        }
        s.queue.push_back(std::move(record));
    }
    s.work_cv.notify_one();
    return true;
}

void LogDispatcher::run_loop(std::shared_ptr<Shared> shared) {
    Shared& s = *shared;
    while (true) {
        LogRecord record;
        {
            std::unique_lock<std::mutex> lk(s.mutex);
            s.work_cv.wait(lk, [&] { return !s.queue.empty() || s.stop_requested; });
            if (s.queue.empty()) break;
            record = std::move(s.queue.front());
            s.queue.pop_front();
            s.in_flight = true;
        }
        deliver(s, record);
        {
            std::lock_guard<std::mutex> lk(s.mutex);
            s.in_flight = false;
        }
        s.idle_cv.notify_all();
    }
    s.close_transport();
    {
        std::lock_guard<std::mutex> lk(s.mutex);
        s.worker_done = true;
    }
    s.idle_cv.notify_all();
}

void LogDispatcher::close() {
    Shared& s = *shared_;
    {
        std::lock_guard<std::mutex> lk(s.mutex);
        if (s.state != State::Running) return;
        s.state = State::Draining;
    }

    const auto deadline = std::chrono::steady_clock::now() + opts_.drain_timeout;
    if (opts_.synchronous) {
        std::unique_lock<std::timed_mutex> send_lk(s.send_mutex, deadline);
        bool close_here = false;
        {
            std::lock_guard<std::mutex> lk(s.mutex);
            if (!send_lk.owns_lock()) s.drain_timed_out = true;
            // A send still in flight closes the transport when it returns.
            if (send_lk.owns_lock() || !s.in_flight) close_here = s.claim_close_locked();
            s.state = State::Stopped;
        }
        if (close_here) s.release_transport();
        return;
    }

    s.work_cv.notify_all();
    bool worker_exited = false;
    {
        std::unique_lock<std::mutex> lk(s.mutex);
        bool drained =
            s.idle_cv.wait_until(lk, deadline, [&] { return s.queue.empty() && !s.in_flight; });
        if (!drained) {
            s.dropped += s.queue.size();
            s.queue.clear();
            s.drain_timed_out = true;
        }
        s.stop_requested = true;
        s.work_cv.notify_all();
        worker_exited = s.idle_cv.wait_until(lk, deadline + kExitGrace, [&] { return s.worker_done; });
        s.state = State::Stopped;
    }

    if (worker_.joinable()) {
        if (worker_exited)
            worker_.join();
        else
            worker_.detach();  // still inside a send; it closes the transport itself
    }
}

LogDispatcher::State LogDispatcher::state() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->state;
}

std::uint64_t LogDispatcher::dropped() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->dropped;
}

std::uint64_t LogDispatcher::delivered() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->delivered;
}

std::uint64_t LogDispatcher::failed() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->failed;
}

std::uint64_t LogDispatcher::rejected() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->rejected;
}

std::size_t LogDispatcher::queued() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->queue.size();
}

bool LogDispatcher::drain_timed_out() const {
    std::lock_guard<std::mutex> lk(shared_->mutex);
    return shared_->drain_timed_out;
}

}  // namespace ll
