#pragma once

#include <snow-core/fwd.hh>

#include <functional>
#include <memory>

/// Schedules units of work on the calling thread or on worker threads.
///
/// Three flavors:
///   immediate()                  - runs everything right away on the calling thread
///   serial(capacity)             - one worker, strict FIFO
///   concurrent(threads, capacity)- a pool of workers, FIFO start order
///
/// Pending work lives in a bounded sk::ringbuffer; async() blocks while it is full.
/// Barrier work runs alone: after all earlier work finished and before any later work starts.
///
/// Work scheduled with async() must not throw (the program terminates if it does).
/// Work scheduled with sync() may throw; the exception is rethrown to the caller of sync().
///
/// NOTE: scheduling from inside a work item on its own queue is fine for async(),
///       but sync(), wait_idle() and destroying the last handle from a worker of the same queue
///       would deadlock (or self-join) and fail SK_ASSERT_ALWAYS instead, in every build mode.
///       A serial queue whose worker fills its own pending queue deadlocks as well.
///
/// Usage:
///   auto queue = sk::work_queue::concurrent(4);
///   queue.async([&] { decode(chunk_a); });
///   queue.async([&] { decode(chunk_b); });
///   queue.sync_barrier([&] { merge(); }); // runs after both decodes, returns when done
struct sk::work_queue
{
public:
    using work = std::move_only_function<void()>;

    static constexpr isize default_pending_capacity = 1024;

    [[nodiscard]] static work_queue immediate();
    [[nodiscard]] static work_queue serial(isize pending_capacity = default_pending_capacity);
    [[nodiscard]] static work_queue concurrent(int thread_count, isize pending_capacity = default_pending_capacity);

    /// Schedules w and returns without waiting for it.
    void async(work w);

    /// Schedules w and returns once it finished. Rethrows what w threw.
    void sync(work w);

    /// Like async(), but w runs with no other work of this queue in flight.
    void async_barrier(work w);

    /// Like sync(), but w runs with no other work of this queue in flight.
    void sync_barrier(work w);

    /// Blocks until everything scheduled so far has finished.
    void wait_idle();

    /// Number of worker threads, 0 for immediate queues.
    [[nodiscard]] int thread_count() const;

    [[nodiscard]] bool is_immediate() const { return _pool == nullptr; }

public:
    /// Moved-from queues behave like immediate().
    work_queue(work_queue&&) noexcept;
    work_queue& operator=(work_queue&&) noexcept;
    work_queue(work_queue const&) = delete;
    work_queue& operator=(work_queue const&) = delete;

    /// Finishes all pending work, then joins the workers.
    ~work_queue();

private:
    struct pool;

    explicit work_queue(std::unique_ptr<pool> p);

    void schedule(work w, bool is_barrier);
    void schedule_and_wait(work w, bool is_barrier);

    std::unique_ptr<pool> _pool;
};
