#include "work_queue.hh"

#include <snow-core/assert.hh>
#include <snow-core/mutex.hh>
#include <snow-core/optional.hh>
#include <snow-core/ringbuffer.hh>
#include <snow-core/utility.hh>

#include <condition_variable>
#include <exception>
#include <thread>
#include <vector>

namespace
{
struct queued_work
{
    sk::work_queue::work fn;
    bool is_barrier = false;
};

struct pool_state
{
    explicit pool_state(sk::isize pending_capacity) : pending(pending_capacity) {}

    sk::ringbuffer<queued_work> pending;

    /// non-barrier items currently executing
    int running = 0;
    /// a barrier item was dequeued and has not finished yet
    bool barrier_running = false;
    /// scheduled but not yet finished, including pending
    sk::isize unfinished = 0;
    bool stopping = false;
};

/// completion signal for sync()
/// shared with the work item so that neither side outlives the other's access
struct sync_point
{
    struct state
    {
        bool finished = false;
        std::exception_ptr error;
    };

    sk::mutex<state> result;
    std::condition_variable cv;
};

void run_async_work(sk::work_queue::work& fn) noexcept
{
    fn();
}
} // namespace

struct sk::work_queue::pool
{
    pool(int thread_count, isize pending_capacity) : state(pending_capacity)
    {
        workers.reserve(thread_count);
        for (auto i = 0; i < thread_count; ++i)
            workers.emplace_back([this] { worker_loop(); });
    }

    ~pool()
    {
        // a worker cannot join itself
        SK_ASSERT_ALWAYS(!is_own_worker(), "last work_queue handle destroyed from one of its own work items");

        state.lock([](pool_state& s) { s.stopping = true; });
        work_available.notify_all();

        for (auto& t : workers)
            t.join();
    }

    pool(pool const&) = delete;
    pool& operator=(pool const&) = delete;

    void push(queued_work item)
    {
        // blocks while the pending ringbuffer is full
        state.wait(
            space_available, [](pool_state const& s) { return !s.pending.is_full(); },
            [&](pool_state& s)
            {
                auto const accepted = s.pending.put(sk::move(item));
                SK_ASSERT(accepted, "pending work rejected although space was available");
                ++s.unfinished;
            });

        work_available.notify_one();
    }

    [[nodiscard]] bool is_own_worker() const { return current_pool == this; }

    void worker_loop()
    {
        current_pool = this;

        while (true)
        {
            auto next = state.wait(
                work_available,
                [](pool_state const& s)
                {
                    if (s.stopping && s.pending.is_empty())
                        return true;
                    return !s.pending.is_empty() && !s.barrier_running;
                },
                [](pool_state& s) -> sk::optional<queued_work>
                {
                    // stopping and drained
                    if (s.pending.is_empty())
                        return sk::nullopt;

                    auto item = s.pending.get();
                    if (item.value().is_barrier)
                        s.barrier_running = true;
                    else
                        ++s.running;
                    return item;
                });

            if (!next.has_value())
                return;

            space_available.notify_one();

            auto& item = next.value();
            if (item.is_barrier)
            {
                // nothing else starts while barrier_running is set, so only in-flight work is left
                state.wait(work_finished, [](pool_state const& s) { return s.running == 0; }, [](pool_state&) {});

                run_async_work(item.fn);

                state.lock(
                    [](pool_state& s)
                    {
                        s.barrier_running = false;
                        --s.unfinished;
                    });
                work_available.notify_all();
            }
            else
            {
                run_async_work(item.fn);

                state.lock(
                    [](pool_state& s)
                    {
                        --s.running;
                        --s.unfinished;
                    });
            }

            work_finished.notify_all();
        }
    }

    sk::mutex<pool_state> state;
    std::condition_variable work_available;
    std::condition_variable space_available;
    std::condition_variable work_finished;
    std::vector<std::thread> workers;

    static thread_local pool const* current_pool;
};

thread_local sk::work_queue::pool const* sk::work_queue::pool::current_pool = nullptr;

sk::work_queue sk::work_queue::immediate()
{
    return work_queue(nullptr);
}

sk::work_queue sk::work_queue::serial(isize pending_capacity)
{
    return concurrent(1, pending_capacity);
}

sk::work_queue sk::work_queue::concurrent(int thread_count, isize pending_capacity)
{
    SK_ASSERT_ALWAYS(thread_count > 0, "work_queue needs at least one worker thread");
    return work_queue(std::make_unique<pool>(thread_count, pending_capacity));
}

sk::work_queue::work_queue(std::unique_ptr<pool> p) : _pool(sk::move(p)) {}

sk::work_queue::work_queue(work_queue&&) noexcept = default;
sk::work_queue& sk::work_queue::operator=(work_queue&&) noexcept = default;
sk::work_queue::~work_queue() = default;

void sk::work_queue::async(work w)
{
    schedule(sk::move(w), false);
}

void sk::work_queue::sync(work w)
{
    schedule_and_wait(sk::move(w), false);
}

void sk::work_queue::async_barrier(work w)
{
    schedule(sk::move(w), true);
}

void sk::work_queue::sync_barrier(work w)
{
    schedule_and_wait(sk::move(w), true);
}

void sk::work_queue::wait_idle()
{
    if (_pool == nullptr)
        return;

    SK_ASSERT_ALWAYS(!_pool->is_own_worker(), "wait_idle() from a worker of the same queue would deadlock");
    _pool->state.wait(_pool->work_finished, [](pool_state const& s) { return s.unfinished == 0; }, [](pool_state&) {});
}

int sk::work_queue::thread_count() const
{
    return _pool == nullptr ? 0 : int(_pool->workers.size());
}

void sk::work_queue::schedule(work w, bool is_barrier)
{
    SK_ASSERT(w != nullptr, "cannot schedule empty work");

    if (_pool == nullptr)
    {
        run_async_work(w);
        return;
    }

    _pool->push(queued_work{.fn = sk::move(w), .is_barrier = is_barrier});
}

void sk::work_queue::schedule_and_wait(work w, bool is_barrier)
{
    SK_ASSERT(w != nullptr, "cannot schedule empty work");

    if (_pool == nullptr)
    {
        w();
        return;
    }

    SK_ASSERT_ALWAYS(!_pool->is_own_worker(), "sync() from a worker of the same queue would deadlock");

    auto point = std::make_shared<sync_point>();
    _pool->push(queued_work{
        .fn =
            [point, w = sk::move(w)]() mutable
            {
                std::exception_ptr error;
                try
                {
                    w();
                }
                catch (...)
                {
                    // handed to the waiting caller and rethrown there
                    error = std::current_exception();
                }

                point->result.lock(
                    [&](sync_point::state& s)
                    {
                        s.finished = true;
                        s.error = error;
                    });
                point->cv.notify_all();
            },
        .is_barrier = is_barrier,
    });

    auto const error = point->result.wait(point->cv, [](sync_point::state const& s) { return s.finished; },
                                          [](sync_point::state& s) { return s.error; });
    if (error)
        std::rethrow_exception(error);
}
