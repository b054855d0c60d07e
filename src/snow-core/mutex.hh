#pragma once

#include <snow-core/fwd.hh>
#include <snow-core/optional.hh>
#include <snow-core/utility.hh>

#include <condition_variable>
#include <mutex>

/// Data of type T together with the mutex protecting it.
/// The data is only reachable inside a scoped lock, so unsynchronized containers
/// (e.g. sk::ringbuffer) can be shared between threads without a stray unguarded call.
/// Usage:
///   sk::mutex<sk::ringbuffer<int>> shared(64);
///   bool accepted = shared.lock([](sk::ringbuffer<int>& b) { return b.put(42); });
template <class T>
struct sk::mutex
{
    /// Acquire lock, invoke f with the protected value, release lock
    /// Returns: the result of f (auto to prevent reference leaks)
    template <class F>
    auto lock(F&& f)
    {
        std::lock_guard lock(_mutex);
        return sk::invoke(sk::forward<F>(f), _value);
    }

    /// Like lock() but never blocks
    /// Returns: optional result of f, nullopt if the lock was not acquired
    ///          for void functions: whether the lock was acquired
    template <class F>
    auto try_lock(F&& f)
    {
        using result_t = decltype(sk::invoke(sk::forward<F>(f), _value));
        std::unique_lock lock(_mutex, std::try_to_lock);

        if constexpr (std::is_void_v<result_t>)
        {
            if (!lock.owns_lock())
                return false;

            sk::invoke(sk::forward<F>(f), _value);
            return true;
        }
        else
        {
            if (!lock.owns_lock())
                return sk::optional<result_t>();

            return sk::optional<result_t>(sk::invoke(sk::forward<F>(f), _value));
        }
    }

    /// Wait on cv until pred(value) holds, then invoke f with the protected value
    /// The mutex is held during predicate checks and the call to f
    /// Usage:
    ///   pending.wait(cv, [](auto const& b) { return !b.is_empty(); }, [](auto& b) { return b.get(); });
    template <class Pred, class F>
    auto wait(std::condition_variable& cv, Pred&& pred, F&& f)
    {
        std::unique_lock lock(_mutex);
        cv.wait(lock, [&]() -> bool { return sk::invoke(pred, _value); });
        return sk::invoke(sk::forward<F>(f), _value);
    }

    mutex() = default;

    template <class... Args>
    explicit mutex(Args&&... args) : _value(sk::forward<Args>(args)...)
    {
    }

private:
    T _value;
    std::mutex _mutex;
};
