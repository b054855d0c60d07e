#include <snow-core/ringbuffer.hh>

#include <nexus/test.hh>

#include <assertion-check.hh>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <ranges>
#include <string>
#include <type_traits>
#include <vector>

// ============================================================================
// Compile-time checks
// ============================================================================

static_assert(sk::fixed_read_write_queue<sk::ringbuffer<int>>, "ringbuffer must be a read/write queue");
static_assert(sk::fixed_read_write_queue<sk::ringbuffer<std::string>>, "ringbuffer must be a read/write queue");
static_assert(sk::fixed_read_write_queue<sk::ringbuffer<std::unique_ptr<int>>>, "move-only elements are readable");
static_assert(sk::fixed_write_queue<sk::ringbuffer<int, sk::i8>>, "small cursors keep the queue interface");

static_assert(sk::ringbuffer<int>::max_capacity() == INT64_MAX / 4);
static_assert(sk::ringbuffer<int, sk::i8>::max_capacity() == 31);
static_assert(sk::ringbuffer<int, sk::i16>::max_capacity() == 8191);

namespace
{
struct wide16
{
    sk::i64 a = 0;
    sk::i64 b = 0;
};
} // namespace

// the storage block must stay addressable, which bounds wide elements below the cursor headroom
static_assert(sizeof(wide16) == 16);
static_assert(sk::ringbuffer<wide16>::max_capacity() == PTRDIFF_MAX / 16);
static_assert(sk::ringbuffer<wide16>::max_capacity() < INT64_MAX / 4);

// iteration plugs into generic range code
static_assert(std::input_iterator<sk::ringbuffer<int>::drain_iterator>);
static_assert(std::sentinel_for<sk::sentinel, sk::ringbuffer<int>::drain_iterator>);
static_assert(std::ranges::input_range<sk::ringbuffer<int>>);
static_assert(std::ranges::input_range<sk::ringbuffer<std::unique_ptr<int>>>);

static_assert(!std::is_copy_constructible_v<sk::ringbuffer<std::unique_ptr<int>>>);
static_assert(std::is_nothrow_move_constructible_v<sk::ringbuffer<std::unique_ptr<int>>>);

namespace
{
struct Tracked
{
    int value = 0;
    static inline int alive = 0;

    explicit Tracked(int v) : value(v) { ++alive; }
    Tracked(Tracked const& rhs) : value(rhs.value) { ++alive; }
    Tracked(Tracked&& rhs) noexcept : value(rhs.value) { ++alive; }
    Tracked& operator=(Tracked const&) = default;
    Tracked& operator=(Tracked&&) noexcept = default;
    ~Tracked() { --alive; }
};

template <class T, class C>
std::vector<T> drain(sk::ringbuffer<T, C>& buffer)
{
    std::vector<T> result;
    for (auto& v : buffer)
        result.push_back(v);
    return result;
}

std::vector<int> iota(int begin, int end)
{
    std::vector<int> result;
    for (auto i = begin; i < end; ++i)
        result.push_back(i);
    return result;
}
} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST("ringbuffer - fresh buffer is empty")
{
    for (auto capacity : {1, 2, 3, 16, 1000})
    {
        auto buffer = sk::ringbuffer<int>(capacity);

        CHECK(buffer.capacity() == capacity);
        CHECK(buffer.count() == 0);
        CHECK(buffer.is_empty());
        CHECK(!buffer.is_full());
        CHECK(!buffer.can_rewind());
        CHECK(!buffer.get().has_value());
        CHECK(!buffer.peek().has_value());
        CHECK(!buffer.rewind());
    }
}

TEST("ringbuffer - default capacity")
{
    auto buffer = sk::ringbuffer<int>();
    CHECK(buffer.capacity() == 1024);
    CHECK(buffer.is_empty());
}

TEST("ringbuffer - fill value construction")
{
    auto buffer = sk::ringbuffer<std::string>(4, "unset");

    // fill values are storage only, not readable content
    CHECK(buffer.count() == 0);
    CHECK(buffer.is_empty());
    CHECK(!buffer.get().has_value());
    CHECK(!buffer.rewind());

    for (auto s : {"a", "b", "c", "d"})
        CHECK(buffer.put(s));
    CHECK(!buffer.put("e"));

    CHECK((drain(buffer) == std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST("ringbuffer - invalid capacity asserts")
{
    SECTION("zero")
    {
        CHECK(sk_test::triggers_assertion([] { auto b = sk::ringbuffer<int>(0); }));
    }

    SECTION("negative")
    {
        CHECK(sk_test::triggers_assertion([] { auto b = sk::ringbuffer<int>(-1); }));
        CHECK(sk_test::triggers_assertion([] { auto b = sk::ringbuffer<int>(-100, 7); }));
    }

    SECTION("beyond cursor headroom")
    {
        using small = sk::ringbuffer<int, sk::i8>;
        CHECK(!sk_test::triggers_assertion([] { auto b = small(small::max_capacity()); }));
        CHECK(sk_test::triggers_assertion([] { auto b = small(small::max_capacity() + 1); }));

        // the default capacity does not fit into 8 bit cursors
        CHECK(sk_test::triggers_assertion([] { auto b = small(); }));
    }

    SECTION("beyond addressable storage for wide elements")
    {
        using wide = sk::ringbuffer<wide16>;

        // within the cursor headroom, but capacity * 16 bytes overflows the address space
        CHECK(sk_test::triggers_assertion([] { auto b = wide((sk::isize(1) << 60) + 1); }));
        CHECK(sk_test::triggers_assertion([] { auto b = wide(wide::max_capacity() + 1); }));
    }
}

// ============================================================================
// put / get
// ============================================================================

TEST("ringbuffer - fill to capacity")
{
    for (auto capacity : {1, 2, 7, 16})
    {
        auto buffer = sk::ringbuffer<int>(capacity);

        for (auto i = 0; i < capacity; ++i)
        {
            CHECK(!buffer.is_full());
            CHECK(buffer.put(i));
        }

        CHECK(buffer.is_full());
        CHECK(buffer.count() == capacity);

        CHECK(!buffer.put(capacity));
        CHECK(buffer.is_full());
        CHECK(buffer.count() == capacity);

        // the rejected put did not touch anything
        CHECK(drain(buffer) == iota(0, capacity));
    }
}

TEST("ringbuffer - fifo order and count")
{
    auto buffer = sk::ringbuffer<int>(10);

    for (auto i = 0; i < 6; ++i)
        CHECK(buffer.put(i * 10));
    CHECK(buffer.count() == 6);

    for (auto j = 0; j < 4; ++j)
    {
        CHECK(buffer.get() == j * 10);
        CHECK(buffer.count() == 6 - (j + 1));
    }

    CHECK(buffer.put(60));
    CHECK(buffer.count() == 3);
    CHECK(buffer.get() == 40);
    CHECK(buffer.get() == 50);
    CHECK(buffer.get() == 60);
    CHECK(buffer.get() == sk::nullopt);
    CHECK(buffer.count() == 0);
}

TEST("ringbuffer - peek does not advance")
{
    auto buffer = sk::ringbuffer<std::string>(3);
    CHECK(buffer.put("x"));
    CHECK(buffer.put("y"));

    CHECK(buffer.peek() == std::string("x"));
    CHECK(buffer.peek() == std::string("x"));
    CHECK(buffer.count() == 2);

    CHECK(buffer.get() == std::string("x"));
    CHECK(buffer.peek() == std::string("y"));
}

TEST("ringbuffer - backfilling freed slots")
{
    auto buffer = sk::ringbuffer<int>(16);

    for (auto i = 0; i < 16; ++i)
        CHECK(buffer.put(i));
    CHECK(!buffer.put(16));

    for (auto i = 0; i < 8; ++i)
        CHECK(buffer.get() == i);

    for (auto i = 16; i < 24; ++i)
        CHECK(buffer.put(i));
    CHECK(!buffer.put(24));
    CHECK(buffer.is_full());

    for (auto i = 8; i < 24; ++i)
        CHECK(buffer.get() == i);
    CHECK(!buffer.get().has_value());
    CHECK(buffer.is_empty());
}

TEST("ringbuffer - emplace_put")
{
    auto buffer = sk::ringbuffer<std::string>(2);

    CHECK(buffer.emplace_put(3, 'a'));
    CHECK(buffer.emplace_put("bc"));
    CHECK(!buffer.emplace_put(1, 'z'));

    CHECK(buffer.get() == std::string("aaa"));

    // overwrites the slot of "aaa"
    CHECK(buffer.emplace_put(2, 'd'));
    CHECK(buffer.get() == std::string("bc"));
    CHECK(buffer.get() == std::string("dd"));
}

TEST("ringbuffer - move-only elements")
{
    auto buffer = sk::ringbuffer<std::unique_ptr<int>>(2);

    CHECK(buffer.put(std::make_unique<int>(1)));
    CHECK(buffer.put(std::make_unique<int>(2)));

    auto rejected = std::make_unique<int>(3);
    CHECK(!buffer.put(std::move(rejected)));
    REQUIRE(rejected != nullptr); // not consumed on failure
    CHECK(*rejected == 3);

    auto a = buffer.get();
    REQUIRE(a.has_value());
    CHECK(*a.value() == 1);

    CHECK(buffer.put(std::move(rejected)));

    auto b = buffer.get();
    auto c = buffer.get();
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());
    CHECK(*b.value() == 2);
    CHECK(*c.value() == 3);
    CHECK(!buffer.get().has_value());
}

// ============================================================================
// rewind
// ============================================================================

TEST("ringbuffer - rewind restores the last read element")
{
    auto buffer = sk::ringbuffer<int>(8);
    CHECK(buffer.put(1));
    CHECK(buffer.put(2));

    CHECK(buffer.get() == 1);
    CHECK(buffer.can_rewind());
    CHECK(buffer.rewind());
    CHECK(buffer.peek() == 1);
    CHECK(buffer.count() == 2);

    // at the start of the stream
    CHECK(!buffer.can_rewind());
    CHECK(!buffer.rewind());
}

TEST("ringbuffer - rewind from a full buffer")
{
    auto buffer = sk::ringbuffer<int>(16);
    for (auto i = 0; i < 16; ++i)
        CHECK(buffer.put(i));

    CHECK(!buffer.can_rewind());

    CHECK(buffer.get() == 0);
    CHECK(buffer.get() == 1);
    CHECK(buffer.get() == 2);

    CHECK(buffer.rewind());
    CHECK(buffer.peek() == 2);
    CHECK(buffer.rewind());
    CHECK(buffer.peek() == 1);
    CHECK(buffer.rewind());
    CHECK(buffer.peek() == 0);

    CHECK(!buffer.rewind());
    CHECK(buffer.peek() == 0);
    CHECK(buffer.is_full());
}

TEST("ringbuffer - rewind stops at overwritten slots")
{
    auto buffer = sk::ringbuffer<int>(4);
    for (auto i = 0; i < 4; ++i)
        CHECK(buffer.put(i));
    for (auto i = 0; i < 4; ++i)
        CHECK(buffer.get() == i);

    // 4 and 5 land on the slots of 0 and 1
    CHECK(buffer.put(4));
    CHECK(buffer.put(5));

    CHECK(buffer.rewind());
    CHECK(buffer.peek() == 3);
    CHECK(buffer.rewind());
    CHECK(buffer.peek() == 2);

    // the slot before 2 now holds 5
    CHECK(buffer.is_full());
    CHECK(!buffer.can_rewind());
    CHECK(!buffer.rewind());

    CHECK((drain(buffer) == std::vector<int>{2, 3, 4, 5}));
}

TEST("ringbuffer - rewind then read again")
{
    auto buffer = sk::ringbuffer<int>(8);
    for (auto i = 0; i < 5; ++i)
        CHECK(buffer.put(i));

    CHECK(drain(buffer) == iota(0, 5));

    for (auto i = 0; i < 5; ++i)
        CHECK(buffer.rewind());
    CHECK(!buffer.rewind());

    CHECK(drain(buffer) == iota(0, 5));
}

// ============================================================================
// discard
// ============================================================================

TEST("ringbuffer - discard")
{
    SECTION("partially filled")
    {
        auto buffer = sk::ringbuffer<int>(4);
        CHECK(buffer.put(1));
        CHECK(buffer.put(2));
        CHECK(buffer.get() == 1);

        buffer.discard();

        CHECK(buffer.count() == 0);
        CHECK(buffer.is_empty());
        CHECK(!buffer.is_full());
        CHECK(!buffer.can_rewind());
        CHECK(!buffer.get().has_value());
        CHECK(!buffer.peek().has_value());
        CHECK(!buffer.rewind());
    }

    SECTION("full")
    {
        auto buffer = sk::ringbuffer<int>(3);
        for (auto i = 0; i < 3; ++i)
            CHECK(buffer.put(i));

        buffer.discard();
        CHECK(buffer.is_empty());

        for (auto i = 10; i < 13; ++i)
            CHECK(buffer.put(i));
        CHECK(!buffer.put(13));
        CHECK(drain(buffer) == iota(10, 13));
    }

    SECTION("empty")
    {
        auto buffer = sk::ringbuffer<int>(3);
        buffer.discard();
        CHECK(buffer.is_empty());
        CHECK(buffer.put(5));
        CHECK(buffer.get() == 5);
    }

    SECTION("destroys stored elements immediately")
    {
        Tracked::alive = 0;
        {
            auto buffer = sk::ringbuffer<Tracked>(4);
            for (auto i = 0; i < 3; ++i)
                CHECK(buffer.emplace_put(i));
            CHECK(Tracked::alive == 3);

            // read elements stay stored for rewinding
            CHECK(buffer.get().value_or(Tracked(-1)).value == 0);
            CHECK(Tracked::alive == 3);

            buffer.discard();
            CHECK(Tracked::alive == 0);

            CHECK(buffer.emplace_put(7));
            CHECK(Tracked::alive == 1);
        }
        CHECK(Tracked::alive == 0);
    }

    SECTION("drops fill values too")
    {
        Tracked::alive = 0;
        auto buffer = sk::ringbuffer<Tracked>(5, Tracked(0));
        CHECK(Tracked::alive == 5);

        buffer.discard();
        CHECK(Tracked::alive == 0);
    }
}

// ============================================================================
// Iteration
// ============================================================================

TEST("ringbuffer - iteration consumes")
{
    auto buffer = sk::ringbuffer<int>(8);
    for (auto i = 0; i < 5; ++i)
        CHECK(buffer.put(i));

    auto seen = std::vector<int>();
    for (auto v : buffer)
        seen.push_back(v);

    CHECK(seen == iota(0, 5));
    CHECK(buffer.is_empty());

    // second pass without new puts is empty
    auto second = 0;
    for ([[maybe_unused]] auto v : buffer)
        ++second;
    CHECK(second == 0);

    // but sees what was put in between
    CHECK(buffer.put(42));
    CHECK((drain(buffer) == std::vector<int>{42}));
}

TEST("ringbuffer - iteration interleaved with put")
{
    auto buffer = sk::ringbuffer<int>(4);
    CHECK(buffer.put(0));

    auto seen = std::vector<int>();
    for (auto v : buffer)
    {
        seen.push_back(v);
        if (v < 6)
            CHECK(buffer.put(v + 1));
    }

    CHECK(seen == iota(0, 7));
    CHECK(buffer.is_empty());
}

TEST("ringbuffer - ranges algorithms drain the buffer")
{
    SECTION("copy")
    {
        auto buffer = sk::ringbuffer<int>(8);
        for (auto i = 0; i < 6; ++i)
            CHECK(buffer.put(i));

        auto seen = std::vector<int>();
        std::ranges::copy(buffer, std::back_inserter(seen));

        CHECK(seen == iota(0, 6));
        CHECK(buffer.is_empty());
    }

    SECTION("move-only elements")
    {
        auto buffer = sk::ringbuffer<std::unique_ptr<int>>(4);
        CHECK(buffer.put(std::make_unique<int>(1)));
        CHECK(buffer.put(std::make_unique<int>(2)));

        auto seen = std::vector<std::unique_ptr<int>>();
        std::ranges::move(buffer, std::back_inserter(seen));

        REQUIRE(seen.size() == 2);
        CHECK(*seen[0] == 1);
        CHECK(*seen[1] == 2);
        CHECK(buffer.is_empty());
    }

    SECTION("find stops early")
    {
        auto buffer = sk::ringbuffer<int>(8);
        for (auto i = 0; i < 6; ++i)
            CHECK(buffer.put(i));

        auto it = std::ranges::find(buffer, 2);
        REQUIRE(it != buffer.end());
        CHECK(*it == 2);

        // 0, 1 and 2 were consumed on the way
        CHECK(buffer.count() == 3);
        CHECK(buffer.peek().value() == 3);
    }
}

TEST("ringbuffer - iterating an empty buffer")
{
    auto buffer = sk::ringbuffer<int>(2);
    CHECK(buffer.begin() == buffer.end());
}

// ============================================================================
// Cursor rebase
// ============================================================================

TEST("ringbuffer - cursor rebase keeps the stream intact")
{
    SECTION("steady count across many rebases")
    {
        auto buffer = sk::ringbuffer<int, sk::i8>(4);
        CHECK(buffer.put(0));
        CHECK(buffer.put(1));
        CHECK(buffer.put(2));

        // 8 bit cursors rebase roughly every 120 puts
        for (auto i = 3; i < 2000; ++i)
        {
            REQUIRE(buffer.put(i));
            CHECK(buffer.count() == 4);
            CHECK(buffer.get() == i - 3);
            CHECK(buffer.count() == 3);
        }

        CHECK(drain(buffer) == iota(1997, 2000));
    }

    SECTION("rewind range survives rebase")
    {
        auto buffer = sk::ringbuffer<int, sk::i8>(4);

        for (auto i = 0; i < 1000; ++i)
        {
            REQUIRE(buffer.put(i));
            REQUIRE(buffer.get() == i);

            // every element of the last capacity() puts can be un-read
            auto const expected_rewinds = i + 1 < 4 ? i + 1 : 4;
            auto rewinds = 0;
            while (buffer.rewind())
                ++rewinds;
            CHECK(rewinds == expected_rewinds);

            for (auto k = i - expected_rewinds + 1; k <= i; ++k)
                CHECK(buffer.get() == k);
            CHECK(buffer.is_empty());
        }
    }

    SECTION("full buffer at the cursor limit")
    {
        using buffer_t = sk::ringbuffer<int, sk::i8>;
        auto buffer = buffer_t(buffer_t::max_capacity());

        auto next_put = 0;
        auto next_get = 0;
        for (auto round = 0; round < 40; ++round)
        {
            while (buffer.put(next_put))
                ++next_put;
            CHECK(buffer.is_full());
            CHECK(buffer.count() == buffer_t::max_capacity());

            // read a varying amount so the limit is hit at different fill levels
            auto const reads = 1 + round % buffer_t::max_capacity();
            for (auto r = 0; r < reads; ++r)
                CHECK(buffer.get() == next_get++);
        }

        CHECK(drain(buffer) == iota(next_get, next_put));
    }

    SECTION("16 bit cursors")
    {
        auto buffer = sk::ringbuffer<int, sk::i16>(100);
        for (auto i = 0; i < 100000; ++i)
        {
            REQUIRE(buffer.put(i));
            REQUIRE(buffer.get() == i);
        }
        CHECK(buffer.rewind());
        CHECK(buffer.peek() == 99999);
    }
}

// ============================================================================
// Copy and move
// ============================================================================

TEST("ringbuffer - copy")
{
    auto buffer = sk::ringbuffer<std::string>(3);
    CHECK(buffer.put("a"));
    CHECK(buffer.put("b"));
    CHECK(buffer.get() == std::string("a"));

    auto copy = buffer;
    CHECK(copy.capacity() == 3);
    CHECK(copy.count() == 1);

    // both keep the rewind history
    CHECK(copy.rewind());
    CHECK((drain(copy) == std::vector<std::string>{"a", "b"}));

    CHECK(buffer.count() == 1);
    CHECK((drain(buffer) == std::vector<std::string>{"b"}));

    auto assigned = sk::ringbuffer<std::string>(1);
    assigned = copy;
    CHECK(assigned.capacity() == 3);
    CHECK(assigned.is_empty());
}

TEST("ringbuffer - move")
{
    auto buffer = sk::ringbuffer<int>(4);
    CHECK(buffer.put(1));
    CHECK(buffer.put(2));

    auto moved = sk::move(buffer);
    CHECK(moved.count() == 2);
    CHECK(moved.get() == 1);

    // moved-from buffers are empty and usable
    CHECK(buffer.is_empty()); // NOLINT(bugprone-use-after-move)
    CHECK(buffer.put(9));
    CHECK(buffer.get() == 9);

    buffer = sk::move(moved);
    CHECK(buffer.get() == 2);
    CHECK(buffer.rewind());
    CHECK(buffer.peek() == 2);
}
