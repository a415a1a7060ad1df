#include <nsrb/ring.hh>

#include <nexus/test.hh>

#include <type_traits>
#include <utility>

static_assert(nsrb::ring<int, 10>::capacity() == 10);
static_assert(std::is_same_v<nsrb::ring<int, 10>::index_t, nsrb::isize>);
static_assert(std::is_same_v<decltype(std::declval<nsrb::ring<int, 10>&>().pop()), nsrb::optional<int&>>);
static_assert(std::is_trivially_copyable_v<nsrb::ring<int, 10>>);

// no allocation, the storage is part of the object
static_assert(sizeof(nsrb::ring<int, 10>) >= sizeof(int) * 10);

namespace
{
struct log_entry
{
    nsrb::u64 timestamp;
    char text[16];
};
} // namespace

TEST("ring - fresh ring is empty")
{
    nsrb::ring<int, 10> rb;

    CHECK(rb.empty());
    CHECK(rb.size() == 0);
    CHECK(rb.head() == 0);
    CHECK(rb.tail() == 0);
    CHECK(!rb.pop().has_value());

    for (auto v : rb.buffer())
        CHECK(v == 0);

    SECTION("popping an empty ring stays empty")
    {
        for (auto i = 0; i < 5; ++i)
            CHECK(rb.pop() == nsrb::nullopt);
        CHECK(rb.head() == 0);
        CHECK(rb.tail() == 0);
    }
}

TEST("ring - push and pop")
{
    nsrb::ring<nsrb::isize, 10> rb;

    for (nsrb::isize i = 0; i < 15; ++i)
        rb.push(i);

    for (nsrb::isize i = 6; i < 15; ++i)
    {
        auto v = rb.pop();
        REQUIRE(v.has_value());
        CHECK(v.value() == i);
    }

    CHECK(!rb.pop().has_value());
    CHECK(!rb.pop().has_value());
}

TEST("ring - round trip below capacity")
{
    nsrb::ring<int, 8> rb;
    int const values[] = {42, -3, 17, 0, 99, 5, 8};

    for (auto v : values)
        rb.push(v);
    CHECK(rb.size() == 7);

    for (auto v : values)
        CHECK(rb.pop() == v);

    CHECK(rb.empty());
    CHECK(rb.pop() == nsrb::nullopt);
}

TEST("ring - interleaved push and pop")
{
    nsrb::ring<int, 4> rb;

    rb.push(1);
    rb.push(2);
    CHECK(rb.pop() == 1);
    rb.push(3);
    rb.push(4);
    CHECK(rb.size() == 3);
    CHECK(rb.pop() == 2);
    rb.push(5);
    rb.push(6); // evicts 3
    CHECK(rb.size() == 3);
    CHECK(rb.pop() == 4);
    CHECK(rb.pop() == 5);
    CHECK(rb.pop() == 6);
    CHECK(rb.pop() == nsrb::nullopt);

    // cursors wrapped at least once
    CHECK(rb.head() == rb.tail());
    CHECK(rb.head() == 2);
}

TEST("ring - full ring evicts the oldest element")
{
    SECTION("capacity 10")
    {
        nsrb::ring<int, 10> rb;

        for (auto i = 1; i <= 9; ++i)
            rb.push(i);
        CHECK(rb.size() == 9);
        CHECK(rb.tail() == 0);
        CHECK(rb.head() == 9);

        rb.push(10);
        CHECK(rb.size() == 9);
        CHECK(rb.head() == 0);
        CHECK(rb.tail() == 1);

        CHECK(rb.pop() == 2);
    }

    SECTION("capacity 2 holds a single element")
    {
        nsrb::ring<int, 2> rb;

        rb.push(1);
        CHECK(rb.size() == 1);
        rb.push(2);
        CHECK(rb.size() == 1);
        rb.push(3);
        CHECK(rb.size() == 1);

        CHECK(rb.pop() == 3);
        CHECK(rb.pop() == nsrb::nullopt);
    }

    SECTION("every capacity keeps the newest capacity - 1 elements")
    {
        auto check_capacity = []<nsrb::isize N>(nsrb::ring<int, N> rb)
        {
            for (auto i = 0; i < int(N) * 3 + 1; ++i)
                rb.push(i);

            CHECK(rb.size() == N - 1);

            auto expected = int(N) * 3 + 1 - int(N - 1);
            for (auto v = rb.pop(); v.has_value(); v = rb.pop())
            {
                CHECK(v.value() == expected);
                ++expected;
            }
            CHECK(expected == int(N) * 3 + 1);
        };

        check_capacity(nsrb::ring<int, 2>());
        check_capacity(nsrb::ring<int, 3>());
        check_capacity(nsrb::ring<int, 7>());
        check_capacity(nsrb::ring<int, 16>());
        check_capacity(nsrb::ring<int, 100>());
    }
}

TEST("ring - size tracks pushes, pops and clear")
{
    nsrb::ring<nsrb::isize, 50> rb;

    CHECK(rb.size() == 0);

    for (auto i = 0; i < 15; ++i)
        rb.push(i);
    CHECK(rb.size() == 15);

    rb.clear();
    CHECK(rb.size() == 0);
    CHECK(rb.empty());

    // fill up until head wraps behind tail
    while (rb.tail() <= rb.head())
        rb.push(0);
    CHECK(rb.size() == 35);

    rb.clear();
    CHECK(rb.size() == 0);

    SECTION("size saturates at capacity - 1")
    {
        nsrb::ring<nsrb::isize, 50> r;

        for (nsrb::isize i = 0; i < 255; ++i)
        {
            if (i < r.capacity())
                CHECK(r.size() == i);
            else
                CHECK(r.size() == 49);

            r.push(i);
        }

        (void)r.pop();
        CHECK(r.size() == 48);
    }
}

TEST("ring - clear")
{
    nsrb::ring<int, 5> rb;
    rb.push(1);
    rb.push(2);
    rb.push(3);

    rb.clear();

    CHECK(rb.empty());
    CHECK(rb.pop() == nsrb::nullopt);
    CHECK(rb.head() == 3);
    CHECK(rb.tail() == 3);

    SECTION("storage is kept")
    {
        CHECK(rb.buffer()[0] == 1);
        CHECK(rb.buffer()[1] == 2);
        CHECK(rb.buffer()[2] == 3);
    }

    SECTION("behaves like a fresh ring afterwards")
    {
        rb.push(7);
        rb.push(8);
        CHECK(rb.pop() == 7);
        CHECK(rb.pop() == 8);
        CHECK(rb.pop() == nsrb::nullopt);
    }

    SECTION("clearing an empty ring is a no-op")
    {
        auto const head = rb.head();
        rb.clear();
        CHECK(rb.empty());
        CHECK(rb.head() == head);
        CHECK(rb.tail() == head);
    }
}

TEST("ring - pop returns a reference into the storage")
{
    nsrb::ring<int, 4> rb;
    rb.push(11);
    rb.push(22);

    auto first = rb.pop();
    REQUIRE(first.has_value());
    CHECK(&first.value() == &rb.buffer()[0]);

    auto second = rb.pop();
    REQUIRE(second.has_value());
    CHECK(&second.value() == &rb.buffer()[1]);

    // the slot is reused once the ring wraps around to it
    rb.push(33);
    rb.push(44);
    rb.push(55);
    CHECK(first.value() == 55);
}

TEST("ring - copies are independent")
{
    nsrb::ring<int, 4> a;
    a.push(1);
    a.push(2);

    auto b = a;
    CHECK(a.pop() == 1);
    CHECK(b.size() == 2);
    CHECK(b.pop() == 1);
    CHECK(b.pop() == 2);
    CHECK(a.pop() == 2);
}

TEST("ring - aggregate elements")
{
    nsrb::ring<log_entry, 3> rb;

    rb.push({100, "boot"});
    rb.push({200, "ready"});
    rb.push({300, "shutdown"}); // evicts "boot"

    auto e = rb.pop();
    REQUIRE(e.has_value());
    CHECK(e.value().timestamp == 200);
    CHECK(e.value().text[0] == 'r');

    e = rb.pop();
    REQUIRE(e.has_value());
    CHECK(e.value().timestamp == 300);

    CHECK(!rb.pop().has_value());
}

TEST("ring - constexpr usage")
{
    constexpr auto sum = []() constexpr
    {
        nsrb::ring<int, 4> rb;
        for (auto i = 1; i <= 6; ++i)
            rb.push(i);

        int total = 0;
        for (auto v = rb.pop(); v.has_value(); v = rb.pop())
            total += v.value();
        return total;
    }();

    static_assert(sum == 4 + 5 + 6);
    CHECK(sum == 15);
}
