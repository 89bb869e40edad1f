#include <assoc-core/span.hh>
#include <assoc-core/vector.hh>

#include <nexus/test.hh>

static_assert(std::is_trivially_copyable_v<ac::span<int>>, "span should be trivially copyable");

namespace
{
struct non_trivial
{
    int value = 0;
    ~non_trivial() {} // makes it non-trivial
};

ac::isize sum(ac::span<int const> values)
{
    ac::isize s = 0;
    for (auto v : values)
        s += v;
    return s;
}
} // namespace

static_assert(std::is_trivially_copyable_v<ac::span<non_trivial>>,
              "span should be trivially copyable even with non-trivial T");

TEST("span - construction")
{
    SECTION("default construction")
    {
        auto const s = ac::span<int>{};
        CHECK(s.data() == nullptr);
        CHECK(s.size() == 0);
        CHECK(s.empty());
        CHECK(s.begin() == s.end());
    }

    SECTION("pointer + size")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = ac::span<int>{data, 5};
        CHECK(s.data() == data);
        CHECK(s.size() == 5);
        CHECK(s.front() == 1);
        CHECK(s.back() == 5);
    }

    SECTION("two pointers")
    {
        int data[] = {1, 2, 3, 4, 5};
        auto const s = ac::span<int>{data + 1, data + 4};
        CHECK(s.size() == 3);
        CHECK(s[0] == 2);
        CHECK(s[2] == 4);
    }

    SECTION("C array")
    {
        int data[] = {7, 8};
        ac::span<int> s = data;
        CHECK(s.size() == 2);
        s[1] = 9;
        CHECK(data[1] == 9);
    }

    SECTION("vector, implicitly as argument")
    {
        auto const v = ac::vector<int>{1, 2, 3};
        CHECK(sum(v) == 6);
    }

    SECTION("braced list as argument")
    {
        CHECK(sum({4, 5, 6}) == 15);
        CHECK(sum({}) == 0);
    }
}

TEST("span - range for visits all elements in order")
{
    int data[] = {3, 1, 2};
    auto const s = ac::span<int const>{data, 3};

    int visited[3] = {};
    int n = 0;
    for (auto const& v : s)
        visited[n++] = v;

    CHECK(n == 3);
    CHECK(visited[0] == 3);
    CHECK(visited[1] == 1);
    CHECK(visited[2] == 2);
}
