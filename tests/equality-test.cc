#include <assoc-core/equality.hh>
#include <assoc-core/pair.hh>
#include <assoc-core/unit.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
// no operator==, equality is provided via ac::equality_traits below
struct ticket
{
    int id = 0;
    std::string note;
};

struct no_equality
{
    int x = 0;
};
} // namespace

template <>
struct ac::equality_traits<ticket>
{
    static bool equals(ticket const& a, ticket const& b) { return a.id == b.id; }
};

static_assert(ac::equality_comparable<int>);
static_assert(ac::equality_comparable<std::string>);
static_assert(ac::equality_comparable<std::vector<int>>);
static_assert(ac::equality_comparable<ac::unit>);
static_assert(ac::equality_comparable<ac::pair<int, std::string>>);
static_assert(ac::equality_comparable<ticket>);
static_assert(!ac::equality_comparable<no_equality>);

TEST("equality - default trait uses operator==")
{
    ac::structural_equal eq;

    CHECK(eq(1, 1));
    CHECK(!eq(1, 2));
    CHECK(eq(std::string("abc"), std::string("abc")));
    CHECK(!eq(std::string("abc"), std::string("abd")));
}

TEST("equality - nested values are compared structurally")
{
    ac::structural_equal eq;

    auto const a = std::vector<std::vector<int>>{{1, 2}, {3}};
    auto const b = std::vector<std::vector<int>>{{1, 2}, {3}};
    auto const c = std::vector<std::vector<int>>{{1}, {2, 3}};

    CHECK(eq(a, b));
    CHECK(!eq(a, c));

    CHECK(eq(ac::pair<int, std::string>{1, "x"}, ac::pair<int, std::string>{1, "x"}));
    CHECK(!eq(ac::pair<int, std::string>{1, "x"}, ac::pair<int, std::string>{1, "y"}));
}

TEST("equality - custom trait replaces operator==")
{
    ac::structural_equal eq;

    CHECK(eq(ticket{7, "open"}, ticket{7, "closed"}));
    CHECK(!eq(ticket{7, "open"}, ticket{8, "open"}));
}

TEST("equality - unit values are all equal")
{
    CHECK(ac::structural_equal{}(ac::unit{}, ac::unit{}));
}
