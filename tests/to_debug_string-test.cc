#include <assoc-core/assoc_dict.hh>
#include <assoc-core/assoc_set.hh>
#include <assoc-core/pair.hh>
#include <assoc-core/to_debug_string.hh>
#include <assoc-core/vector.hh>

#include <nexus/test.hh>

#include <string>
#include <tuple>
#include <vector>

namespace
{
// Type with only member to_string()
struct HasOnlyMember
{
    std::string to_string() const { return "only_member"; }
};

// Opaque struct for memory dump fallback
struct OpaqueType
{
    uint32_t a;
    uint16_t b;
    uint8_t c;
};
} // namespace

// =========================================================================================================
// Scalars and strings
// =========================================================================================================

TEST("to_debug_string - scalars")
{
    CHECK(ac::to_debug_string(42) == "42");
    CHECK(ac::to_debug_string(-7) == "-7");
    CHECK(ac::to_debug_string(1.5) == "1.5");
    CHECK(ac::to_debug_string(true) == "true");
    CHECK(ac::to_debug_string(false) == "false");
}

TEST("to_debug_string - strings are quoted")
{
    CHECK(ac::to_debug_string(std::string("hello")) == "\"hello\"");
    CHECK(ac::to_debug_string("literal") == "\"literal\"");
    CHECK(ac::to_debug_string(std::string()) == "\"\"");
}

TEST("to_debug_string - chars are quoted and escaped")
{
    CHECK(ac::to_debug_string('a') == "'a'");
    CHECK(ac::to_debug_string('\n') == "'\\n'");
    CHECK(ac::to_debug_string('\'') == "'\\''");
    CHECK(ac::to_debug_string('\x01') == "'\\x01'");
}

TEST("to_debug_string - member to_string() is used")
{
    CHECK(ac::to_debug_string(HasOnlyMember{}) == "only_member");
}

// =========================================================================================================
// Collections and tuples
// =========================================================================================================

TEST("to_debug_string - vectors format as []")
{
    CHECK(ac::to_debug_string(ac::vector<int>{}) == "[]");
    CHECK(ac::to_debug_string(ac::vector<int>{42}) == "[42]");
    CHECK(ac::to_debug_string(ac::vector<int>({1, 2, 3})) == "[1, 2, 3]");
    CHECK(ac::to_debug_string(std::vector<std::string>({"a", "b"})) == "[\"a\", \"b\"]");
}

TEST("to_debug_string - tuples and pairs format as ()")
{
    CHECK(ac::to_debug_string(std::make_tuple(1, std::string("x"))) == "(1, \"x\")");
    CHECK(ac::to_debug_string(ac::pair<int, char>{3, 'c'}) == "(3, 'c')");
    CHECK(ac::to_debug_string(std::tuple<>{}) == "()");
}

// =========================================================================================================
// Association containers
// =========================================================================================================

TEST("to_debug_string - sets format most recent first")
{
    CHECK(ac::to_debug_string(ac::assoc_set<int>::create_empty()) == "{}");
    CHECK(ac::to_debug_string(ac::assoc_set<int>::create_singleton(5)) == "{5}");
    CHECK(ac::to_debug_string(ac::assoc_set<int>::create_from_list({3, 1, 2, 3})) == "{3, 1, 2}");
    CHECK(ac::to_debug_string(ac::assoc_set<int>::create_empty().insert(1).insert(2)) == "{2, 1}");
}

TEST("to_debug_string - set elements use their own rendering")
{
    auto const words = ac::assoc_set<std::string>::create_from_list({"x", "y"});
    CHECK(ac::to_debug_string(words) == "{\"x\", \"y\"}");

    auto const inner = ac::assoc_set<int>::create_from_list({1, 2});
    auto const nested = ac::assoc_set<ac::assoc_set<int>>::create_from_list({inner, ac::assoc_set<int>::create_empty()});
    CHECK(ac::to_debug_string(nested) == "{{1, 2}, {}}");
}

TEST("to_debug_string - dictionaries format as {key: value}")
{
    using dict = ac::assoc_dict<int, std::string>;

    CHECK(ac::to_debug_string(dict::create_empty()) == "{}");
    CHECK(ac::to_debug_string(dict::create_singleton(1, "a")) == "{1: \"a\"}");
    CHECK(ac::to_debug_string(dict::create_empty().insert(1, "a").insert(2, "b")) == "{2: \"b\", 1: \"a\"}");

    auto const d = ac::assoc_dict<std::string, ac::vector<int>>::create_singleton("xs", ac::vector<int>({1, 2}));
    CHECK(ac::to_debug_string(d) == "{\"xs\": [1, 2]}");
}

// =========================================================================================================
// Fallback and truncation
// =========================================================================================================

TEST("to_debug_string - opaque struct produces hex dump")
{
    auto const result = ac::to_debug_string(OpaqueType{1, 2, 3});

    CHECK(result.starts_with("0x"));
    CHECK(result.size() > 2);
    for (auto c : result.substr(2))
        CHECK((c == '_' || (c >= '0' && c <= '9') || (c >= 'A' && c <= 'F')));
}

TEST("to_debug_string - large set truncates with ellipsis")
{
    auto s = ac::assoc_set<int>::create_empty();
    for (int i = 0; i < 200; ++i)
        s = s.insert(i);

    auto const result = ac::to_debug_string(s);
    CHECK(result.starts_with("{199, 198"));
    CHECK(result.ends_with(", ...}"));
    CHECK(result.size() < 120);
}

TEST("to_debug_string - large dictionary respects max_length")
{
    auto d = ac::assoc_dict<int, int>::create_empty();
    for (int i = 0; i < 100; ++i)
        d = d.insert(i, i * i);

    auto const result = ac::to_debug_string(d, {.max_length = 20});
    CHECK(result.starts_with("{99: 9801"));
    CHECK(result.ends_with(", ...}"));
    CHECK(result.size() < 40);
}

TEST("to_debug_string - large vector truncates")
{
    auto v = ac::vector<int>::create_with_capacity(500);
    for (int i = 0; i < 500; ++i)
        v.push_back(i);

    auto const result = ac::to_debug_string(v);
    CHECK(result.ends_with(", ...]"));
    CHECK(result.size() < 120);
}
