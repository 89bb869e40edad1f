#include <assoc-core/assert-handler.hh>
#include <assoc-core/assertf.hh>
#include <assoc-core/function_ref.hh>
#include <assoc-core/vector.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>

namespace
{
// thrown by test handlers to unwind instead of aborting
struct assertion_unwind
{
};
} // namespace

TEST("assertions - formatted failure reaches the handler with expression, message and location")
{
    std::optional<ac::impl::assertion_info> captured;

    {
        auto handler = ac::impl::scoped_assertion_handler(
            [&](ac::impl::assertion_info const& info)
            {
                captured = info;
                throw assertion_unwind{};
            });

        try
        {
            int const idx = 7;
            AC_ASSERTF_ALWAYS(idx < 3, "index {} out of bounds (size: {})", idx, 3);
        }
        catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());
    CHECK(captured->expression.find("idx < 3") != std::string::npos);
    CHECK(captured->message == "index 7 out of bounds (size: 3)");
    CHECK(std::string(captured->location.file_name()).ends_with("assert-test.cc"));
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - passing assertion neither calls the handler nor evaluates message args")
{
    bool handler_called = false;
    int evaluations = 0;

    auto expensive = [&]() -> int
    {
        ++evaluations;
        return 1;
    };

    {
        auto handler = ac::impl::scoped_assertion_handler([&](ac::impl::assertion_info const&) { handler_called = true; });
        AC_ASSERTF_ALWAYS(2 > 1, "never formatted {}", expensive());
        AC_ASSERT_ALWAYS(true, "never reported");
    }

    CHECK(!handler_called);
    CHECK(evaluations == 0);
}

TEST("assertions - nested handlers are used innermost first and popped on scope exit")
{
    std::vector<char> events;

    auto outer = ac::impl::scoped_assertion_handler(
        [&](ac::impl::assertion_info const&)
        {
            events.push_back('o');
            throw assertion_unwind{};
        });

    {
        auto inner = ac::impl::scoped_assertion_handler(
            [&](ac::impl::assertion_info const&)
            {
                events.push_back('i');
                throw assertion_unwind{};
            });

        try
        {
            AC_ASSERT_ALWAYS(false, "hits inner");
        }
        catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        AC_ASSERT_ALWAYS(false, "hits outer");
    }
    catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 'i');
    CHECK(events[1] == 'o');
}

#if AC_ASSERT_ENABLED

TEST("assertions - container preconditions are checked")
{
    std::vector<std::string> messages;

    auto handler = ac::impl::scoped_assertion_handler(
        [&](ac::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw assertion_unwind{};
        });

    auto v = ac::vector<int>{1, 2, 3};

    SECTION("out of bounds index")
    {
        try
        {
            (void)v[3];
        }
        catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
        {
        }
        REQUIRE(messages.size() == 1);
        CHECK(messages[0] == "index 3 out of bounds (size: 3)");
    }

    SECTION("calling an unbound function_ref")
    {
        ac::function_ref<bool(int const&)> pred;
        try
        {
            (void)pred(1);
        }
        catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
        {
        }
        REQUIRE(messages.size() == 1);
        CHECK(messages[0] == "calling invalid function_ref is UB");
    }
}

#endif
