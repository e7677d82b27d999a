#include <genseq/assert-handler.hh>
#include <genseq/assert.hh>
#include <genseq/generate.hh>

#include <nexus/test.hh>

#include <optional>
#include <vector>


TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<gs::impl::assertion_info> captured;
    // CAREFUL: this is a bit brittle wrt. formatting but it should be fine
    int const test_line = __LINE__ + 11; // line where GS_ASSERT_ALWAYS is called

    {
        auto handler = gs::impl::scoped_assertion_handler(
            [&](gs::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            GS_ASSERT_ALWAYS(1 + 1 == 3, "arithmetic is broken");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    // Expression: should contain the stringified condition
    CHECK(captured->expression.find("1 + 1 == 3") != std::string::npos);

    CHECK(captured->message == "arithmetic is broken");

    // Location: file name should end with this test file
    auto file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));

    // Location: line should be exact
    CHECK(captured->location.line() == test_line);

    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;

    {
        auto handler
            = gs::impl::scoped_assertion_handler([&](gs::impl::assertion_info const&) { handler_called = true; });
        GS_ASSERT_ALWAYS(true, "should not matter");
        GS_ASSERT(2 > 1, "should not matter either");
    }

    CHECK(!handler_called);
}

TEST("assertions - handler stack is LIFO and nesting works")
{
    std::vector<int> events;

    auto handler_a = gs::impl::scoped_assertion_handler(
        [&](gs::impl::assertion_info const&)
        {
            events.push_back(1); // handler A
            throw 0;
        });

    {
        auto handler_b = gs::impl::scoped_assertion_handler(
            [&](gs::impl::assertion_info const&)
            {
                events.push_back(2); // handler B
                throw 0;
            });

        try
        {
            GS_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }
    // B is now popped

    try
    {
        GS_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2); // first failure hit handler B
    CHECK(events[1] == 1); // second failure hit handler A
}

TEST("assertions - scoped_assertion_handler pops on scope exit even when handler throws")
{
    std::vector<int> events;
    bool outer_handler_works = false;

    auto outer = gs::impl::scoped_assertion_handler(
        [&](gs::impl::assertion_info const&)
        {
            events.push_back(1);
            outer_handler_works = true;
            throw 0; // Must throw to prevent abort
        });

    struct sentinel_exception
    {
    };

    try
    {
        auto inner = gs::impl::scoped_assertion_handler(
            [&](gs::impl::assertion_info const&)
            {
                events.push_back(2);
                throw sentinel_exception{};
            });

        GS_ASSERT_ALWAYS(false, "trigger inner");
        CHECK(false); // should not reach here
    }
    catch (sentinel_exception const&)
    {
        // Expected: inner handler threw
    }

    REQUIRE(events.size() == 1);
    CHECK(events[0] == 2);

    // the inner handler is gone, the outer one takes over again
    outer_handler_works = false;
    try
    {
        GS_ASSERT_ALWAYS(false, "trigger outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_handler_works);
    REQUIRE(events.size() == 2);
    CHECK(events[1] == 1);
}

TEST("assertions - manual push and pop")
{
    int calls = 0;
    gs::impl::push_assertion_handler(
        [&](gs::impl::assertion_info const&)
        {
            ++calls;
            throw 0;
        });

    try
    {
        GS_ASSERT_ALWAYS(false, "pushed handler");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    gs::impl::pop_assertion_handler();
    CHECK(calls == 1);
}

TEST("assertions - reading a traversal outside its valid window is reported")
{
    std::vector<gs::impl::assertion_info> captures;

    auto const range = gs::make_generating_range( //
        [] { return 1; },
        [](int x) -> gs::optional<int>
        {
            if (x >= 2)
                return gs::nullopt;
            return x + 1;
        });

    auto handler = gs::impl::scoped_assertion_handler(
        [&](gs::impl::assertion_info const& info)
        {
            captures.push_back(info);
            throw 0;
        });

    auto cursor = range.traverse();
    try
    {
        (void)cursor.current();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    while (cursor.advance())
    {
    }

    try
    {
        (void)cursor.current();
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(captures.size() == 2);
    CHECK(captures[0].message.find("never called") != std::string::npos);
    CHECK(captures[1].message.find("terminated") != std::string::npos);

    // reported where the check lives, not at the call site
    CHECK(std::string(captures[0].location.file_name()).ends_with("generating_range.hh"));
}

TEST("assertions - multiple failures produce independent reports")
{
    std::vector<gs::impl::assertion_info> captures;
    int const line1 = __LINE__ + 12;
    int const line2 = __LINE__ + 18;

    {
        auto handler = gs::impl::scoped_assertion_handler(
            [&](gs::impl::assertion_info const& info)
            {
                captures.push_back(info);
                throw 0;
            });
        try
        {
            GS_ASSERT_ALWAYS(false, "first message");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
        try
        {
            GS_ASSERT_ALWAYS(1 > 2, "second message");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captures.size() == 2);

    CHECK(captures[0].expression.find("false") != std::string::npos);
    CHECK(captures[0].message == "first message");
    CHECK(captures[0].location.line() >= line1 - 1);
    CHECK(captures[0].location.line() <= line1 + 1);

    CHECK(captures[1].expression.find("1 > 2") != std::string::npos);
    CHECK(captures[1].message == "second message");
    CHECK(captures[1].location.line() >= line2 - 1);
    CHECK(captures[1].location.line() <= line2 + 1);

    CHECK(captures[0].location.line() != captures[1].location.line());
}
