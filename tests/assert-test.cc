#include <wrinkle/assert-handler.hh>
#include <wrinkle/assertf.hh>
#include <wrinkle/node_chain.hh>
#include <wrinkle/wrinkle_chain.hh>

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

// runs f under a handler that records the first failure and unwinds
template <class F>
std::optional<wr::impl::assertion_info> capture_assertion(F&& f)
{
    std::optional<wr::impl::assertion_info> captured;
    auto handler = wr::impl::scoped_assertion_handler(
        [&](wr::impl::assertion_info const& info)
        {
            captured = info;
            throw assertion_unwind{};
        });

    try
    {
        f();
    }
    catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
    {
    }

    return captured;
}
} // namespace

TEST("assertions - formatted failure reaches the handler")
{
    int const expected_line = __LINE__ + 1;
    auto const info = capture_assertion([] { WR_ASSERTF_ALWAYS(2 + 2 == 5, "slot {} has offset {}", 3, -1); });

    REQUIRE(info.has_value());
    CHECK(info->expression.find("2 + 2 == 5") != std::string::npos);
    CHECK(info->message == "slot 3 has offset -1");
    CHECK(std::string(info->location.file_name()).ends_with("assert-test.cc"));
    CHECK(info->location.line() == expected_line);
}

TEST("assertions - plain message")
{
    auto const info = capture_assertion([] { WR_ASSERT_ALWAYS(false, "chain is broken"); });

    REQUIRE(info.has_value());
    CHECK(info->message == "chain is broken");
    CHECK(info->expression == "false");
}

TEST("assertions - passing assertion does not evaluate its message")
{
    int evaluated = 0;
    auto count = [&]
    {
        ++evaluated;
        return 0;
    };

    auto const info = capture_assertion([&] { WR_ASSERTF_ALWAYS(1 < 2, "never formatted {}", count()); });

    CHECK(!info.has_value());
    CHECK(evaluated == 0);
}

TEST("assertions - innermost handler wins and is popped on scope exit")
{
    std::vector<char> calls;

    auto outer = wr::impl::scoped_assertion_handler(
        [&](wr::impl::assertion_info const&)
        {
            calls.push_back('o');
            throw assertion_unwind{};
        });

    try
    {
        auto inner = wr::impl::scoped_assertion_handler(
            [&](wr::impl::assertion_info const&)
            {
                calls.push_back('i');
                throw assertion_unwind{};
            });
        WR_ASSERT_ALWAYS(false, "inner");
    }
    catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        WR_ASSERT_ALWAYS(false, "outer");
    }
    catch (assertion_unwind const&) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(calls.size() == 2);
    CHECK(calls[0] == 'i');
    CHECK(calls[1] == 'o');
}

#if WR_ASSERT_ENABLED

TEST("assertions - node access through a dead id")
{
    wr::node_chain<int> chain;
    auto const id = chain.emplace_back(1);
    (void)chain.unlink(id);

    auto const info = capture_assertion([&] { (void)chain.value(id); });

    REQUIRE(info.has_value());
    CHECK(info->message.find("not part of the chain") != std::string::npos);
    CHECK(std::string(info->location.file_name()).ends_with("node_chain.hh"));
}

TEST("assertions - splicing before a dead node")
{
    wr::node_chain<int> chain;
    chain.emplace_back(1);

    auto const info = capture_assertion([&] { (void)chain.emplace_before(wr::node_id::none, 0); });

    REQUIRE(info.has_value());
    CHECK(info->message.find("emplace_before") != std::string::npos);
    CHECK(chain.size() == 1);
}

TEST("assertions - wrinkle access out of bounds")
{
    wr::wrinkle_chain chain;
    chain.reset(4);
    chain.add(1, 1);

    auto const info = capture_assertion([&] { (void)chain[1]; });

    REQUIRE(info.has_value());
    CHECK(info->message == "wrinkle 1 out of bounds (count: 1)");
}

#endif
