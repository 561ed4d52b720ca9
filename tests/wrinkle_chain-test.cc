#include <wrinkle/wrinkle_chain.hh>

#include <nexus/test.hh>

#include <vector>

using wr::isize;

namespace
{
bool has_wrinkles(wr::wrinkle_chain const& chain, std::vector<wr::wrinkle> const& expected)
{
    return std::vector<wr::wrinkle>(chain.begin(), chain.end()) == expected;
}
} // namespace

TEST("wrinkle_chain - without wrinkles translation is the identity")
{
    wr::wrinkle_chain chain;
    chain.reset(10);

    CHECK(chain.empty());
    CHECK(chain.backbone_length() == 10);

    for (isize i = 0; i < 10; ++i)
    {
        CHECK(chain.to_logical(i) == i);
        CHECK(chain.to_backbone(i) == i);
    }

    SECTION("tail positions map to the backbone end")
    {
        CHECK(chain.to_backbone(10) == 10);
        CHECK(chain.to_backbone(11) == 10);
        CHECK(chain.to_backbone(1000) == 10);
    }
}

TEST("wrinkle_chain - empty backbone")
{
    wr::wrinkle_chain chain;

    CHECK(chain.backbone_length() == 0);
    CHECK(chain.to_backbone(0) == 0);
    CHECK(chain.to_backbone(5) == 0);

    // nothing to correct, so nothing is recorded
    chain.add(0, 1);
    CHECK(chain.empty());
}

TEST("wrinkle_chain - add keeps wrinkles ascending and merges equal slots")
{
    auto make_chain = []
    {
        wr::wrinkle_chain chain;
        chain.reset(10);
        chain.add(5, 1);
        chain.add(2, -1);
        chain.add(8, 1);
        chain.add(5, 1);
        return chain;
    };

    SECTION("ascending and merged")
    {
        auto chain = make_chain();
        CHECK(has_wrinkles(chain, {{2, -1}, {5, 2}, {8, 1}}));
        CHECK(chain.is_well_formed());
    }

    SECTION("a wrinkle whose offset reaches zero disappears")
    {
        auto chain = make_chain();
        chain.add(2, 1);
        CHECK(has_wrinkles(chain, {{5, 2}, {8, 1}}));

        chain.add(5, -2);
        CHECK(has_wrinkles(chain, {{8, 1}}));
    }

    SECTION("slots beyond the backbone are ignored")
    {
        auto chain = make_chain();
        chain.add(10, 1);
        chain.add(42, -1);
        CHECK(chain.size() == 3);
    }

    SECTION("reset drops everything")
    {
        auto chain = make_chain();
        chain.reset(4);
        CHECK(chain.empty());
        CHECK(chain.backbone_length() == 4);
    }
}

TEST("wrinkle_chain - positive wrinkle shifts later slots")
{
    // two nodes inserted in front of slot 3
    wr::wrinkle_chain chain;
    chain.reset(10);
    chain.add(3, 2);

    CHECK(chain.to_logical(2) == 2);
    CHECK(chain.to_logical(3) == 5);
    CHECK(chain.to_logical(9) == 11);

    SECTION("positions inside the inserted run resolve to the run's slot")
    {
        CHECK(chain.to_backbone(3) == 3);
        CHECK(chain.to_backbone(4) == 3);
    }

    SECTION("positions of backbone nodes resolve to their own slot")
    {
        CHECK(chain.to_backbone(2) == 2);
        CHECK(chain.to_backbone(5) == 3);
        CHECK(chain.to_backbone(6) == 4);
        CHECK(chain.to_backbone(11) == 9);
    }

    SECTION("tail positions")
    {
        CHECK(chain.to_backbone(12) == 10);
        CHECK(chain.to_backbone(13) == 10);
    }
}

TEST("wrinkle_chain - negative wrinkle pulls later slots forward")
{
    // the node at slot 4 was removed
    wr::wrinkle_chain chain;
    chain.reset(10);
    chain.add(4, -1);

    CHECK(chain.to_logical(3) == 3);
    CHECK(chain.to_logical(4) == 3);
    CHECK(chain.to_logical(5) == 4);

    // slot 4 shares its logical position with slot 3 and is never chosen
    CHECK(chain.to_backbone(3) == 3);
    CHECK(chain.to_backbone(4) == 5);
    CHECK(chain.to_backbone(8) == 9);
    CHECK(chain.to_backbone(9) == 10);
}

TEST("wrinkle_chain - translation round-trip over mixed wrinkles")
{
    wr::wrinkle_chain chain;
    chain.reset(20);
    chain.add(2, 3);
    chain.add(7, -1);
    chain.add(11, 1);
    chain.add(15, -2);

    // every logical position resolves to a slot at or beyond it, never behind it
    for (isize li = 0; li < 24; ++li)
    {
        auto const bb = chain.to_backbone(li);
        CHECK(bb >= 0);
        CHECK(bb <= chain.backbone_length());
        if (bb < chain.backbone_length())
            CHECK(chain.to_logical(bb) >= li);
    }

    // logical positions never decrease from slot to slot
    for (isize bb = 1; bb < chain.backbone_length(); ++bb)
        CHECK(chain.to_logical(bb) >= chain.to_logical(bb - 1));
}

TEST("wrinkle_chain - is_well_formed")
{
    wr::wrinkle_chain chain;
    CHECK(chain.is_well_formed());

    chain.reset(3);
    chain.add(0, 1);
    chain.add(2, -1);
    CHECK(chain.is_well_formed());
    CHECK(chain[0].index == 0);
    CHECK(chain[0].offset == 1);
    CHECK(chain[1].index == 2);
    CHECK(chain[1].offset == -1);

    chain.clear();
    CHECK(chain.empty());
    CHECK(chain.backbone_length() == 3);
}
