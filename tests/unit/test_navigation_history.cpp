#include <gtest/gtest.h>

#include "history/navigation_history.hpp"

using namespace tabshell;

// ─── Seeding ─────────────────────────────────────────────────────────────────

TEST(NavigationHistorySeed, RealLocationIsFirstEntry)
{
    NavigationHistory h("https://a.test");
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.index(), 0u);
    EXPECT_EQ(h.current(), "https://a.test");
    EXPECT_FALSE(h.is_unvisited());
    EXPECT_FALSE(h.can_go_back());
    EXPECT_FALSE(h.can_go_forward());
}

TEST(NavigationHistorySeed, EmptySeedBecomesBlank)
{
    NavigationHistory h("");
    EXPECT_EQ(h.current(), "about:blank");
    EXPECT_TRUE(h.is_unvisited());
}

TEST(NavigationHistorySeed, CustomBlankLocation)
{
    NavigationHistory h("", "tabshell://newtab");
    EXPECT_EQ(h.current(), "tabshell://newtab");
    EXPECT_TRUE(h.is_unvisited());
}

TEST(NavigationHistorySeed, FirstPushReplacesBlank)
{
    NavigationHistory h("about:blank");
    h.push("https://a.test");
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.current(), "https://a.test");
    EXPECT_FALSE(h.can_go_back());
    EXPECT_FALSE(h.is_unvisited());
}

// ─── Push / Back / Forward ───────────────────────────────────────────────────

TEST(NavigationHistory, PushAppendsAndMovesCursor)
{
    NavigationHistory h("https://a.test");
    h.push("https://b.test");
    h.push("https://c.test");
    EXPECT_EQ(h.size(), 3u);
    EXPECT_EQ(h.index(), 2u);
    EXPECT_TRUE(h.can_go_back());
    EXPECT_FALSE(h.can_go_forward());
}

TEST(NavigationHistory, BackAndForwardRoundTrip)
{
    NavigationHistory h("https://a.test");
    h.push("https://b.test");

    EXPECT_TRUE(h.back());
    EXPECT_EQ(h.current(), "https://a.test");
    EXPECT_TRUE(h.can_go_forward());

    EXPECT_TRUE(h.forward());
    EXPECT_EQ(h.current(), "https://b.test");
}

TEST(NavigationHistory, BackAtStartFails)
{
    NavigationHistory h("https://a.test");
    EXPECT_FALSE(h.back());
    EXPECT_EQ(h.index(), 0u);
}

TEST(NavigationHistory, ForwardAtEndFails)
{
    NavigationHistory h("https://a.test");
    h.push("https://b.test");
    EXPECT_FALSE(h.forward());
    EXPECT_EQ(h.index(), 1u);
}

TEST(NavigationHistory, PushTruncatesForwardBranch)
{
    NavigationHistory h("https://a.test");
    h.push("https://b.test");
    h.push("https://c.test");
    h.back();
    h.back();

    h.push("https://d.test");
    EXPECT_EQ(h.size(), 2u);
    EXPECT_EQ(h.entries()[0], "https://a.test");
    EXPECT_EQ(h.entries()[1], "https://d.test");
    EXPECT_FALSE(h.can_go_forward());
}

TEST(NavigationHistory, IndexAlwaysInRange)
{
    NavigationHistory h("about:blank");
    for (int i = 0; i < 20; ++i)
    {
        if (i % 3 == 2)
            h.back();
        else
            h.push("https://p" + std::to_string(i) + ".test");
        EXPECT_LT(h.index(), h.size());
    }
}
