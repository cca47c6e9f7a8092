#include <gtest/gtest.h>
#include <replay/Replay.hpp>

TEST(Replay, RefreshTrace) {
    CReplay    replay(SPullConfig{.locale = "en_US"});

    const auto RESULT = replay.runString(R"#(
items 20
init
down 100
move 300
expect top drop
up
expect top loading
expect offset 50
expect loads top 1
loaded top
wait 200
expect top pull
expect offset 0
)#");

    ASSERT_TRUE(RESULT.has_value()) << RESULT.error();
    EXPECT_EQ(replay.failures(), 0);
}

TEST(Replay, FailedExpectIsCounted) {
    CReplay    replay(SPullConfig{});

    const auto RESULT = replay.runString("items 20\ninit\nexpect top loading\nexpect offset 10\n");

    ASSERT_TRUE(RESULT.has_value()) << RESULT.error();
    EXPECT_EQ(replay.failures(), 2);
}

TEST(Replay, MalformedLines) {
    EXPECT_FALSE(CReplay(SPullConfig{}).runString("down 100").has_value());         // before init
    EXPECT_FALSE(CReplay(SPullConfig{}).runString("jump 3").has_value());           // unknown
    EXPECT_FALSE(CReplay(SPullConfig{}).runString("items lots").has_value());       // not a number
    EXPECT_FALSE(CReplay(SPullConfig{}).runString("init\nloaded middle").has_value());
    EXPECT_FALSE(CReplay(SPullConfig{}).runString("init\ncontainer 300").has_value());
    EXPECT_FALSE(CReplay(SPullConfig{}).runString("init\nexpect offset").has_value());
}

TEST(Replay, CommentsAndBlankLines) {
    CReplay replay(SPullConfig{});

    EXPECT_TRUE(replay.runString("# nothing\n\n   \ninit # trailing\n").has_value());
    EXPECT_TRUE(replay.pull()->initialized());
}

TEST(Replay, InnerContainerIsTheTarget) {
    CReplay    replay(SPullConfig{});

    const auto RESULT = replay.runString("container 400\nitems 20\ninit\nscroll 600\ndown 300\nmove 100\nexpect bottom drop\nup\nexpect loads bottom 1\n");

    ASSERT_TRUE(RESULT.has_value()) << RESULT.error();
    EXPECT_EQ(replay.failures(), 0);
    EXPECT_FALSE(replay.pull()->scrollTarget()->isViewport());
}
