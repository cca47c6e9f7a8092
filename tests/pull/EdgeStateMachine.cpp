#include <gtest/gtest.h>
#include <pull/EdgeStateMachine.hpp>

#include <vector>

TEST(EdgeStateMachine, BottomStartsIdleUntilInit) {
    CEdgeStateMachine bottom(PULL_EDGE_BOTTOM, 70.F, PULL_STATUS_IDLE);

    EXPECT_EQ(bottom.status(), PULL_STATUS_IDLE);
    bottom.init();
    EXPECT_EQ(bottom.status(), PULL_STATUS_PULL);
}

TEST(EdgeStateMachine, ThresholdIsInclusive) {
    CEdgeStateMachine top(PULL_EDGE_TOP, 70.F, PULL_STATUS_PULL);

    top.update(69.9F);
    EXPECT_EQ(top.status(), PULL_STATUS_PULL);

    top.update(70.F);
    EXPECT_EQ(top.status(), PULL_STATUS_DROP);

    top.update(10.F);
    EXPECT_EQ(top.status(), PULL_STATUS_PULL);
}

TEST(EdgeStateMachine, ReleaseFromDropStartsLoading) {
    CEdgeStateMachine top(PULL_EDGE_TOP, 70.F, PULL_STATUS_PULL);

    top.update(100.F);
    EXPECT_TRUE(top.release());
    EXPECT_EQ(top.status(), PULL_STATUS_LOADING);
    EXPECT_TRUE(top.dropped());

    // a second release while loading does nothing
    EXPECT_FALSE(top.release());
    EXPECT_EQ(top.status(), PULL_STATUS_LOADING);
}

TEST(EdgeStateMachine, ReleaseFromPullDoesNotLoad) {
    CEdgeStateMachine top(PULL_EDGE_TOP, 150.F, PULL_STATUS_PULL);

    top.update(100.F);
    EXPECT_FALSE(top.release());
    EXPECT_EQ(top.status(), PULL_STATUS_PULL);
    EXPECT_TRUE(top.dropped());

    top.resetForGesture();
    EXPECT_FALSE(top.dropped());
}

TEST(EdgeStateMachine, LoadingIgnoresGestures) {
    CEdgeStateMachine bottom(PULL_EDGE_BOTTOM, 70.F, PULL_STATUS_PULL);

    ASSERT_TRUE(bottom.beginLoading());
    EXPECT_FALSE(bottom.beginLoading());

    bottom.resetForGesture();
    bottom.update(0.F);
    bottom.abandon();
    EXPECT_EQ(bottom.status(), PULL_STATUS_LOADING);

    bottom.finish();
    EXPECT_EQ(bottom.status(), PULL_STATUS_PULL);
    EXPECT_FALSE(bottom.dropped());
}

TEST(EdgeStateMachine, EmitsOnlyRealTransitions) {
    CEdgeStateMachine        top(PULL_EDGE_TOP, 70.F, PULL_STATUS_PULL);
    std::vector<ePullStatus> seen;

    auto                     listener = top.m_events.statusChange.listen([&seen](ePullStatus s) { seen.emplace_back(s); });

    top.update(10.F);
    top.update(80.F);
    top.update(90.F);
    top.release();
    top.finish();

    EXPECT_EQ(seen, (std::vector<ePullStatus>{PULL_STATUS_DROP, PULL_STATUS_LOADING, PULL_STATUS_PULL}));
}
