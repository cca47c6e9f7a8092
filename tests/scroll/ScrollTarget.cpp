#include <gtest/gtest.h>
#include <scroll/ScrollTarget.hpp>

#include "../shared/Fakes.hpp"

using namespace Tests;

namespace {
    struct STree {
        SP<CFakeElement>  body      = makeShared<CFakeElement>();
        SP<CFakeElement>  wrapper   = makeShared<CFakeElement>();
        SP<CFakeElement>  content   = makeShared<CFakeElement>();
        SP<CFakeViewport> viewport  = makeShared<CFakeViewport>();

        STree() {
            body->m_documentRoot = true;
            wrapper->m_parent    = body;
            content->m_parent    = wrapper;
        }
    };
}

TEST(ScrollTarget, FallsBackToViewport) {
    STree tree;

    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    ASSERT_TRUE(TARGET);
    EXPECT_TRUE(TARGET->isViewport());
    EXPECT_FALSE(TARGET->element());
}

TEST(ScrollTarget, PicksNearestScrollableAncestor) {
    STree tree;
    tree.wrapper->m_overflow = OVERFLOW_AUTO;

    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    EXPECT_FALSE(TARGET->isViewport());
    EXPECT_EQ(TARGET->element(), SP<IElement>(tree.wrapper));
}

TEST(ScrollTarget, RootItselfCanBeTheTarget) {
    STree tree;
    tree.content->m_overflow = OVERFLOW_SCROLL;
    tree.wrapper->m_overflow = OVERFLOW_AUTO;

    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    EXPECT_EQ(TARGET->element(), SP<IElement>(tree.content));
}

TEST(ScrollTarget, HiddenOverflowIsNotScrollable) {
    STree tree;
    tree.wrapper->m_overflow = OVERFLOW_HIDDEN;

    EXPECT_TRUE(CScrollTarget::resolve(tree.content, tree.viewport)->isViewport());
}

TEST(ScrollTarget, StopsAtDocumentRoot) {
    STree tree;
    // body scrolling is the viewport scrolling
    tree.body->m_overflow = OVERFLOW_AUTO;

    EXPECT_TRUE(CScrollTarget::resolve(tree.content, tree.viewport)->isViewport());
}

TEST(ScrollTarget, ViewportScrollOffsetIsNeverNegative) {
    STree tree;
    tree.viewport->m_scrollY = -30; // rubber banding

    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    EXPECT_EQ(TARGET->scrollOffset(), 0.0);
}

TEST(ScrollTarget, ViewportBottomReached) {
    STree tree;
    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    tree.viewport->m_scrollY = 399;
    EXPECT_FALSE(TARGET->bottomReached(tree.content));

    tree.viewport->m_scrollY = 400;
    EXPECT_TRUE(TARGET->bottomReached(tree.content));
}

TEST(ScrollTarget, ContainerBottomReachedWithinOnePixel) {
    STree tree;
    tree.wrapper->m_overflow = OVERFLOW_AUTO;
    tree.wrapper->m_box      = {0, 100, 0, 400};

    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    tree.content->m_box = {0, -500, 0, 1001.5}; // bottom at 501.5
    EXPECT_FALSE(TARGET->bottomReached(tree.content));

    tree.content->m_box = {0, -500, 0, 1000.5}; // bottom at 500.5
    EXPECT_TRUE(TARGET->bottomReached(tree.content));
}

TEST(ScrollTarget, ContentFilled) {
    STree tree;
    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    tree.content->m_box = {0, 0, 0, 599};
    EXPECT_FALSE(TARGET->contentFilled(tree.content));
    tree.content->m_box = {0, 0, 0, 600};
    EXPECT_TRUE(TARGET->contentFilled(tree.content));

    tree.wrapper->m_overflow = OVERFLOW_AUTO;
    tree.wrapper->m_box      = {0, 50, 0, 300};

    const auto INNER = CScrollTarget::resolve(tree.content, tree.viewport);

    tree.content->m_box = {0, 50, 0, 200};
    EXPECT_FALSE(INNER->contentFilled(tree.content));
    tree.content->m_box = {0, 50, 0, 300};
    EXPECT_TRUE(INNER->contentFilled(tree.content));
}

TEST(ScrollTarget, SelfScrollingRootUsesScrollExtent) {
    STree tree;
    tree.content->m_overflow     = OVERFLOW_SCROLL;
    tree.content->m_box          = {0, 0, 0, 600};
    tree.content->m_clientHeight = 600;
    tree.content->m_scrollHeight = 2000;

    const auto TARGET = CScrollTarget::resolve(tree.content, tree.viewport);

    // its own box always matches the visible area
    EXPECT_FALSE(TARGET->bottomReached(tree.content));
    EXPECT_TRUE(TARGET->contentFilled(tree.content));

    tree.content->m_scrollTop = 1398;
    EXPECT_FALSE(TARGET->bottomReached(tree.content));

    tree.content->m_scrollTop = 1399.5;
    EXPECT_TRUE(TARGET->bottomReached(tree.content));

    tree.content->m_scrollTop    = 0;
    tree.content->m_scrollHeight = 250;
    EXPECT_FALSE(TARGET->contentFilled(tree.content));
}

TEST(ScrollTarget, ElementScrollOffsetIsNeverNegative) {
    STree tree;
    tree.wrapper->m_overflow  = OVERFLOW_AUTO;
    tree.wrapper->m_scrollTop = -40; // overscroll bounce

    EXPECT_EQ(CScrollTarget::resolve(tree.content, tree.viewport)->scrollOffset(), 0.0);
}

TEST(ScrollTarget, ScrollByGoesToTheTarget) {
    STree tree;
    tree.wrapper->m_overflow = OVERFLOW_AUTO;

    CScrollTarget::resolve(tree.content, tree.viewport)->scrollBy(50);
    EXPECT_EQ(tree.wrapper->m_scrolledBy, 50);
    EXPECT_EQ(tree.viewport->m_scrolledBy, 0);

    CScrollTarget::resolve(tree.content, makeShared<CFakeViewport>())->scrollBy(25);
    EXPECT_EQ(tree.wrapper->m_scrolledBy, 75);
}
