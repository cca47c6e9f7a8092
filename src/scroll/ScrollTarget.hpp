#pragma once

#include "Element.hpp"

/*
    The element (or viewport) whose scrolling the pull decoration watches.
    Resolved once and immutable afterwards.
*/
class CScrollTarget {
  public:
    // walks up from root to the nearest overflow-y: scroll / auto ancestor, or falls back to the viewport.
    static SP<CScrollTarget> resolve(SP<IElement> root, SP<IViewport> viewport);

    bool                     isViewport() const;
    SP<IElement>             element() const;

    // current vertical scroll offset, never negative
    double scrollOffset();

    // visible area in viewport coordinates. Only y / h are meaningful for the viewport.
    CBox   visibleBox();

    // content (the decorated block) reaches or passes the visible bottom.
    // When content is the target itself its children are measured instead.
    bool   contentFilled(SP<IElement> content);

    // scrolled all the way down. Inner containers allow 1px of slack.
    bool   bottomReached(SP<IElement> content);

    void   scrollBy(double dy);

  private:
    CScrollTarget(SP<IElement> element, SP<IViewport> viewport);

    SP<IElement>  m_element;
    SP<IViewport> m_viewport;
};
