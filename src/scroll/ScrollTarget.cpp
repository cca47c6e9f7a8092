#include "ScrollTarget.hpp"
#include "../debug/log/Logger.hpp"

#include <algorithm>

// slack for sub-pixel layouts when comparing an inner container's bottom edge
constexpr const double BOTTOM_EDGE_SLACK = 1.0;

CScrollTarget::CScrollTarget(SP<IElement> element, SP<IViewport> viewport) : m_element(element), m_viewport(viewport) {
    ;
}

SP<CScrollTarget> CScrollTarget::resolve(SP<IElement> root, SP<IViewport> viewport) {
    auto current = root;

    while (current && !current->isDocumentRoot()) {
        const auto OVERFLOW = current->overflowY();
        if (OVERFLOW == OVERFLOW_SCROLL || OVERFLOW == OVERFLOW_AUTO) {
            Log::logger->log(Log::TRACE, "CScrollTarget::resolve: using an inner scroll container");
            return SP<CScrollTarget>(new CScrollTarget(current, viewport));
        }

        current = current->parent();
    }

    Log::logger->log(Log::TRACE, "CScrollTarget::resolve: no scrollable ancestor, using the viewport");
    return SP<CScrollTarget>(new CScrollTarget(nullptr, viewport));
}

bool CScrollTarget::isViewport() const {
    return !m_element;
}

SP<IElement> CScrollTarget::element() const {
    return m_element;
}

double CScrollTarget::scrollOffset() {
    if (m_element)
        return std::max(0.0, m_element->scrollTop());

    return m_viewport ? std::max(0.0, m_viewport->scrollY()) : 0.0;
}

CBox CScrollTarget::visibleBox() {
    if (m_element)
        return m_element->boundingBox();

    return CBox{0, 0, 0, m_viewport ? m_viewport->innerHeight() : 0.0};
}

bool CScrollTarget::contentFilled(SP<IElement> content) {
    if (!content)
        return false;

    if (m_element && m_element == content)
        return m_element->scrollHeight() >= m_element->clientHeight();

    const auto BOX     = content->boundingBox();
    const auto VISIBLE = visibleBox();
    return BOX.y + BOX.h >= VISIBLE.y + VISIBLE.h;
}

bool CScrollTarget::bottomReached(SP<IElement> content) {
    if (m_element) {
        // its own box never moves, only the scroll extent tells where the end is
        if (m_element == content)
            return scrollOffset() + m_element->clientHeight() >= m_element->scrollHeight() - BOTTOM_EDGE_SLACK;

        if (!content)
            return false;

        const auto BOX     = content->boundingBox();
        const auto VISIBLE = visibleBox();
        return BOX.y + BOX.h <= VISIBLE.y + VISIBLE.h + BOTTOM_EDGE_SLACK;
    }

    if (!m_viewport)
        return false;

    return scrollOffset() + m_viewport->innerHeight() >= m_viewport->documentHeight();
}

void CScrollTarget::scrollBy(double dy) {
    if (m_element)
        m_element->scrollBy(dy);
    else if (m_viewport)
        m_viewport->scrollBy(dy);
}
