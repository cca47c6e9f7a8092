#include "SimulatedList.hpp"

#include <algorithm>

CSimElement::CSimElement(WP<CSimulatedList> list, eRole role) : m_list(list), m_role(role) {
    ;
}

SP<IElement> CSimElement::parent() {
    if (!m_list)
        return nullptr;

    switch (m_role) {
        case ROLE_CONTENT: return m_list->m_container ? SP<IElement>(m_list->m_container) : SP<IElement>(m_list->m_body);
        case ROLE_CONTAINER: return m_list->m_body;
        default: break;
    }

    return nullptr;
}

eOverflow CSimElement::overflowY() {
    return m_role == ROLE_CONTAINER ? OVERFLOW_AUTO : OVERFLOW_VISIBLE;
}

CBox CSimElement::boundingBox() {
    if (!m_list)
        return {};

    switch (m_role) {
        case ROLE_BODY: return {0, m_list->m_container ? 0.0 : -m_list->m_scroll, 0, std::max(m_list->contentHeight(), m_list->m_viewportHeight)};
        case ROLE_CONTAINER: return {0, 0, 0, m_list->m_containerHeight};
        case ROLE_CONTENT: return {0, -m_list->m_scroll, 0, m_list->contentHeight()};
    }

    return {};
}

double CSimElement::scrollTop() {
    if (!m_list || m_role != ROLE_CONTAINER)
        return 0;

    return m_list->m_scroll;
}

void CSimElement::scrollBy(double dy) {
    if (!m_list || m_role != ROLE_CONTAINER)
        return;

    m_list->scrollBy(dy);
}

double CSimElement::scrollHeight() {
    if (!m_list)
        return 0;

    // the container holds just the list
    return m_role == ROLE_CONTAINER ? m_list->contentHeight() : boundingBox().h;
}

double CSimElement::clientHeight() {
    return boundingBox().h;
}

bool CSimElement::isDocumentRoot() {
    return m_role == ROLE_BODY;
}

CSimViewport::CSimViewport(WP<CSimulatedList> list) : m_list(list) {
    ;
}

double CSimViewport::scrollY() {
    if (!m_list || m_list->m_container)
        return 0;

    return m_list->m_scroll;
}

double CSimViewport::innerHeight() {
    return m_list ? m_list->m_viewportHeight : 0;
}

double CSimViewport::documentHeight() {
    if (!m_list)
        return 0;

    if (m_list->m_container)
        return std::max(m_list->m_containerHeight, m_list->m_viewportHeight);

    return std::max(m_list->contentHeight(), m_list->m_viewportHeight);
}

void CSimViewport::scrollBy(double dy) {
    if (!m_list || m_list->m_container)
        return;

    m_list->scrollBy(dy);
}

void CSimulatedList::build() {
    m_body     = makeShared<CSimElement>(m_self, CSimElement::ROLE_BODY);
    m_content  = makeShared<CSimElement>(m_self, CSimElement::ROLE_CONTENT);
    m_viewport = makeShared<CSimViewport>(m_self);

    if (m_containerHeight > 0)
        m_container = makeShared<CSimElement>(m_self, CSimElement::ROLE_CONTAINER);
}

bool CSimulatedList::built() const {
    return !!m_content;
}

double CSimulatedList::contentHeight() const {
    return m_items * m_itemHeight;
}

double CSimulatedList::maxScroll() const {
    const auto VISIBLE = m_containerHeight > 0 ? m_containerHeight : m_viewportHeight;
    return std::max(0.0, contentHeight() - VISIBLE);
}

void CSimulatedList::scrollTo(double y) {
    m_scroll = std::clamp(y, 0.0, maxScroll());
}

void CSimulatedList::scrollBy(double dy) {
    scrollTo(m_scroll + dy);
}

SP<IElement> CSimulatedList::content() const {
    return m_content;
}

SP<IViewport> CSimulatedList::viewport() const {
    return m_viewport;
}
