#include "AutoFillController.hpp"
#include "../managers/eventLoop/EventLoopManager.hpp"
#include "../debug/log/Logger.hpp"

CAutoFillController::CAutoFillController(bool enabled, SP<CScrollTarget> target, SP<IElement> content, WP<CEventLoopManager> loop, std::function<bool()> requestLoad) :
    m_enabled(enabled), m_target(target), m_content(content), m_loop(loop), m_requestLoad(std::move(requestLoad)) {
    ;
}

void CAutoFillController::check() {
    if (!m_enabled || m_filled || m_pending)
        return;

    if (!m_loop) {
        Log::logger->log(Log::ERR, "CAutoFillController::check: event loop is gone");
        return;
    }

    m_pending = true;

    // layout of freshly loaded content settles before the next tick
    m_loop->doLater([self = m_self] {
        if (!self)
            return;

        self->m_pending = false;
        self->measure();
    });
}

void CAutoFillController::measure() {
    if (!m_target || !m_content)
        return;

    m_filled = m_target->contentFilled(m_content);

    if (m_filled) {
        Log::logger->log(Log::TRACE, "CAutoFillController: content fills the scroll target");
        return;
    }

    Log::logger->log(Log::DEBUG, "CAutoFillController: content is shorter than the scroll target, loading more");

    if (!m_requestLoad || !m_requestLoad())
        Log::logger->log(Log::TRACE, "CAutoFillController: bottom load refused");
}

bool CAutoFillController::enabled() const {
    return m_enabled;
}

bool CAutoFillController::containerFilled() const {
    return m_filled;
}

bool CAutoFillController::pending() const {
    return m_pending;
}
