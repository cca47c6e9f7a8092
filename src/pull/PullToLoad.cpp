#include "PullToLoad.hpp"
#include "../managers/eventLoop/EventLoopManager.hpp"
#include "../managers/eventLoop/EventLoopTimer.hpp"
#include "../debug/log/Logger.hpp"

#include <exception>
#include <format>

std::expected<SP<CPullToLoad>, std::string> CPullToLoad::create(const SPullConfig& config, const SPullLoaders& loaders, SP<IElement> root, SP<IViewport> viewport,
                                                                SP<CEventLoopManager> loop) {
    if (auto valid = config.validate(); !valid)
        return std::unexpected(std::format("invalid pull config: {}", valid.error()));

    if (!root)
        return std::unexpected("no root element to decorate");

    if (!viewport)
        return std::unexpected("no viewport");

    if (!loop)
        return std::unexpected("no event loop");

    // timers are registered through it
    if (!loop->m_self)
        return std::unexpected("event loop has no m_self");

    auto pull     = SP<CPullToLoad>(new CPullToLoad(config, loaders, root, viewport, loop));
    pull->m_self = pull;

    return pull;
}

CPullToLoad::CPullToLoad(const SPullConfig& config, const SPullLoaders& loaders, SP<IElement> root, SP<IViewport> viewport, SP<CEventLoopManager> loop) :
    m_config(config), m_labels(config.resolvedLabels()), m_loaders(loaders), m_root(root), m_viewport(viewport), m_loop(loop),
    m_tracker(config.distanceIndex, config.maxDistance), m_top(PULL_EDGE_TOP, config.topDistance, PULL_STATUS_PULL),
    m_bottom(PULL_EDGE_BOTTOM, config.bottomDistance, PULL_STATUS_IDLE), m_bottomAllLoaded(config.bottomAllLoaded) {

    m_topText    = labelFor(PULL_EDGE_TOP, m_top.status());
    m_bottomText = labelFor(PULL_EDGE_BOTTOM, m_bottom.status());

    m_listeners.topStatus = m_top.m_events.statusChange.listen([this](ePullStatus status) {
        m_topText = labelFor(PULL_EDGE_TOP, status);
        m_events.topStatusChange.emit(status);
    });

    m_listeners.bottomStatus = m_bottom.m_events.statusChange.listen([this](ePullStatus status) {
        m_bottomText = labelFor(PULL_EDGE_BOTTOM, status);
        m_events.bottomStatusChange.emit(status);
    });
}

CPullToLoad::~CPullToLoad() {
    for (auto& t : {m_topResetTimer, m_topTimeoutTimer, m_bottomTimeoutTimer}) {
        if (t)
            t->cancel();
    }
}

void CPullToLoad::init() {
    if (m_initialized)
        return;

    m_target = CScrollTarget::resolve(m_root, m_viewport);

    m_top.init();
    m_bottom.init();

    m_autoFill         = makeShared<CAutoFillController>(m_config.autoFill, m_target, m_root, m_loop, [self = m_self] { return self ? self->autoFillLoad() : false; });
    m_autoFill->m_self = m_autoFill;

    m_initialized = true;

    Log::logger->log(Log::DEBUG, "CPullToLoad: initialized (reload: {}, infinite: {}, target: {})", !!m_loaders.reload, !!m_loaders.infinite,
                     m_target->isViewport() ? "viewport" : "element");

    if (m_loaders.infinite)
        m_autoFill->check();
}

bool CPullToLoad::initialized() const {
    return m_initialized;
}

void CPullToLoad::attachTouch(SP<ITouch> touch) {
    if (!touch) {
        m_listeners.touchDown.reset();
        m_listeners.touchUp.reset();
        m_listeners.touchMotion.reset();
        m_listeners.touchCancel.reset();
        return;
    }

    Log::logger->log(Log::DEBUG, "CPullToLoad: listening to touch device {}", touch->deviceName());

    m_listeners.touchDown   = touch->m_touchEvents.down.listen([this](const ITouch::SDownEvent& e) { onTouchDown(e); });
    m_listeners.touchUp     = touch->m_touchEvents.up.listen([this](const ITouch::SUpEvent& e) { onTouchUp(e); });
    m_listeners.touchMotion = touch->m_touchEvents.motion.listen([this](const ITouch::SMotionEvent& e) { onTouchMotion(e); });
    m_listeners.touchCancel = touch->m_touchEvents.cancel.listen([this](const ITouch::SCancelEvent& e) { onTouchCancel(e); });
}

CEdgeStateMachine& CPullToLoad::machineFor(ePullEdge edge) {
    return edge == PULL_EDGE_TOP ? m_top : m_bottom;
}

SP<ILoader> CPullToLoad::loaderFor(ePullEdge edge) const {
    return edge == PULL_EDGE_TOP ? m_loaders.reload : m_loaders.infinite;
}

std::string CPullToLoad::labelFor(ePullEdge edge, ePullStatus status) const {
    switch (status) {
        case PULL_STATUS_PULL: return edge == PULL_EDGE_TOP ? m_labels.topPull : m_labels.bottomPull;
        case PULL_STATUS_DROP: return edge == PULL_EDGE_TOP ? m_labels.topDrop : m_labels.bottomDrop;
        case PULL_STATUS_LOADING: return m_labels.topLoading;
        default: break;
    }

    return "";
}

void CPullToLoad::setTranslate(float translate) {
    if (m_translate == translate)
        return;

    m_translate = translate;
    m_events.translateChange.emit(translate);
}

void CPullToLoad::onTouchDown(const ITouch::SDownEvent& e) {
    if (!m_initialized)
        return;

    // a new touch ends whatever session was still open, without activating it
    if (m_tracker.active())
        endSession(false);

    m_tracker.begin(e.touchID, e.pos.y, m_target->scrollOffset());

    m_top.resetForGesture();
    m_bottom.resetForGesture();
}

bool CPullToLoad::onTouchMotion(const ITouch::SMotionEvent& e) {
    m_lastMotionClaimed = false;

    if (!m_initialized || !m_tracker.ownsTouch(e.touchID))
        return false;

    m_tracker.move(e.pos.y);

    // the boundary is only crossed for an instant while the finger moves, so it's latched
    if (m_tracker.direction() == Math::DIRECTION_UP)
        m_tracker.latchBottomReached(m_target->bottomReached(m_root));

    const auto SCROLL = m_target->scrollOffset();
    const auto EDGE   = m_tracker.claimFor({
          .reloadConfigured   = !!m_loaders.reload,
          .infiniteConfigured = !!m_loaders.infinite,
          .scrollOffset       = SCROLL,
          .topStatus          = m_top.status(),
          .bottomStatus       = m_bottom.status(),
          .bottomAllLoaded    = m_bottomAllLoaded,
    });

    const auto PREVIOUS = m_tracker.claimed();
    if (PREVIOUS != PULL_EDGE_NONE && PREVIOUS != EDGE) {
        // claim lost, don't leave a stale drop around for the release
        machineFor(PREVIOUS).abandon();
        setTranslate(0.F);
    }

    m_tracker.setClaimed(EDGE);

    if (EDGE == PULL_EDGE_TOP) {
        setTranslate(m_tracker.topOffset());
        m_top.update(m_translate);
    } else if (EDGE == PULL_EDGE_BOTTOM) {
        setTranslate(m_tracker.bottomOffset(SCROLL));
        m_bottom.update(-m_translate);
    }

    m_lastMotionClaimed = EDGE != PULL_EDGE_NONE;
    return m_lastMotionClaimed;
}

void CPullToLoad::onTouchUp(const ITouch::SUpEvent& e) {
    if (!m_initialized || !m_tracker.ownsTouch(e.touchID))
        return;

    endSession(true);
}

void CPullToLoad::onTouchCancel(const ITouch::SCancelEvent& e) {
    if (!m_initialized || !m_tracker.ownsTouch(e.touchID))
        return;

    endSession(false);
}

void CPullToLoad::endSession(bool allowActivation) {
    const auto EDGE = m_tracker.claimed();

    m_tracker.end();

    if (EDGE == PULL_EDGE_TOP && m_translate > 0.F)
        releaseEdge(PULL_EDGE_TOP, allowActivation);
    else if (EDGE == PULL_EDGE_BOTTOM && m_translate < 0.F)
        releaseEdge(PULL_EDGE_BOTTOM, allowActivation);
    else if (EDGE != PULL_EDGE_NONE)
        machineFor(EDGE).abandon(); // claimed but nothing was pulled
}

void CPullToLoad::releaseEdge(ePullEdge edge, bool allowActivation) {
    auto& machine = machineFor(edge);

    if (!allowActivation) {
        machine.abandon();
        setTranslate(0.F);
        return;
    }

    if (!machine.release()) {
        setTranslate(0.F);
        return;
    }

    setTranslate(edge == PULL_EDGE_TOP ? SETTLE_OFFSET : -SETTLE_OFFSET);
    startLoad(edge);
}

void CPullToLoad::startLoad(ePullEdge edge) {
    const auto LOADER = loaderFor(edge);

    if (!LOADER) {
        failLoad(edge, "no loader configured");
        return;
    }

    Log::logger->log(Log::DEBUG, "CPullToLoad: starting {} load", toString(edge));

    armLoadTimeout(edge);

    // the loader may report completion before load() returns, nothing below may touch state
    try {
        LOADER->load();
    } catch (std::exception& e) { failLoad(edge, std::format("loader threw: {}", e.what())); }
}

void CPullToLoad::armLoadTimeout(ePullEdge edge) {
    if (m_config.loadTimeoutMs <= 0)
        return;

    if (!m_loop) {
        Log::logger->log(Log::ERR, "CPullToLoad: can't arm the load timeout, event loop is gone");
        return;
    }

    auto& timer = edge == PULL_EDGE_TOP ? m_topTimeoutTimer : m_bottomTimeoutTimer;

    if (timer)
        timer->cancel();

    timer = makeShared<CEventLoopTimer>(
        Time::fromMillis(m_config.loadTimeoutMs),
        [self = m_self, edge](SP<CEventLoopTimer> timer, void* data) {
            if (!self)
                return;

            self->failLoad(edge, std::format("timed out after {}ms", self->m_config.loadTimeoutMs));
        },
        nullptr);

    m_loop->addTimer(timer);
}

void CPullToLoad::disarmLoadTimeout(ePullEdge edge) {
    auto& timer = edge == PULL_EDGE_TOP ? m_topTimeoutTimer : m_bottomTimeoutTimer;

    if (!timer)
        return;

    timer->cancel();
    if (m_loop)
        m_loop->removeTimer(timer);
    timer.reset();
}

void CPullToLoad::onTopLoaded() {
    if (!m_top.loading()) {
        Log::logger->log(Log::WARN, "CPullToLoad::onTopLoaded: top isn't loading, ignoring");
        return;
    }

    if (m_topResetTimer && m_topResetTimer->armed()) {
        Log::logger->log(Log::WARN, "CPullToLoad::onTopLoaded: already completed, ignoring");
        return;
    }

    disarmLoadTimeout(PULL_EDGE_TOP);

    Log::logger->log(Log::DEBUG, "CPullToLoad: top load finished");

    setTranslate(0.F);

    if (!m_loop) {
        m_top.finish();
        return;
    }

    // re-enable dragging once the collapse is done
    m_topResetTimer = makeShared<CEventLoopTimer>(
        TOP_RESET_DELAY,
        [self = m_self](SP<CEventLoopTimer> timer, void* data) {
            if (!self)
                return;

            self->m_top.finish();
        },
        nullptr);

    m_loop->addTimer(m_topResetTimer);
}

void CPullToLoad::onBottomLoaded() {
    if (!m_bottom.loading()) {
        Log::logger->log(Log::WARN, "CPullToLoad::onBottomLoaded: bottom isn't loading, ignoring");
        return;
    }

    disarmLoadTimeout(PULL_EDGE_BOTTOM);

    Log::logger->log(Log::DEBUG, "CPullToLoad: bottom load finished");

    m_bottom.finish();

    if (m_loop) {
        // after the new content is laid out: bring some of it into view and drop the settle offset
        m_loop->doLater([self = m_self] {
            if (!self)
                return;

            self->m_target->scrollBy(SETTLE_OFFSET);

            if (self->m_translate < 0.F)
                self->setTranslate(0.F);
        });
    } else if (m_translate < 0.F)
        setTranslate(0.F);

    if (!m_bottomAllLoaded && m_autoFill && !m_autoFill->containerFilled())
        m_autoFill->check();
}

void CPullToLoad::onTopLoadFailed(const std::string& reason) {
    if (!m_top.loading()) {
        Log::logger->log(Log::WARN, "CPullToLoad::onTopLoadFailed: top isn't loading, ignoring ({})", reason);
        return;
    }

    failLoad(PULL_EDGE_TOP, reason);
}

void CPullToLoad::onBottomLoadFailed(const std::string& reason) {
    if (!m_bottom.loading()) {
        Log::logger->log(Log::WARN, "CPullToLoad::onBottomLoadFailed: bottom isn't loading, ignoring ({})", reason);
        return;
    }

    failLoad(PULL_EDGE_BOTTOM, reason);
}

void CPullToLoad::failLoad(ePullEdge edge, const std::string& reason) {
    Log::logger->log(Log::ERR, "CPullToLoad: {} load failed: {}", toString(edge), reason);

    disarmLoadTimeout(edge);

    if (edge == PULL_EDGE_TOP && m_topResetTimer) {
        m_topResetTimer->cancel();
        if (m_loop)
            m_loop->removeTimer(m_topResetTimer);
        m_topResetTimer.reset();
    }

    machineFor(edge).finish();

    if ((edge == PULL_EDGE_TOP && m_translate > 0.F) || (edge == PULL_EDGE_BOTTOM && m_translate < 0.F))
        setTranslate(0.F);

    m_events.loadFailed.emit(edge, reason);
}

bool CPullToLoad::autoFillLoad() {
    if (!m_loaders.infinite || m_bottomAllLoaded || m_bottom.loading())
        return false;

    if (!m_bottom.beginLoading())
        return false;

    startLoad(PULL_EDGE_BOTTOM);
    return true;
}

void CPullToLoad::setBottomAllLoaded(bool allLoaded) {
    if (m_bottomAllLoaded == allLoaded)
        return;

    Log::logger->log(Log::DEBUG, "CPullToLoad: bottom all loaded: {}", allLoaded);

    m_bottomAllLoaded = allLoaded;
}

bool CPullToLoad::bottomAllLoaded() const {
    return m_bottomAllLoaded;
}

float CPullToLoad::translate() const {
    return m_translate;
}

ePullStatus CPullToLoad::topStatus() const {
    return m_top.status();
}

ePullStatus CPullToLoad::bottomStatus() const {
    return m_bottom.status();
}

bool CPullToLoad::topDropped() const {
    return m_top.dropped();
}

bool CPullToLoad::bottomDropped() const {
    return m_bottom.dropped();
}

const std::string& CPullToLoad::topText() const {
    return m_topText;
}

const std::string& CPullToLoad::bottomText() const {
    return m_bottomText;
}

bool CPullToLoad::containerFilled() const {
    return m_autoFill && m_autoFill->containerFilled();
}

bool CPullToLoad::lastMotionClaimed() const {
    return m_lastMotionClaimed;
}

SP<CScrollTarget> CPullToLoad::scrollTarget() const {
    return m_target;
}

const SPullConfig& CPullToLoad::config() const {
    return m_config;
}
