#include "EventLoopManager.hpp"
#include "../../macros.hpp"

#include <algorithm>
#include <ranges>

CEventLoopManager::CEventLoopManager(ClockFn clock) : m_clock(clock ? std::move(clock) : ClockFn{Time::steadyNow}) {
    ;
}

Time::steady_tp CEventLoopManager::now() const {
    return m_clock();
}

void CEventLoopManager::setClock(ClockFn clock) {
    m_clock = clock ? std::move(clock) : ClockFn{Time::steadyNow};
}

void CEventLoopManager::addTimer(SP<CEventLoopTimer> timer) {
    if (std::ranges::contains(m_timers.timers, timer))
        return;

    RASSERT(m_self, "CEventLoopManager::addTimer called before m_self was set");
    timer->attach(m_self);
    m_timers.timers.emplace_back(timer);
}

void CEventLoopManager::removeTimer(SP<CEventLoopTimer> timer) {
    if (!std::ranges::contains(m_timers.timers, timer))
        return;
    std::erase_if(m_timers.timers, [timer](const auto& t) { return timer == t; });
}

void CEventLoopManager::doLater(const std::function<void()>& fn) {
    m_idle.fns.emplace_back(fn);
}

size_t CEventLoopManager::dispatch() {
    size_t ran = 0;

    // deferred fns may defer more fns, those run on the next dispatch
    auto cpy = m_idle.fns;
    m_idle.fns.clear();
    for (auto const& c : cpy) {
        if (!c)
            continue;
        c();
        ran++;
    }

    onTimerFire(ran);

    return ran;
}

void CEventLoopManager::onTimerFire(size_t& ran) {
    const auto CPY = m_timers.timers;
    for (auto const& t : CPY) {
        if (t.strongRef() > 2 /* if it's 2, it was lost. Don't call it. */ && t->passed() && !t->cancelled()) {
            t->call(t);
            ran++;
        }
    }

    nudgeTimers();
}

void CEventLoopManager::nudgeTimers() {
    // remove timers that have gone missing
    std::erase_if(m_timers.timers, [](const auto& t) { return t.strongRef() <= 1; });
}

std::optional<Time::steady_dur> CEventLoopManager::nextTimeout() {
    if (!m_idle.fns.empty())
        return Time::steady_dur::zero();

    std::optional<Time::steady_dur> next;

    for (auto const& t : m_timers.timers) {
        if (!t->armed() || t->cancelled())
            continue;

        const auto LEFT = std::chrono::duration_cast<Time::steady_dur>(std::chrono::microseconds(std::max(0L, (long)t->leftUs())));
        if (!next || LEFT < *next)
            next = LEFT;
    }

    return next;
}

bool CEventLoopManager::hasPending() {
    return !m_idle.fns.empty() || std::ranges::any_of(m_timers.timers, [](const auto& t) { return t->armed() && !t->cancelled(); });
}
