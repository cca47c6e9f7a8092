#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "../../helpers/memory/Memory.hpp"
#include "../../helpers/time/Time.hpp"

#include "EventLoopTimer.hpp"

/*
    Host-driven loop: nothing here blocks or owns a thread. The host calls dispatch()
    from its own frame / poll loop and may sleep for nextTimeout().
*/
class CEventLoopManager {
  public:
    using ClockFn = std::function<Time::steady_tp()>;

    CEventLoopManager(ClockFn clock = nullptr);
    ~CEventLoopManager() = default;

    Time::steady_tp now() const;
    void            setClock(ClockFn clock);

    // Note: will remove the timer if the ptr is lost.
    void addTimer(SP<CEventLoopTimer> timer);
    void removeTimer(SP<CEventLoopTimer> timer);

    // schedules a function to run later, aka on the next dispatch(), before timers.
    void doLater(const std::function<void()>& fn);

    // runs everything deferred with doLater, then every timer that has passed.
    // returns the amount of callbacks ran.
    size_t                          dispatch();

    std::optional<Time::steady_dur> nextTimeout();
    bool                            hasPending();

    WP<CEventLoopManager>           m_self;

  private:
    void    onTimerFire(size_t& ran);
    void    nudgeTimers();

    ClockFn m_clock;

    struct {
        std::vector<SP<CEventLoopTimer>> timers;
    } m_timers;

    struct {
        std::vector<std::function<void()>> fns;
    } m_idle;
};
