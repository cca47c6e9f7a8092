#pragma once

#include <functional>
#include <optional>

#include "../../helpers/memory/Memory.hpp"
#include "../../helpers/time/Time.hpp"

class CEventLoopManager;

class CEventLoopTimer {
  public:
    CEventLoopTimer(std::optional<Time::steady_dur> timeout, std::function<void(SP<CEventLoopTimer> self, void* data)> cb_, void* data_);

    // if not specified, disarms.
    // if specified, arms relative to the owning loop's clock.
    void  updateTimeout(std::optional<Time::steady_dur> timeout);

    void  cancel();
    bool  passed();
    bool  armed();

    float leftUs();

    bool  cancelled();
    // resets expires
    void call(SP<CEventLoopTimer> self);

  private:
    // called by the loop when the timer is added
    void                                                      attach(WP<CEventLoopManager> loop);

    std::function<void(SP<CEventLoopTimer> self, void* data)> m_cb;
    void*                                                     m_data = nullptr;
    std::optional<Time::steady_dur>                           m_timeout;
    std::optional<Time::steady_tp>                            m_expires;
    WP<CEventLoopManager>                                     m_loop;
    bool                                                      m_wasCancelled = false;

    friend class CEventLoopManager;
};
