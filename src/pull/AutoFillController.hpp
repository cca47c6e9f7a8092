#pragma once

#include <functional>

#include "../helpers/memory/Memory.hpp"
#include "../scroll/ScrollTarget.hpp"

class CEventLoopManager;

/*
    Keeps a short list from being stuck: if the content doesn't reach the bottom of the
    scroll target there is nothing to drag past, so the bottom loader is started directly.
*/
class CAutoFillController {
  public:
    // requestLoad starts a bottom load and returns false if it can't right now
    CAutoFillController(bool enabled, SP<CScrollTarget> target, SP<IElement> content, WP<CEventLoopManager> loop, std::function<bool()> requestLoad);

    // measures on the next tick. Repeated calls before that coalesce.
    void check();

    bool enabled() const;
    bool containerFilled() const;
    bool pending() const;

    //
    WP<CAutoFillController> m_self;

  private:
    void                  measure();

    bool                  m_enabled = true;
    SP<CScrollTarget>     m_target;
    SP<IElement>          m_content;
    WP<CEventLoopManager> m_loop;
    std::function<bool()> m_requestLoad;

    bool                  m_filled  = false;
    bool                  m_pending = false;
};
