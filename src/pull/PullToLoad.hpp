#pragma once

#include <expected>
#include <string>

#include "PullTypes.hpp"
#include "Loader.hpp"
#include "EdgeStateMachine.hpp"
#include "TouchGestureTracker.hpp"
#include "AutoFillController.hpp"
#include "../config/PullConfig.hpp"
#include "../devices/ITouch.hpp"
#include "../scroll/ScrollTarget.hpp"
#include "../helpers/memory/Memory.hpp"
#include "../helpers/signal/Signal.hpp"

class CEventLoopManager;
class CEventLoopTimer;

// a missing loader disables its edge
struct SPullLoaders {
    SP<ILoader> reload;
    SP<ILoader> infinite;
};

/*
    Pull-to-refresh / pull-to-load-more decoration for one scrollable content block.

    The host feeds touch events (directly or through an ITouch), renders the translation
    offset / labels it is signalled, and reports loader completion back.
*/
class CPullToLoad {
  public:
    static std::expected<SP<CPullToLoad>, std::string> create(const SPullConfig& config, const SPullLoaders& loaders, SP<IElement> root, SP<IViewport> viewport,
                                                              SP<CEventLoopManager> loop);
    ~CPullToLoad();

    // once the content is mounted: resolves the scroll target and runs the first auto-fill
    void init();
    bool initialized() const;

    // listens to a touch source. Replaces a previous one.
    void attachTouch(SP<ITouch> touch);

    void onTouchDown(const ITouch::SDownEvent& e);
    // true if the move was claimed and native scrolling has to be suppressed
    bool onTouchMotion(const ITouch::SMotionEvent& e);
    void onTouchUp(const ITouch::SUpEvent& e);
    void onTouchCancel(const ITouch::SCancelEvent& e);

    void onTopLoaded();
    void onBottomLoaded();
    void onTopLoadFailed(const std::string& reason);
    void onBottomLoadFailed(const std::string& reason);

    void setBottomAllLoaded(bool allLoaded);
    bool bottomAllLoaded() const;

    //
    float              translate() const;
    ePullStatus        topStatus() const;
    ePullStatus        bottomStatus() const;
    bool               topDropped() const;
    bool               bottomDropped() const;
    const std::string& topText() const;
    const std::string& bottomText() const;
    bool               containerFilled() const;
    bool               lastMotionClaimed() const;
    SP<CScrollTarget>  scrollTarget() const;
    const SPullConfig& config() const;

    struct {
        CSignalT<float>                  translateChange;
        CSignalT<ePullStatus>            topStatusChange;
        CSignalT<ePullStatus>            bottomStatusChange;
        CSignalT<ePullEdge, std::string> loadFailed;
    } m_events;

    WP<CPullToLoad> m_self;

  private:
    CPullToLoad(const SPullConfig& config, const SPullLoaders& loaders, SP<IElement> root, SP<IViewport> viewport, SP<CEventLoopManager> loop);

    CEdgeStateMachine&      machineFor(ePullEdge edge);
    SP<ILoader>             loaderFor(ePullEdge edge) const;

    void                    setTranslate(float translate);
    void                    endSession(bool allowActivation);
    void                    releaseEdge(ePullEdge edge, bool allowActivation);
    void                    startLoad(ePullEdge edge);
    void                    failLoad(ePullEdge edge, const std::string& reason);
    void                    armLoadTimeout(ePullEdge edge);
    void                    disarmLoadTimeout(ePullEdge edge);
    bool                    autoFillLoad();
    std::string             labelFor(ePullEdge edge, ePullStatus status) const;

    SPullConfig             m_config;
    SPullLabels             m_labels;
    SPullLoaders            m_loaders;

    SP<IElement>            m_root;
    SP<IViewport>           m_viewport;
    SP<CScrollTarget>       m_target;
    WP<CEventLoopManager>   m_loop;

    CTouchGestureTracker    m_tracker;
    CEdgeStateMachine       m_top;
    CEdgeStateMachine       m_bottom;
    SP<CAutoFillController> m_autoFill;

    float                   m_translate         = 0.F;
    bool                    m_bottomAllLoaded   = false;
    bool                    m_initialized       = false;
    bool                    m_lastMotionClaimed = false;
    std::string             m_topText, m_bottomText;

    SP<CEventLoopTimer>     m_topResetTimer;
    SP<CEventLoopTimer>     m_topTimeoutTimer;
    SP<CEventLoopTimer>     m_bottomTimeoutTimer;

    struct {
        CHyprSignalListener topStatus;
        CHyprSignalListener bottomStatus;
        CHyprSignalListener touchDown;
        CHyprSignalListener touchUp;
        CHyprSignalListener touchMotion;
        CHyprSignalListener touchCancel;
    } m_listeners;
};
