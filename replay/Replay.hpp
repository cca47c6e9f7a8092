#pragma once

#include <expected>
#include <string>

#include "SimulatedList.hpp"
#include "devices/ITouch.hpp"
#include "config/PullConfig.hpp"
#include "pull/PullToLoad.hpp"
#include "helpers/time/Time.hpp"
#include "helpers/signal/Signal.hpp"

class CEventLoopManager;

class CReplayTouch : public ITouch {
  public:
    virtual std::string deviceName();
};

/*
    Runs a trace against a CSimulatedList, one command per line:

        viewport 600        # before init
        items 4
        init
        down 100
        move 300
        up
        expect top loading
        loaded top
        wait 200
        expect top pull
*/
class CReplay {
  public:
    CReplay(const SPullConfig& config);
    ~CReplay();

    // stops at the first malformed line
    std::expected<void, std::string> runFile(const std::string& path);
    std::expected<void, std::string> runString(const std::string& trace);
    std::expected<void, std::string> runLine(const std::string& line);

    // failed expects
    size_t                           failures() const;

    SP<CPullToLoad>                  pull() const;
    SP<CSimulatedList>               list() const;

  private:
    std::expected<void, std::string> ensureInit();
    std::expected<void, std::string> expect(const std::string& what, const std::string& value);
    void                             settle();

    SPullConfig                      m_config;
    SP<CSimulatedList>               m_list;
    SP<CReplayTouch>                 m_touch;
    SP<CEventLoopManager>            m_loop;
    SP<CPullToLoad>                  m_pull;

    Time::steady_tp                  m_now;
    uint32_t                         m_timeMs    = 0;
    size_t                           m_failures  = 0;
    size_t                           m_lineNo    = 0;
    size_t                           m_topLoads    = 0;
    size_t                           m_bottomLoads = 0;
    double                           m_touchY    = 0;

    struct {
        CHyprSignalListener translate;
        CHyprSignalListener topStatus;
        CHyprSignalListener bottomStatus;
        CHyprSignalListener loadFailed;
    } m_listeners;
};
