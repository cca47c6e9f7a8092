#pragma once

#include <functional>
#include <string>

#include <scroll/Element.hpp>
#include <pull/Loader.hpp>
#include <devices/ITouch.hpp>
#include <managers/eventLoop/EventLoopManager.hpp>
#include <helpers/memory/Memory.hpp>
#include <helpers/time/Time.hpp>

namespace Tests {
    // geometry is whatever the test sets
    class CFakeElement : public IElement {
      public:
        virtual SP<IElement> parent() {
            return m_parent;
        }

        virtual eOverflow overflowY() {
            return m_overflow;
        }

        virtual CBox boundingBox() {
            return m_box;
        }

        virtual double scrollTop() {
            return m_scrollTop;
        }

        virtual void scrollBy(double dy) {
            m_scrollTop += dy;
            m_scrolledBy += dy;
        }

        virtual double scrollHeight() {
            return m_scrollHeight;
        }

        virtual double clientHeight() {
            return m_clientHeight;
        }

        virtual bool isDocumentRoot() {
            return m_documentRoot;
        }

        SP<IElement> m_parent;
        eOverflow    m_overflow     = OVERFLOW_VISIBLE;
        CBox         m_box          = {0, 0, 0, 0};
        double       m_scrollTop    = 0;
        double       m_scrolledBy   = 0;
        double       m_scrollHeight = 0;
        double       m_clientHeight = 0;
        bool         m_documentRoot = false;
    };

    class CFakeViewport : public IViewport {
      public:
        virtual double scrollY() {
            return m_scrollY;
        }

        virtual double innerHeight() {
            return m_innerHeight;
        }

        virtual double documentHeight() {
            return m_documentHeight;
        }

        virtual void scrollBy(double dy) {
            m_scrollY += dy;
            m_scrolledBy += dy;
        }

        double m_scrollY        = 0;
        double m_innerHeight    = 600;
        double m_documentHeight = 1000;
        double m_scrolledBy     = 0;
    };

    class CRecordingLoader : public ILoader {
      public:
        virtual void load() {
            m_calls++;
            if (m_onLoad)
                m_onLoad();
        }

        int                   m_calls = 0;
        std::function<void()> m_onLoad;
    };

    class CFakeTouch : public ITouch {
      public:
        virtual std::string deviceName() {
            return "fake-touch";
        }
    };

    // a loop running on a clock only the test moves
    struct SVirtualLoop {
        SVirtualLoop() {
            loop         = makeShared<CEventLoopManager>([this] { return now; });
            loop->m_self = loop;
        }

        SVirtualLoop(const SVirtualLoop&)            = delete;
        SVirtualLoop& operator=(const SVirtualLoop&) = delete;

        void          advance(uint64_t ms) {
            now += Time::fromMillis(ms);
            loop->dispatch();
        }

        // runs deferred work until nothing is left to run right now
        void settle() {
            for (int i = 0; i < 32 && loop->dispatch() > 0; ++i) {
                ;
            }
        }

        Time::steady_tp       now = Time::steady_tp{} + std::chrono::hours(1);
        SP<CEventLoopManager> loop;
    };
};
