#pragma once

#include <gtest/gtest.h>
#include <pull/PullToLoad.hpp>

#include "Fakes.hpp"

namespace Tests {
    // a page scrolled by the viewport: 600px viewport, 1000px list
    class CPullFixture : public ::testing::Test {
      protected:
        void SetUp() override {
            m_body->m_documentRoot = true;
            m_content->m_parent    = m_body;
            m_content->m_box       = {0, 0, 0, 1000};

            m_config.locale = "en_US";
        }

        void TearDown() override {
            if (m_pull)
                m_pull->attachTouch(nullptr);
        }

        SP<CPullToLoad> make(bool withReload = true, bool withInfinite = true) {
            SPullLoaders loaders;
            if (withReload)
                loaders.reload = m_reload;
            if (withInfinite)
                loaders.infinite = m_infinite;

            auto pull = CPullToLoad::create(m_config, loaders, m_content, m_viewport, m_loop.loop);
            EXPECT_TRUE(pull.has_value());
            if (!pull)
                return nullptr;

            m_pull = *pull;
            m_pull->init();
            m_loop.settle();

            return m_pull;
        }

        void down(double y, int32_t id = 0) {
            m_pull->onTouchDown({.timeMs = 0, .touchID = id, .pos = {0.0, y}});
        }

        bool move(double y, int32_t id = 0) {
            return m_pull->onTouchMotion({.timeMs = 0, .touchID = id, .pos = {0.0, y}});
        }

        void up(int32_t id = 0) {
            m_pull->onTouchUp({.timeMs = 0, .touchID = id});
        }

        void cancel(int32_t id = 0) {
            m_pull->onTouchCancel({.timeMs = 0, .touchID = id});
        }

        // scrolled to the very end of the page
        void scrollToBottom() {
            m_viewport->m_scrollY = m_viewport->m_documentHeight - m_viewport->m_innerHeight;
            m_content->m_box.y    = -m_viewport->m_scrollY;
        }

        SPullConfig           m_config;
        SVirtualLoop          m_loop;

        SP<CFakeElement>      m_body     = makeShared<CFakeElement>();
        SP<CFakeElement>      m_content  = makeShared<CFakeElement>();
        SP<CFakeViewport>     m_viewport = makeShared<CFakeViewport>();
        SP<CRecordingLoader>  m_reload   = makeShared<CRecordingLoader>();
        SP<CRecordingLoader>  m_infinite = makeShared<CRecordingLoader>();

        SP<CPullToLoad>       m_pull;
    };
};
