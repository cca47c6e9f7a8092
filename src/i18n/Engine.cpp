#include "Engine.hpp"

using namespace I18n;

//
SP<I18n::CI18nEngine> I18n::i18nEngine() {
    static SP<I18n::CI18nEngine> engine = makeShared<I18n::CI18nEngine>();
    return engine;
}

I18n::CI18nEngine::CI18nEngine() {
    m_engine = makeShared<Hyprutils::I18n::CI18nEngine>();
    m_engine->setFallbackLocale("en_US");
    m_systemLocale = m_engine->getSystemLocale().locale();

    // en_US (English)
    m_engine->registerEntry("en_US", TXT_KEY_TOP_PULL, "Pull down to refresh");
    m_engine->registerEntry("en_US", TXT_KEY_TOP_DROP, "Release to refresh");
    m_engine->registerEntry("en_US", TXT_KEY_TOP_LOADING, "Loading...");
    m_engine->registerEntry("en_US", TXT_KEY_BOTTOM_PULL, "Pull up to load more");
    m_engine->registerEntry("en_US", TXT_KEY_BOTTOM_DROP, "Release to load more");

    // zh_CN (Simplified Chinese)
    m_engine->registerEntry("zh_CN", TXT_KEY_TOP_PULL, "下拉刷新");
    m_engine->registerEntry("zh_CN", TXT_KEY_TOP_DROP, "释放更新");
    m_engine->registerEntry("zh_CN", TXT_KEY_TOP_LOADING, "加载中...");
    m_engine->registerEntry("zh_CN", TXT_KEY_BOTTOM_PULL, "上拉加载更多");
    m_engine->registerEntry("zh_CN", TXT_KEY_BOTTOM_DROP, "释放加载");

    // zh_TW (Traditional Chinese)
    m_engine->registerEntry("zh_TW", TXT_KEY_TOP_PULL, "下拉刷新");
    m_engine->registerEntry("zh_TW", TXT_KEY_TOP_DROP, "釋放更新");
    m_engine->registerEntry("zh_TW", TXT_KEY_TOP_LOADING, "載入中...");
    m_engine->registerEntry("zh_TW", TXT_KEY_BOTTOM_PULL, "上拉載入更多");
    m_engine->registerEntry("zh_TW", TXT_KEY_BOTTOM_DROP, "釋放載入");
}

std::string I18n::CI18nEngine::localize(eI18nKeys key, const std::string& locale, const Hyprutils::I18n::translationVarMap& vars) const {
    return m_engine->localizeEntry(locale.empty() ? m_systemLocale : locale, key, vars);
}
