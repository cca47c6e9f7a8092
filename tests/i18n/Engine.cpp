#include <gtest/gtest.h>
#include <i18n/Engine.hpp>

TEST(I18n, ExplicitLocale) {
    const auto ENGINE = I18n::i18nEngine();

    EXPECT_EQ(ENGINE->localize(I18n::TXT_KEY_TOP_PULL, "en_US"), "Pull down to refresh");
    EXPECT_EQ(ENGINE->localize(I18n::TXT_KEY_BOTTOM_DROP, "zh_CN"), "释放加载");
    EXPECT_EQ(ENGINE->localize(I18n::TXT_KEY_TOP_LOADING, "zh_TW"), "載入中...");
}

TEST(I18n, UnknownLocaleFallsBackToEnglish) {
    EXPECT_EQ(I18n::i18nEngine()->localize(I18n::TXT_KEY_BOTTOM_PULL, "xx_XX"), "Pull up to load more");
}
