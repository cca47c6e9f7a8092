#include <gtest/gtest.h>
#include <config/PullConfig.hpp>
#include <config/ConfigManager.hpp>

#include <cmath>

TEST(PullConfig, DefaultsAreValid) {
    SPullConfig config;

    EXPECT_TRUE(config.validate().has_value());
    EXPECT_FLOAT_EQ(config.topDistance, 70.F);
    EXPECT_FLOAT_EQ(config.bottomDistance, 70.F);
    EXPECT_FLOAT_EQ(config.distanceIndex, 2.F);
    EXPECT_FLOAT_EQ(config.maxDistance, 0.F);
    EXPECT_TRUE(config.autoFill);
    EXPECT_FALSE(config.bottomAllLoaded);
}

TEST(PullConfig, RejectsBadValues) {
    SPullConfig config;

    config.distanceIndex = 0;
    EXPECT_FALSE(config.validate().has_value());

    config               = {};
    config.topDistance   = -1;
    EXPECT_FALSE(config.validate().has_value());

    config                = {};
    config.bottomDistance = NAN;
    EXPECT_FALSE(config.validate().has_value());

    config             = {};
    config.topDistance = 0;
    EXPECT_FALSE(config.validate().has_value());

    config                = {};
    config.bottomDistance = 0;
    EXPECT_FALSE(config.validate().has_value());

    config             = {};
    config.maxDistance = -5;
    EXPECT_FALSE(config.validate().has_value());

    config               = {};
    config.loadTimeoutMs = -1;
    EXPECT_FALSE(config.validate().has_value());
}

TEST(PullConfig, LabelsFallBackToLocale) {
    SPullConfig config;
    config.locale         = "zh_CN";
    config.labels.topPull = "custom";

    const auto LABELS = config.resolvedLabels();

    EXPECT_EQ(LABELS.topPull, "custom");
    EXPECT_EQ(LABELS.topDrop, "释放更新");
    EXPECT_EQ(LABELS.topLoading, "加载中...");
}

TEST(ConfigManager, ParsesPullSection) {
    CConfigManager manager;

    const auto     RESULT = manager.loadString(R"#(
pull {
    top_distance = 100
    bottom_distance = 40.5
    distance_index = 3
    max_distance = 120
    auto_fill = false
    load_timeout = 5000
    locale = zh_TW
    col.spinner = rgba(ff0000ff)
}

pull:col.text = 0xff00ff00
pull:text:bottom_pull = more please

debug {
    disable_time = true
}
)#");

    ASSERT_TRUE(RESULT.has_value()) << RESULT.error();

    EXPECT_FLOAT_EQ(RESULT->topDistance, 100.F);
    EXPECT_FLOAT_EQ(RESULT->bottomDistance, 40.5F);
    EXPECT_FLOAT_EQ(RESULT->distanceIndex, 3.F);
    EXPECT_FLOAT_EQ(RESULT->maxDistance, 120.F);
    EXPECT_FALSE(RESULT->autoFill);
    EXPECT_FALSE(RESULT->bottomAllLoaded);
    EXPECT_EQ(RESULT->loadTimeoutMs, 5000);
    EXPECT_EQ(RESULT->locale, "zh_TW");
    EXPECT_EQ(RESULT->labels.bottomPull, "more please");
    EXPECT_TRUE(RESULT->labels.topPull.empty());
    EXPECT_EQ(RESULT->spinnerColor, 0xffff0000);
    EXPECT_EQ(RESULT->textColor, 0xff00ff00);

    EXPECT_TRUE(manager.loggerOptions().disableTime);
    EXPECT_FALSE(manager.loggerOptions().disableLogs);
    EXPECT_EQ(manager.pullConfig().loadTimeoutMs, 5000);
}

TEST(ConfigManager, EmptyConfigGivesDefaults) {
    CConfigManager manager;

    const auto     RESULT = manager.loadString("");

    ASSERT_TRUE(RESULT.has_value()) << RESULT.error();
    EXPECT_FLOAT_EQ(RESULT->topDistance, 70.F);
    EXPECT_TRUE(RESULT->locale.empty());
}

TEST(ConfigManager, ReportsParseErrors) {
    CConfigManager manager;

    EXPECT_FALSE(manager.loadString("pull:no_such_option = 1").has_value());
    EXPECT_FALSE(manager.loadString("pull:top_distance = far").has_value());
}

TEST(ConfigManager, RejectsInvalidValues) {
    CConfigManager manager;

    const auto     RESULT = manager.loadString("pull:distance_index = 0");

    ASSERT_FALSE(RESULT.has_value());
    EXPECT_NE(RESULT.error().find("distance index"), std::string::npos);
}

TEST(ConfigManager, MissingFile) {
    CConfigManager manager;

    EXPECT_FALSE(manager.loadFile("/nonexistent/hyprpull.conf").has_value());
}
