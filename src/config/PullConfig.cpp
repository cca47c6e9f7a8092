#include "PullConfig.hpp"
#include "../i18n/Engine.hpp"

#include <cmath>
#include <format>

std::expected<void, std::string> SPullConfig::validate() const {
    // a 0 threshold would arm the drop state before anything was pulled
    if (!std::isfinite(topDistance) || topDistance <= 0.F)
        return std::unexpected(std::format("top distance must be a positive number, got {}", topDistance));

    if (!std::isfinite(bottomDistance) || bottomDistance <= 0.F)
        return std::unexpected(std::format("bottom distance must be a positive number, got {}", bottomDistance));

    if (!std::isfinite(distanceIndex) || distanceIndex <= 0.F)
        return std::unexpected(std::format("distance index must be a positive number, got {}", distanceIndex));

    if (!std::isfinite(maxDistance) || maxDistance < 0.F)
        return std::unexpected(std::format("max distance must be a non-negative number (0 = unlimited), got {}", maxDistance));

    if (loadTimeoutMs < 0)
        return std::unexpected(std::format("load timeout must be non-negative (0 = disabled), got {}", loadTimeoutMs));

    return {};
}

SPullLabels SPullConfig::resolvedLabels() const {
    const auto  ENGINE = I18n::i18nEngine();
    SPullLabels out    = labels;

    auto        fill = [&](std::string& s, I18n::eI18nKeys key) {
        if (s.empty())
            s = ENGINE->localize(key, locale);
    };

    fill(out.topPull, I18n::TXT_KEY_TOP_PULL);
    fill(out.topDrop, I18n::TXT_KEY_TOP_DROP);
    fill(out.topLoading, I18n::TXT_KEY_TOP_LOADING);
    fill(out.bottomPull, I18n::TXT_KEY_BOTTOM_PULL);
    fill(out.bottomDrop, I18n::TXT_KEY_BOTTOM_DROP);

    return out;
}
