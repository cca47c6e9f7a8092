#pragma once

#include <cstdint>
#include <expected>
#include <string>

// label texts. Empty means the localized default.
struct SPullLabels {
    std::string topPull;
    std::string topDrop;
    std::string topLoading;
    std::string bottomPull;
    std::string bottomDrop;
};

struct SPullConfig {
    // offset (after distanceIndex scaling) needed for a release to trigger a load
    float       topDistance    = 70.F;
    float       bottomDistance = 70.F;

    // raw finger travel is divided by this
    float       distanceIndex = 2.F;

    // saturation of the drag distance, 0 = unlimited
    float       maxDistance = 0.F;

    bool        autoFill        = true;
    bool        bottomAllLoaded = false;

    // a load still pending after this many ms is failed, 0 = wait forever
    int64_t     loadTimeoutMs = 0;

    // empty = system locale
    std::string locale;
    SPullLabels labels;

    // ARGB
    uint32_t    spinnerColor = 0xFF9E9E9E;
    uint32_t    textColor    = 0xFF616161;

    //
    std::expected<void, std::string> validate() const;

    // labels with every empty entry replaced by the localized default
    SPullLabels resolvedLabels() const;
};
