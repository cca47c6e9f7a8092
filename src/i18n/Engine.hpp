#pragma once

#include "../helpers/memory/Memory.hpp"
#include <hyprutils/i18n/I18nEngine.hpp>
#include <cstdint>
#include <string>

namespace I18n {

    enum eI18nKeys : uint8_t {
        TXT_KEY_TOP_PULL = 0,
        TXT_KEY_TOP_DROP,
        TXT_KEY_TOP_LOADING,
        TXT_KEY_BOTTOM_PULL,
        TXT_KEY_BOTTOM_DROP,
    };

    class CI18nEngine {
      public:
        CI18nEngine();
        ~CI18nEngine() = default;

        // empty locale = system locale
        std::string localize(eI18nKeys key, const std::string& locale = "", const Hyprutils::I18n::translationVarMap& vars = {}) const;

      private:
        SP<Hyprutils::I18n::CI18nEngine> m_engine;
        std::string                      m_systemLocale;
    };

    SP<CI18nEngine> i18nEngine();
};
