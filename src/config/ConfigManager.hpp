#pragma once

#include <expected>
#include <string>

#include <hyprlang.hpp>

#include "../helpers/memory/Memory.hpp"
#include "../debug/log/Logger.hpp"
#include "PullConfig.hpp"

#define STRVAL_EMPTY "[[EMPTY]]"

/*
    Reads hyprpull options from a hyprlang file or string:

        pull {
            top_distance = 70
            text:top_pull = Pull down to refresh
            col.spinner = rgba(9e9e9eff)
        }
*/
class CConfigManager {
  public:
    CConfigManager()  = default;
    ~CConfigManager() = default;

    std::expected<SPullConfig, std::string> loadFile(const std::string& path);
    std::expected<SPullConfig, std::string> loadString(const std::string& contents);

    // valid after a successful load
    const SPullConfig&   pullConfig() const;
    Log::SLoggerOptions  loggerOptions() const;

  private:
    std::expected<SPullConfig, std::string> load(const std::string& pathOrContents, bool isStream);

    void                                    registerConfigVar(const char* name, const Hyprlang::INT& val);
    void                                    registerConfigVar(const char* name, const Hyprlang::FLOAT& val);
    void                                    registerConfigVar(const char* name, const Hyprlang::STRING& val);

    Hyprlang::INT                           getInt(const char* name) const;
    Hyprlang::FLOAT                         getFloat(const char* name) const;
    std::string                             getString(const char* name) const;

    UP<Hyprlang::CConfig>                   m_config;
    SPullConfig                             m_pullConfig;
    Log::SLoggerOptions                     m_loggerOptions;
    size_t                                  m_configValueNumber = 0;
};
