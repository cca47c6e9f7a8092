#include "ConfigManager.hpp"

#include <any>
#include <filesystem>
#include <format>

#include <hyprutils/memory/Casts.hpp>

void CConfigManager::registerConfigVar(const char* name, const Hyprlang::INT& val) {
    m_configValueNumber++;
    m_config->addConfigValue(name, val);
}

void CConfigManager::registerConfigVar(const char* name, const Hyprlang::FLOAT& val) {
    m_configValueNumber++;
    m_config->addConfigValue(name, val);
}

void CConfigManager::registerConfigVar(const char* name, const Hyprlang::STRING& val) {
    m_configValueNumber++;
    m_config->addConfigValue(name, val);
}

Hyprlang::INT CConfigManager::getInt(const char* name) const {
    return std::any_cast<Hyprlang::INT>(m_config->getConfigValue(name));
}

Hyprlang::FLOAT CConfigManager::getFloat(const char* name) const {
    return std::any_cast<Hyprlang::FLOAT>(m_config->getConfigValue(name));
}

std::string CConfigManager::getString(const char* name) const {
    const std::string VAL = std::any_cast<Hyprlang::STRING>(m_config->getConfigValue(name));
    return VAL == STRVAL_EMPTY ? "" : VAL;
}

std::expected<SPullConfig, std::string> CConfigManager::loadFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return std::unexpected(std::format("config file '{}' doesn't exist", path));

    return load(path, false);
}

std::expected<SPullConfig, std::string> CConfigManager::loadString(const std::string& contents) {
    return load(contents, true);
}

std::expected<SPullConfig, std::string> CConfigManager::load(const std::string& pathOrContents, bool isStream) {
    m_configValueNumber = 0;
    m_config            = makeUnique<Hyprlang::CConfig>(pathOrContents.c_str(), Hyprlang::SConfigOptions{.throwAllErrors = false, .allowMissingConfig = false, .pathIsStream = isStream});

    SPullConfig defaults;

    registerConfigVar("pull:top_distance", Hyprlang::FLOAT{defaults.topDistance});
    registerConfigVar("pull:bottom_distance", Hyprlang::FLOAT{defaults.bottomDistance});
    registerConfigVar("pull:distance_index", Hyprlang::FLOAT{defaults.distanceIndex});
    registerConfigVar("pull:max_distance", Hyprlang::FLOAT{defaults.maxDistance});
    registerConfigVar("pull:auto_fill", Hyprlang::INT{defaults.autoFill});
    registerConfigVar("pull:bottom_all_loaded", Hyprlang::INT{defaults.bottomAllLoaded});
    registerConfigVar("pull:load_timeout", Hyprlang::INT{defaults.loadTimeoutMs});
    registerConfigVar("pull:locale", {STRVAL_EMPTY});

    registerConfigVar("pull:text:top_pull", {STRVAL_EMPTY});
    registerConfigVar("pull:text:top_drop", {STRVAL_EMPTY});
    registerConfigVar("pull:text:top_loading", {STRVAL_EMPTY});
    registerConfigVar("pull:text:bottom_pull", {STRVAL_EMPTY});
    registerConfigVar("pull:text:bottom_drop", {STRVAL_EMPTY});

    registerConfigVar("pull:col.spinner", Hyprlang::INT{defaults.spinnerColor});
    registerConfigVar("pull:col.text", Hyprlang::INT{defaults.textColor});

    registerConfigVar("debug:disable_logs", Hyprlang::INT{0});
    registerConfigVar("debug:disable_time", Hyprlang::INT{0});
    registerConfigVar("debug:enable_stdout_logs", Hyprlang::INT{1});
    registerConfigVar("debug:colored_stdout_logs", Hyprlang::INT{1});
    registerConfigVar("debug:log_file", {STRVAL_EMPTY});

    m_config->commence();

    const auto RESULT = m_config->parse();
    if (RESULT.error) {
        Log::logger->log(Log::ERR, "Config has errors: {}", RESULT.getError());
        return std::unexpected(std::string{RESULT.getError()});
    }

    SPullConfig cfg;
    cfg.topDistance       = getFloat("pull:top_distance");
    cfg.bottomDistance    = getFloat("pull:bottom_distance");
    cfg.distanceIndex     = getFloat("pull:distance_index");
    cfg.maxDistance       = getFloat("pull:max_distance");
    cfg.autoFill          = getInt("pull:auto_fill");
    cfg.bottomAllLoaded   = getInt("pull:bottom_all_loaded");
    cfg.loadTimeoutMs     = getInt("pull:load_timeout");
    cfg.locale            = getString("pull:locale");
    cfg.labels.topPull    = getString("pull:text:top_pull");
    cfg.labels.topDrop    = getString("pull:text:top_drop");
    cfg.labels.topLoading = getString("pull:text:top_loading");
    cfg.labels.bottomPull = getString("pull:text:bottom_pull");
    cfg.labels.bottomDrop = getString("pull:text:bottom_drop");
    cfg.spinnerColor      = sc<uint32_t>(getInt("pull:col.spinner"));
    cfg.textColor         = sc<uint32_t>(getInt("pull:col.text"));

    if (auto valid = cfg.validate(); !valid) {
        Log::logger->log(Log::ERR, "Config rejected: {}", valid.error());
        return std::unexpected(valid.error());
    }

    m_loggerOptions = Log::SLoggerOptions{
        .disableLogs  = getInt("debug:disable_logs") != 0,
        .enableStdout = getInt("debug:enable_stdout_logs") != 0,
        .enableColor  = getInt("debug:colored_stdout_logs") != 0,
        .disableTime  = getInt("debug:disable_time") != 0,
        .outputFile   = getString("debug:log_file"),
    };

    Log::logger->log(Log::DEBUG, "Loaded {} config values{}", m_configValueNumber, isStream ? "" : std::format(" from {}", pathOrContents));

    m_pullConfig = cfg;
    return cfg;
}

const SPullConfig& CConfigManager::pullConfig() const {
    return m_pullConfig;
}

Log::SLoggerOptions CConfigManager::loggerOptions() const {
    return m_loggerOptions;
}
