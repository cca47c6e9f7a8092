#include "Logger.hpp"

using namespace Log;

CLogger::CLogger() {
    const auto IS_TRACE = Env::isTrace();
    m_logger.setLogLevel(IS_TRACE ? Hyprutils::CLI::LOG_TRACE : Hyprutils::CLI::LOG_DEBUG);
    m_logger.setEnableStdout(true);
    m_logger.setEnableColor(true);
    m_logger.setTime(true);
}

void CLogger::log(Hyprutils::CLI::eLogLevel level, const std::string_view& str) {

    static bool TRACE = Env::isTrace();

    if (!m_logsEnabled)
        return;

    if (level == Hyprutils::CLI::LOG_TRACE && !TRACE)
        return;

    m_logger.log(level, str);
}

void CLogger::configure(const SLoggerOptions& opts) {
    m_logsEnabled = !opts.disableLogs;

    m_logger.setEnableStdout(!opts.disableLogs && opts.enableStdout);
    m_logger.setEnableColor(opts.enableColor);
    m_logger.setTime(!opts.disableTime);

    if (!opts.outputFile.empty())
        m_logger.setOutputFile(opts.outputFile);
}
