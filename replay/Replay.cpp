#include "Replay.hpp"
#include "managers/eventLoop/EventLoopManager.hpp"
#include "debug/log/Logger.hpp"

#include <hyprutils/string/String.hpp>
#include <hyprutils/string/VarList.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <print>
#include <sstream>

using namespace Hyprutils::String;

// transitions scheduled with doLater can schedule more, don't spin forever on a bad chain
constexpr const size_t MAX_SETTLE_ROUNDS = 64;

std::string CReplayTouch::deviceName() {
    return "replay-touch";
}

CReplay::CReplay(const SPullConfig& config) : m_config(config), m_now(Time::steadyNow()) {
    m_list         = makeShared<CSimulatedList>();
    m_list->m_self = m_list;

    m_touch         = makeShared<CReplayTouch>();
    m_touch->m_self = m_touch;

    m_loop         = makeShared<CEventLoopManager>([this] { return m_now; });
    m_loop->m_self = m_loop;
}

CReplay::~CReplay() {
    // listeners reference this, drop them before the pull goes
    m_listeners = {};
    if (m_pull)
        m_pull->attachTouch(nullptr);
}

size_t CReplay::failures() const {
    return m_failures;
}

SP<CPullToLoad> CReplay::pull() const {
    return m_pull;
}

SP<CSimulatedList> CReplay::list() const {
    return m_list;
}

std::expected<void, std::string> CReplay::runFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec)
        return std::unexpected(std::format("trace file {} doesn't exist", path));

    std::ifstream file(path);
    if (!file.good())
        return std::unexpected(std::format("couldn't open {}", path));

    std::stringstream ss;
    ss << file.rdbuf();

    return runString(ss.str());
}

std::expected<void, std::string> CReplay::runString(const std::string& trace) {
    std::istringstream stream(trace);
    std::string        line;

    while (std::getline(stream, line)) {
        m_lineNo++;

        if (auto ret = runLine(line); !ret)
            return std::unexpected(std::format("line {}: {}", m_lineNo, ret.error()));
    }

    return {};
}

std::expected<void, std::string> CReplay::ensureInit() {
    if (m_pull)
        return {};

    m_list->build();

    SPullLoaders loaders;
    loaders.reload = makeShared<CFunctionLoader>([this] {
        m_topLoads++;
        std::println("[{:>6}ms] reload #{}", m_timeMs, m_topLoads);
    });
    loaders.infinite = makeShared<CFunctionLoader>([this] {
        m_bottomLoads++;
        std::println("[{:>6}ms] infinite #{}", m_timeMs, m_bottomLoads);
    });

    auto pull = CPullToLoad::create(m_config, loaders, m_list->content(), m_list->viewport(), m_loop);
    if (!pull)
        return std::unexpected(pull.error());

    m_pull = *pull;

    m_listeners.translate    = m_pull->m_events.translateChange.listen([this](float t) { std::println("[{:>6}ms] offset {:.1f}", m_timeMs, t); });
    m_listeners.topStatus    = m_pull->m_events.topStatusChange.listen([this](ePullStatus s) { std::println("[{:>6}ms] top {} \"{}\"", m_timeMs, toString(s), m_pull->topText()); });
    m_listeners.bottomStatus = m_pull->m_events.bottomStatusChange.listen(
        [this](ePullStatus s) { std::println("[{:>6}ms] bottom {} \"{}\"", m_timeMs, toString(s), m_pull->bottomText()); });
    m_listeners.loadFailed = m_pull->m_events.loadFailed.listen([this](ePullEdge edge, const std::string& reason) {
        std::println("[{:>6}ms] {} failed: {}", m_timeMs, toString(edge), reason);
    });

    m_pull->attachTouch(m_touch);
    m_pull->setBottomAllLoaded(m_config.bottomAllLoaded || (m_list->m_totalItems > 0 && m_list->m_items >= m_list->m_totalItems));
    m_pull->init();

    return {};
}

void CReplay::settle() {
    for (size_t i = 0; i < MAX_SETTLE_ROUNDS; ++i) {
        if (m_loop->dispatch() == 0)
            return;
    }

    Log::logger->log(Log::WARN, "CReplay: deferred work still pending after {} rounds", MAX_SETTLE_ROUNDS);
}

std::expected<void, std::string> CReplay::runLine(const std::string& rawLine) {
    auto line = trim(rawLine);

    if (const auto COMMENT = line.find('#'); COMMENT != std::string::npos)
        line = trim(line.substr(0, COMMENT));

    if (line.empty())
        return {};

    CVarList args(line, 0, 's', true);

    const auto CMD = args[0];

    auto       number = [&args](size_t idx) -> std::expected<double, std::string> {
        const auto ARG = args[idx];
        if (!isNumber(ARG, true))
            return std::unexpected(std::format("expected a number, got \"{}\"", ARG));

        try {
            return std::stod(ARG);
        } catch (std::exception& e) { return std::unexpected(std::format("bad number \"{}\": {}", ARG, e.what())); }
    };

    auto edge = [&args]() -> std::expected<ePullEdge, std::string> {
        if (args[1] == "top")
            return PULL_EDGE_TOP;
        if (args[1] == "bottom")
            return PULL_EDGE_BOTTOM;
        return std::unexpected(std::format("expected top or bottom, got \"{}\"", args[1]));
    };

    // layout, only before init
    if (CMD == "viewport" || CMD == "container" || CMD == "items" || CMD == "item_height" || CMD == "page" || CMD == "total") {
        if (m_pull && CMD == "container")
            return std::unexpected("container has to be set before init");

        const auto VALUE = number(1);
        if (!VALUE)
            return std::unexpected(VALUE.error());

        if (*VALUE < 0)
            return std::unexpected(std::format("{} can't be negative", CMD));

        if (CMD == "viewport")
            m_list->m_viewportHeight = *VALUE;
        else if (CMD == "container")
            m_list->m_containerHeight = *VALUE;
        else if (CMD == "items")
            m_list->m_items = std::llround(*VALUE);
        else if (CMD == "item_height")
            m_list->m_itemHeight = *VALUE;
        else if (CMD == "page")
            m_list->m_pageSize = std::llround(*VALUE);
        else
            m_list->m_totalItems = std::llround(*VALUE);

        return {};
    }

    if (CMD == "init") {
        if (auto ret = ensureInit(); !ret)
            return ret;
        settle();
        return {};
    }

    if (!m_pull)
        return std::unexpected(std::format("\"{}\" before init", CMD));

    if (CMD == "down" || CMD == "move") {
        const auto Y = number(1);
        if (!Y)
            return std::unexpected(Y.error());

        if (CMD == "down")
            m_touch->m_touchEvents.down.emit(ITouch::SDownEvent{.timeMs = m_timeMs, .touchID = 0, .pos = {0.0, *Y}});
        else {
            m_touch->m_touchEvents.motion.emit(ITouch::SMotionEvent{.timeMs = m_timeMs, .touchID = 0, .pos = {0.0, *Y}});

            // what the browser does with a move nobody consumed
            if (!m_pull->lastMotionClaimed())
                m_list->scrollBy(m_touchY - *Y);
        }

        m_touchY = *Y;
    } else if (CMD == "up")
        m_touch->m_touchEvents.up.emit(ITouch::SUpEvent{.timeMs = m_timeMs, .touchID = 0});
    else if (CMD == "cancel")
        m_touch->m_touchEvents.cancel.emit(ITouch::SCancelEvent{.timeMs = m_timeMs, .touchID = 0});
    else if (CMD == "scroll") {
        const auto Y = number(1);
        if (!Y)
            return std::unexpected(Y.error());

        m_list->scrollTo(*Y);
    } else if (CMD == "wait") {
        const auto MS = number(1);
        if (!MS)
            return std::unexpected(MS.error());

        if (*MS < 0)
            return std::unexpected("can't wait a negative amount of time");

        settle();
        m_now += Time::fromMillis(std::llround(*MS));
        m_timeMs += std::llround(*MS);
    } else if (CMD == "loaded") {
        const auto EDGE = edge();
        if (!EDGE)
            return std::unexpected(EDGE.error());

        if (*EDGE == PULL_EDGE_TOP)
            m_pull->onTopLoaded();
        else {
            m_list->m_items += m_list->m_pageSize;
            if (m_list->m_totalItems > 0 && m_list->m_items >= m_list->m_totalItems) {
                m_list->m_items = m_list->m_totalItems;
                m_pull->setBottomAllLoaded(true);
            }

            m_pull->onBottomLoaded();
        }
    } else if (CMD == "fail") {
        const auto EDGE = edge();
        if (!EDGE)
            return std::unexpected(EDGE.error());

        const auto REASON = args.size() > 2 ? args.join(" ", 2) : std::string{"failed"};

        if (*EDGE == PULL_EDGE_TOP)
            m_pull->onTopLoadFailed(REASON);
        else
            m_pull->onBottomLoadFailed(REASON);
    } else if (CMD == "expect") {
        if (args.size() < 3)
            return std::unexpected("expect needs a subject and a value");

        if (auto ret = expect(args[1], args.join(" ", 2)); !ret)
            return ret;
    } else
        return std::unexpected(std::format("unknown command \"{}\"", CMD));

    settle();
    return {};
}

std::expected<void, std::string> CReplay::expect(const std::string& what, const std::string& value) {
    std::string actual;
    bool        matches = false;

    if (what == "top" || what == "bottom") {
        actual  = toString(what == "top" ? m_pull->topStatus() : m_pull->bottomStatus());
        matches = actual == value;
    } else if (what == "offset" || what == "scroll") {
        if (!isNumber(value, true))
            return std::unexpected(std::format("expect {} needs a number, got \"{}\"", what, value));

        const double WANTED = std::stod(value);
        const double HAVE   = what == "offset" ? m_pull->translate() : m_list->m_scroll;

        actual  = std::format("{:.1f}", HAVE);
        matches = std::abs(WANTED - HAVE) < 0.05;
    } else if (what == "loads") {
        // expect loads top 1
        CVarList   vars(value, 0, 's', true);
        const auto COUNT = vars[0] == "top" ? m_topLoads : m_bottomLoads;

        if ((vars[0] != "top" && vars[0] != "bottom") || !isNumber(vars[1]))
            return std::unexpected(std::format("expect loads needs top|bottom and a count, got \"{}\"", value));

        actual  = std::to_string(COUNT);
        matches = actual == vars[1];
    } else
        return std::unexpected(std::format("can't expect \"{}\"", what));

    if (matches) {
        std::println("[{:>6}ms] ok: {} is {}", m_timeMs, what, value);
        return {};
    }

    m_failures++;
    std::println(stderr, "[{:>6}ms] FAILED (line {}): expected {} {}, got {}", m_timeMs, m_lineNo, what, value, actual);
    return {};
}
