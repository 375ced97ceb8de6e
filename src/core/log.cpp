#include <chregistry/core/log.h>

#include <array>
#include <memory>
#include <mutex>

namespace chregistry::log {
namespace {

std::once_flag g_once;
std::unique_ptr<chlog::logger> g_logger;

struct LevelName {
    std::string_view name;
    chlog::level level;
};

constexpr std::array<LevelName, 8> kLevels{{
    {"trace", chlog::level::trace},
    {"debug", chlog::level::debug},
    {"info", chlog::level::info},
    {"warn", chlog::level::warn},
    {"warning", chlog::level::warn},
    {"error", chlog::level::error},
    {"critical", chlog::level::critical},
    {"off", chlog::level::off},
}};

} // namespace

chlog::level ParseLevel(std::string_view level) {
    for (const auto& l : kLevels) {
        if (l.name == level) {
            return l.level;
        }
    }
    return chlog::level::info;
}

bool IsKnownLevel(std::string_view level) {
    for (const auto& l : kLevels) {
        if (l.name == level) {
            return true;
        }
    }
    return false;
}

void Init(std::string_view level) {
    std::call_once(g_once, [] {
        chlog::logger_config cfg;
        cfg.name = "chregistry";
        cfg.level = chlog::level::info;
        cfg.pattern = "[{date} {time}.{ms}][{lvl}][tid={tid}] {msg}";
        cfg.async.enabled = false;
        cfg.parallel_sinks = false;

        g_logger = std::make_unique<chlog::logger>(std::move(cfg));
        g_logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
    });

    Get().set_level(ParseLevel(level));
}

chlog::logger& Get() {
    if (!g_logger) {
        Init("info");
    }
    return *g_logger;
}

} // namespace chregistry::log
