#include "benefactor/logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace benefactor {
namespace logging {

static std::atomic<Level> g_level{Level::Info};
static std::mutex g_output_mutex;

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_level.load());
}

std::optional<Level> parse_level(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    return std::nullopt;
}

const char* level_name(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
    }
    return "info";
}

Line::Line(Level level, const char* tag) : level_(level) {
    buffer_ << "[" << tag << "] ";
}

Line::~Line() {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::ostream& out = (level_ >= Level::Warn) ? std::cerr : std::cout;
    out << buffer_.str() << std::endl;
}

} // namespace logging
} // namespace benefactor
