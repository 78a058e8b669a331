#pragma once

#include <optional>
#include <sstream>
#include <string>

namespace benefactor {
namespace logging {

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error
};

void set_level(Level level);
Level level();
bool enabled(Level level);

std::optional<Level> parse_level(const std::string& name);
const char* level_name(Level level);

/**
 * @brief One tagged log line, written on destruction
 *
 * Info and below go to stdout, Warn and Error to stderr:
 *   [LEDGER] Recorded donation ...
 */
class Line {
public:
    Line(Level level, const char* tag);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    std::ostream& stream() { return buffer_; }

private:
    Level level_;
    std::ostringstream buffer_;
};

} // namespace logging
} // namespace benefactor

#define BENEFACTOR_LOG(lvl, tag)                                                   \
    if (!::benefactor::logging::enabled(::benefactor::logging::Level::lvl)) {      \
    } else                                                                         \
        ::benefactor::logging::Line(::benefactor::logging::Level::lvl, tag).stream()
