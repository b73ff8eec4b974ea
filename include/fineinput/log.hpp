#pragma once

/**
 * @file log.hpp
 * @brief Diagnostic output for the input core
 *
 * Messages go to stdout (info/debug) or stderr (warn/error), prefixed
 * with "[fineinput]". A host can redirect them with setSink().
 */

#include <functional>
#include <string_view>

namespace fineinput::log {

enum class Level {
    Debug,
    Info,
    Warning,
    Error,
};

using Sink = std::function<void(Level level, std::string_view message)>;

/// Replace the output sink (e.g. to route into the host's logger)
void setSink(Sink sink);

/// Restore the default stdout/stderr sink
void resetSink();

/// Debug messages are dropped unless enabled
void setDebugEnabled(bool enabled);
[[nodiscard]] bool debugEnabled();

void debug(std::string_view message);
void info(std::string_view message);
void warn(std::string_view message);
void error(std::string_view message);

}  // namespace fineinput::log
