#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <sstream>
#include <type_traits>
#include <utility>

namespace lxmonitor::log {

using LogHandler = std::function<void(std::string_view)>;

// An empty handler restores the default sink (stdout for info, stderr for errors).
void setLogHandlers(LogHandler infoHandler, LogHandler errorHandler);
void resetLogHandlers();

/**
 * @brief Toggle the per-packet debug channel.
 *
 * Debug messages go to the info handler. They are off by default because the
 * receive loops would otherwise print one line per dropped datagram.
 */
void setDebugLogging(bool enabled);
bool debugLoggingEnabled();

void logInfo(std::string_view message);
void logError(std::string_view message);
void logDebug(std::string_view message);

namespace detail {

template<typename... Args>
inline std::string buildLogMessage(Args&&... args) {
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    return oss.str();
}

template<typename T>
using IsStringViewConvertible = std::is_convertible<T, std::string_view>;

} // namespace detail

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logInfo(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logInfo(msg);
}

template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logError(First&& first, Rest&&... rest) {
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logError(msg);
}

// Arguments are only formatted when the debug channel is on.
template<typename First, typename... Rest,
         typename = std::enable_if_t<(sizeof...(Rest) > 0) ||
             !detail::IsStringViewConvertible<std::decay_t<First>>::value>>
void logDebug(First&& first, Rest&&... rest) {
    if (!debugLoggingEnabled()) return;
    auto msg = detail::buildLogMessage(std::forward<First>(first), std::forward<Rest>(rest)...);
    logDebug(msg);
}

} // namespace lxmonitor::log

namespace lxmonitor {
using log::LogHandler;
using log::setLogHandlers;
using log::resetLogHandlers;
using log::setDebugLogging;
using log::logInfo;
using log::logError;
using log::logDebug;
} // namespace lxmonitor
