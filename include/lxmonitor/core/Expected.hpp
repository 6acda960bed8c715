// Expected.hpp
// -----------------------------------------------------------------------------
// Success/error pair used across lxmonitor. Socket setup and command-surface
// calls return expected<T>; the error side is a std::error_code carrying
// either an asio/system error or a MonitorErrc value.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace lxmonitor {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace lxmonitor
