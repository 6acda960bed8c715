#pragma once

#include <asio.hpp>
#include <chrono>
#include <system_error>

namespace lxmonitor::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `lxmonitor::net::asio` as the standalone Asio namespace.
 * - `lxmonitor::net::udp` and the IPv4 address type used for source identity.
 */
namespace asio = ::asio;

using udp = asio::ip::udp;
using address_v4 = asio::ip::address_v4;
using error_code = std::error_code;
using milliseconds = std::chrono::milliseconds;

} // namespace lxmonitor::net
