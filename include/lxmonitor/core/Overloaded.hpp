#pragma once

namespace lxmonitor {

// Visitor built from lambdas; std::visit fails to compile if an alternative
// is left unhandled.
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace lxmonitor
