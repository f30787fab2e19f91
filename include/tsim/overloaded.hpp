#pragma once

namespace tsim {

// Visitor built from lambdas, for std::visit over the variants in this library.
template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace tsim
