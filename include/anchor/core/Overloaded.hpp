#pragma once

namespace anchor {
namespace core {

// Builds a std::visit visitor from a set of lambdas.
template<class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace core
} // namespace anchor
