#pragma once

namespace TRV {

// Builds a std::visit visitor from lambdas; each alternative needs its own overload
template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};

template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace TRV
