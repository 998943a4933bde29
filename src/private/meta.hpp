#pragma once

namespace regexp::meta {
template <typename... Ts> struct Overload : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;
} // namespace regexp::meta
