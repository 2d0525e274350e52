// typeset_lsp/basic/overloaded.hpp - Lambda overload set for std::visit
#pragma once

namespace typeset_lsp
{

template <class... Ts>
struct overloaded : Ts...
{
  using Ts::operator()...;
};

template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace typeset_lsp
