#pragma once

namespace signalbench {
namespace utils {

// std::visit 용 람다 묶음
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace utils
} // namespace signalbench
