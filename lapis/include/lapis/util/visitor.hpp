#pragma once

namespace lapis {
///
/// \brief Overload set of lambdas for std::visit.
///
template <typename... T>
struct Visitor : T... {
	using T::operator()...;
};

template <typename... T>
Visitor(T...) -> Visitor<T...>;
} // namespace lapis
