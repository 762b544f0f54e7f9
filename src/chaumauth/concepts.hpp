#pragma once

#ifndef CHAUMAUTH_CONCEPTS_HPP
#define CHAUMAUTH_CONCEPTS_HPP

#include <concepts>    // for convertible_to, equality_comparable
#include <cstddef>     // for size_t
#include <functional>  // for hash

namespace chaumauth {

template <typename Type>
concept HashableKey = std::equality_comparable<Type> and requires(Type value) {
  { std::hash<Type>{}(value) } -> std::convertible_to<std::size_t>;
};  // NOLINT(readability/braces)

template <typename Type, typename Value>
concept ValuePredicate = requires(Type predicate, Value const &value) {
  { predicate(value) } -> std::convertible_to<bool>;
};  // NOLINT(readability/braces)

}  // namespace chaumauth

#endif /* CHAUMAUTH_CONCEPTS_HPP */
