#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>

namespace fluentcheck::validation {

namespace detail {

template <typename T> struct IsOptional : std::false_type {};

template <typename T> struct IsOptional<std::optional<T>> : std::true_type {};

// Owning or callable handles that may hold nothing.
template <typename T> struct IsNullableHandle : std::false_type {};

template <typename T>
struct IsNullableHandle<std::shared_ptr<T>> : std::true_type {};

template <typename T, typename D>
struct IsNullableHandle<std::unique_ptr<T, D>> : std::true_type {};

template <typename Signature>
struct IsNullableHandle<std::function<Signature>> : std::true_type {};

} // namespace detail

// Tells whether a value stands for "nothing": a null pointer, an empty
// optional, or an empty smart pointer or std::function. Plain values are
// never absent.
template <typename T> bool isAbsent(const T &value) {
  if constexpr (std::is_null_pointer_v<T>) {
    return true;
  } else if constexpr (detail::IsOptional<T>::value) {
    return !value.has_value();
  } else if constexpr (std::is_pointer_v<T> ||
                       detail::IsNullableHandle<T>::value) {
    return value == nullptr;
  } else {
    return false;
  }
}

} // namespace fluentcheck::validation
