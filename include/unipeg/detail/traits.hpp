/**
 * traits.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Type traits used by the type-erased value and reader. Detection idiom
 * based on the Library Fundamentals TS v2.
 */

#ifndef UNIPEG_DETAIL_TRAITS_HPP
#define UNIPEG_DETAIL_TRAITS_HPP

#include <cstddef>
#include <iterator>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace unipeg {
namespace detail {

template <typename T>
struct remove_cvref : std::remove_cv<std::remove_reference_t<T>> {};

template <typename T>
using remove_cvref_t = typename remove_cvref<T>::type;

template <typename AlwaysVoid,
    template <typename...> typename Op, typename... Args>
struct detector : std::false_type {};

template <template <typename...> typename Op, typename... Args>
struct detector<std::void_t<Op<Args...>>, Op, Args...> : std::true_type {};

template <template <typename...> typename Op, typename... Args>
inline constexpr bool is_detected_v = detector<void, Op, Args...>::value;

// Operations the value type dispatches on

template <typename T>
using equal_t = decltype(std::declval<T const&>() == std::declval<T const&>());

template <typename T>
using stream_insert_t =
    decltype(std::declval<std::ostream&>() << std::declval<T const&>());

template <typename T>
inline constexpr bool is_equality_comparable_v = is_detected_v<equal_t, T>;

template <typename T>
inline constexpr bool is_printable_v = is_detected_v<stream_insert_t, T>;

// Readable source concept for the reader
// The source has to have:
//  - An operator[](std::size_t) that returns the element at the given index
//  - A .size() member or size(source) that returns the length of the source

template <typename T>
using element_at_t =
    decltype(std::declval<T const&>()[std::declval<std::size_t>()]);

template <typename T>
using length_t = decltype(std::size(std::declval<T const&>()));

template <typename T>
inline constexpr bool is_reader_source_v =
       is_detected_v<element_at_t, T>
    && is_detected_v<length_t, T>;

// Character arrays are read as C strings, up to the terminator
template <typename T>
inline constexpr bool is_char_array_v =
       std::is_array_v<T>
    && std::is_same_v<std::remove_cv_t<std::remove_extent_t<T>>, char>;

/**
 * C strings are stored as std::string, so that two equal literals compare
 * equal instead of comparing addresses.
 */
template <typename T>
struct stored_type {
    using type = std::decay_t<T>;
};

template <>
struct stored_type<char const*> {
    using type = std::string;
};

template <>
struct stored_type<char*> {
    using type = std::string;
};

template <typename T>
using stored_type_t = typename stored_type<std::decay_t<T>>::type;

} /* namespace detail */
} /* namespace unipeg */

#endif /* UNIPEG_DETAIL_TRAITS_HPP */
