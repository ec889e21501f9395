/**
 * requires.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT license.
 *
 * SFINAE helper macro. Used to keep the converting constructors of the value,
 * pattern and reader types from hijacking copies of themselves.
 */

#ifndef UNIPEG_UTILS_REQUIRES_HPP
#define UNIPEG_UTILS_REQUIRES_HPP

#include <cstddef>
#include <type_traits>

#define UNIPEG_REQUIRES(...) UNIPEG_REQUIRES_IMPL(__LINE__, __VA_ARGS__)
#define UNIPEG_REQUIRES_IMPL(line, ...) UNIPEG_REQUIRES_IMPL1(line, __VA_ARGS__)
#define UNIPEG_REQUIRES_IMPL1(id, ...) \
bool unipeg_req_##id = false,          \
::std::enable_if_t<unipeg_req_##id || (__VA_ARGS__), ::std::nullptr_t> = nullptr

#endif /* UNIPEG_UTILS_REQUIRES_HPP */
