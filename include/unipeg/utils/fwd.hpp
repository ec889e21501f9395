/**
 * fwd.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT license.
 *
 * A simple forward-macro for the common cases.
 */

#ifndef UNIPEG_UTILS_FWD_HPP
#define UNIPEG_UTILS_FWD_HPP

#include <utility>

#define UNIPEG_FWD(...) ::std::forward<decltype(__VA_ARGS__)>(__VA_ARGS__)

#endif /* UNIPEG_UTILS_FWD_HPP */
