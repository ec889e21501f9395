/**
 * assert.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT license.
 *
 * Assertions for programming errors (misuse of an accessor, broken internal
 * invariants). Parse failures never go through here.
 */

#ifndef UNIPEG_UTILS_ASSERT_HPP
#define UNIPEG_UTILS_ASSERT_HPP

#include <cassert>

/**
 * Assertion with a custom message. Compiled out with NDEBUG.
 */
#define UNIPEG_ASSERT(msg, ...) assert(((void)(msg), (__VA_ARGS__)))

#endif /* UNIPEG_UTILS_ASSERT_HPP */
