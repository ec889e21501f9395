/**
 * patterns.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Inclusion of all pattern headers.
 */

#ifndef UNIPEG_PATTERNS_HPP
#define UNIPEG_PATTERNS_HPP

#include "unifiable.hpp"
#include "patterns/any.hpp"
#include "patterns/either.hpp"
#include "patterns/label.hpp"
#include "patterns/make.hpp"
#include "patterns/nothing.hpp"
#include "patterns/variable.hpp"

#endif /* UNIPEG_PATTERNS_HPP */
