/**
 * unipeg.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Backtracking parser combinators with unification. Include this to get the
 * whole library.
 */

#ifndef UNIPEG_UNIPEG_HPP
#define UNIPEG_UNIPEG_HPP

#include "config.hpp"
#include "error.hpp"
#include "expressions.hpp"
#include "grammar.hpp"
#include "instance.hpp"
#include "log.hpp"
#include "parser.hpp"
#include "patterns.hpp"
#include "reader.hpp"
#include "stream.hpp"
#include "value.hpp"

#endif /* UNIPEG_UNIPEG_HPP */
