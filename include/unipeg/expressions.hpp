/**
 * expressions.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Inclusion of all expression headers.
 */

#ifndef UNIPEG_EXPRESSIONS_HPP
#define UNIPEG_EXPRESSIONS_HPP

#include "expression.hpp"
#include "expressions/ahead.hpp"
#include "expressions/alt.hpp"
#include "expressions/backtrack.hpp"
#include "expressions/bind.hpp"
#include "expressions/chain.hpp"
#include "expressions/element.hpp"
#include "expressions/end.hpp"
#include "expressions/item.hpp"
#include "expressions/locate.hpp"
#include "expressions/one_of.hpp"
#include "expressions/repeat.hpp"
#include "expressions/return.hpp"
#include "expressions/unify.hpp"
#include "expressions/zero.hpp"

#endif /* UNIPEG_EXPRESSIONS_HPP */
