/**
 * zero.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * An expression that never matches. The identity of alternatives.
 */

#ifndef UNIPEG_EXPRESSIONS_ZERO_HPP
#define UNIPEG_EXPRESSIONS_ZERO_HPP

#include "../expression.hpp"

namespace unipeg {

class zero_t : public expression {
public:
    [[nodiscard]] derivations
    derive(reader const&, std::size_t) const override {
        return derivations();
    }
};

inline expr const zero = make_expr<zero_t>();

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_ZERO_HPP */
