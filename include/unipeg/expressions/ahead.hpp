/**
 * ahead.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Zero-width lookahead. Succeeds once with an Empty result at the starting
 * position if the expression matches there. Only the first derivation is
 * examined, and it's abandoned right away, so nothing it bound survives.
 */

#ifndef UNIPEG_EXPRESSIONS_AHEAD_HPP
#define UNIPEG_EXPRESSIONS_AHEAD_HPP

#include <optional>
#include <utility>
#include "../expression.hpp"

namespace unipeg {

class ahead_t : public expression {
private:
    expr m_Expr;

public:
    explicit ahead_t(expr e)
        : m_Expr(std::move(e)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return generate<derivation>(
            [e = m_Expr, r, pos, done = false]() mutable
                -> std::optional<derivation> {

                if (done) {
                    return std::nullopt;
                }
                done = true;
                auto inner = e.derive(r, pos);
                auto first = inner.next();
                inner.close();
                if (!first) {
                    return std::nullopt;
                }
                return derivation{ instance::empty(), pos };
            }
        );
    }
};

[[nodiscard]] inline expr ahead(expr e) {
    return make_expr<ahead_t>(std::move(e));
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_AHEAD_HPP */
