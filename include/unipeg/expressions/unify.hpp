/**
 * unify.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Pipes every result of an expression through a pattern. The pattern may
 * reject the result, transform it, bind it to a variable or yield it more
 * than once.
 * Example:
 * auto digit = (item('0') | item('1')) >> make(to_int);
 */

#ifndef UNIPEG_EXPRESSIONS_UNIFY_HPP
#define UNIPEG_EXPRESSIONS_UNIFY_HPP

#include <optional>
#include <utility>
#include "../expression.hpp"
#include "../unifiable.hpp"

namespace unipeg {

class unify_t : public expression {
private:
    class source final : public stream_source<derivation> {
    private:
        pattern          m_Pattern;
        derivations      m_Inner;
        std::size_t      m_Position = 0U;
        stream<instance> m_Unified;

    public:
        source(pattern p, derivations inner)
            : m_Pattern(std::move(p)), m_Inner(std::move(inner)) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            while (true) {
                if (auto u = m_Unified.next()) {
                    return derivation{ std::move(*u), m_Position };
                }
                auto d = m_Inner.next();
                if (!d) {
                    return std::nullopt;
                }
                m_Position = d->position;
                m_Unified = m_Pattern.unify(d->result);
            }
        }
    };

    expr    m_Expr;
    pattern m_Pattern;

public:
    unify_t(expr e, pattern p)
        : m_Expr(std::move(e)), m_Pattern(std::move(p)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(m_Pattern, m_Expr.derive(r, pos));
    }
};

/**
 * Operator for unification.
 */
[[nodiscard]] inline expr operator>>(expr const& e, pattern const& p) {
    return make_expr<unify_t>(e, p);
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_UNIFY_HPP */
