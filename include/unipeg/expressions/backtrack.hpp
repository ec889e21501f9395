/**
 * backtrack.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Backtracking repetition. For every derivation of the expression, every
 * continuation of the repetition from there is yielded (combined with the
 * step's result), followed by the step's result alone. So every number of
 * repetitions is a candidate, the longest first.
 *
 * The nesting depth of the streams equals the number of repetitions matched.
 */

#ifndef UNIPEG_EXPRESSIONS_BACKTRACK_HPP
#define UNIPEG_EXPRESSIONS_BACKTRACK_HPP

#include <optional>
#include <utility>
#include "alt.hpp"
#include "return.hpp"
#include "../expression.hpp"

namespace unipeg {

class backtrack_t : public expression {
private:
    class source final : public stream_source<derivation> {
    private:
        expr                      m_Expr;
        reader                    m_Reader;
        std::size_t               m_Position;
        derivations               m_Steps;
        std::optional<derivation> m_Current;
        derivations               m_Rest;

    public:
        source(expr e, reader const& r, std::size_t pos)
            : m_Expr(std::move(e)),
              m_Reader(r),
              m_Position(pos),
              m_Steps(m_Expr.derive(r, pos)) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            while (true) {
                if (m_Current) {
                    if (auto c = m_Rest.next()) {
                        return derivation{
                            combine(m_Current->result, c->result),
                            c->position
                        };
                    }
                    auto alone = std::move(m_Current);
                    m_Current.reset();
                    return alone;
                }
                m_Current = m_Steps.next();
                if (!m_Current) {
                    return std::nullopt;
                }
                if (m_Current->position != m_Position) {
                    m_Rest = make_stream<derivation, source>(
                        m_Expr, m_Reader, m_Current->position
                    );
                }
            }
        }
    };

    expr m_Expr;

public:
    explicit backtrack_t(expr e)
        : m_Expr(std::move(e)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(m_Expr, r, pos);
    }
};

/**
 * One or more, backtracking.
 */
[[nodiscard]] inline expr some(expr e) {
    return make_expr<backtrack_t>(std::move(e));
}

/**
 * Zero or more, backtracking.
 */
[[nodiscard]] inline expr many(expr e) {
    return some(std::move(e)) | epsilon;
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_BACKTRACK_HPP */
