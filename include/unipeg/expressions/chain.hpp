/**
 * chain.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Sequencing. For every derivation of the left expression, the right one is
 * derived from where the left stopped, and the two results are combined into
 * one flat sequence.
 * Example:
 * auto ab = item('a') + item('b');
 */

#ifndef UNIPEG_EXPRESSIONS_CHAIN_HPP
#define UNIPEG_EXPRESSIONS_CHAIN_HPP

#include <optional>
#include <utility>
#include "../expression.hpp"

namespace unipeg {

class chain_t : public expression {
private:
    class source final : public stream_source<derivation> {
    private:
        expr                      m_RightExpr;
        reader                    m_Reader;
        // Declaration order matters: the right stream is destroyed first
        derivations               m_Left;
        std::optional<derivation> m_Current;
        derivations               m_Right;

    public:
        source(expr right, derivations left, reader const& r)
            : m_RightExpr(std::move(right)),
              m_Reader(r),
              m_Left(std::move(left)) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            while (true) {
                if (m_Current) {
                    if (auto d = m_Right.next()) {
                        return derivation{
                            combine(m_Current->result, d->result),
                            d->position
                        };
                    }
                }
                m_Current = m_Left.next();
                if (!m_Current) {
                    return std::nullopt;
                }
                m_Right = m_RightExpr.derive(m_Reader, m_Current->position);
            }
        }
    };

    expr m_Left;
    expr m_Right;

public:
    chain_t(expr left, expr right)
        : m_Left(std::move(left)), m_Right(std::move(right)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(m_Right, m_Left.derive(r, pos), r);
    }
};

/**
 * Operator for sequencing.
 */
[[nodiscard]] inline expr operator+(expr const& left, expr const& right) {
    return make_expr<chain_t>(left, right);
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_CHAIN_HPP */
