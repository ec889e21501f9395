/**
 * alt.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Ordered choice without cut. Yields every derivation of the first
 * alternative, then every derivation of the second, both from the same
 * position. The second alternative is only started when the first one is
 * exhausted (and released everything it bound).
 */

#ifndef UNIPEG_EXPRESSIONS_ALT_HPP
#define UNIPEG_EXPRESSIONS_ALT_HPP

#include <optional>
#include <utility>
#include "../expression.hpp"

namespace unipeg {

class alt_t : public expression {
private:
    class source final : public stream_source<derivation> {
    private:
        expr        m_SecondExpr;
        reader      m_Reader;
        std::size_t m_Position;
        derivations m_First;
        derivations m_Second;
        bool        m_OnSecond = false;

    public:
        source(derivations first, expr second,
            reader const& r, std::size_t pos)
            : m_SecondExpr(std::move(second)),
              m_Reader(r),
              m_Position(pos),
              m_First(std::move(first)) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            if (!m_OnSecond) {
                if (auto d = m_First.next()) {
                    return d;
                }
                m_OnSecond = true;
                m_Second = m_SecondExpr.derive(m_Reader, m_Position);
            }
            return m_Second.next();
        }
    };

    expr m_First;
    expr m_Second;

public:
    alt_t(expr first, expr second)
        : m_First(std::move(first)), m_Second(std::move(second)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(
            m_First.derive(r, pos), m_Second, r, pos
        );
    }
};

/**
 * Operator for making alternatives.
 */
[[nodiscard]] inline expr operator|(expr const& first, expr const& second) {
    return make_expr<alt_t>(first, second);
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_ALT_HPP */
