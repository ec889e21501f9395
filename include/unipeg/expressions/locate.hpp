/**
 * locate.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Unifies a pattern with the position where an expression starts matching.
 * The position is offered as an Object holding a std::size_t, the
 * derivations themselves pass through unchanged. Integer constants are
 * converted to std::size_t, so 'e ^ 1' matches at position 1.
 * Example:
 * auto at = variable();
 * auto word = plus(when(is_alpha)) ^ at;
 */

#ifndef UNIPEG_EXPRESSIONS_LOCATE_HPP
#define UNIPEG_EXPRESSIONS_LOCATE_HPP

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include "../expression.hpp"
#include "../unifiable.hpp"
#include "../utils/requires.hpp"

namespace unipeg {

class locate_t : public expression {
private:
    class source final : public stream_source<derivation> {
    private:
        pattern                   m_Pattern;
        std::size_t               m_Start;
        derivations               m_Inner;
        std::optional<derivation> m_Current;
        stream<instance>          m_Unified;

    public:
        source(pattern p, std::size_t start, derivations inner)
            : m_Pattern(std::move(p)),
              m_Start(start),
              m_Inner(std::move(inner)) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            while (true) {
                if (m_Current && m_Unified.next()) {
                    return m_Current;
                }
                m_Current = m_Inner.next();
                if (!m_Current) {
                    return std::nullopt;
                }
                m_Unified = m_Pattern.unify(instance::object(value(m_Start)));
            }
        }
    };

    expr    m_Expr;
    pattern m_Pattern;

public:
    locate_t(expr e, pattern p)
        : m_Expr(std::move(e)), m_Pattern(std::move(p)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(
            m_Pattern, pos, m_Expr.derive(r, pos)
        );
    }
};

[[nodiscard]] inline expr locate(expr e, pattern p) {
    return make_expr<locate_t>(std::move(e), std::move(p));
}

template <typename T,
    UNIPEG_REQUIRES(std::is_integral_v<T> && !std::is_same_v<T, bool>)>
[[nodiscard]] expr locate(expr e, T pos) {
    return locate(std::move(e), pattern(static_cast<std::size_t>(pos)));
}

/**
 * Operator for locating.
 */
[[nodiscard]] inline expr operator^(expr const& e, pattern const& p) {
    return locate(e, p);
}

template <typename T,
    UNIPEG_REQUIRES(std::is_integral_v<T> && !std::is_same_v<T, bool>)>
[[nodiscard]] expr operator^(expr const& e, T pos) {
    return locate(e, pos);
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_LOCATE_HPP */
