/**
 * bind.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * The monadic bind. For every derivation of the first expression, a function
 * picks the expression to continue with, which is derived from where the
 * first one stopped. Only the continuation's results are yielded.
 * Example:
 * auto twice = element >>= [](instance const& i) { return item(i); };
 */

#ifndef UNIPEG_EXPRESSIONS_BIND_HPP
#define UNIPEG_EXPRESSIONS_BIND_HPP

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include "../expression.hpp"
#include "../utils/fwd.hpp"
#include "../utils/requires.hpp"

namespace unipeg {

class bind_t : public expression {
private:
    using cont_fn = std::function<expr(instance const&)>;

    class source final : public stream_source<derivation> {
    private:
        cont_fn     m_Cont;
        reader      m_Reader;
        // The outer stream has to outlive the continuation
        derivations m_Outer;
        derivations m_Inner;

    public:
        source(cont_fn cont, derivations outer, reader const& r)
            : m_Cont(std::move(cont)), m_Reader(r), m_Outer(std::move(outer)) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            while (true) {
                if (auto d = m_Inner.next()) {
                    return d;
                }
                auto o = m_Outer.next();
                if (!o) {
                    return std::nullopt;
                }
                m_Inner = m_Cont(o->result).derive(m_Reader, o->position);
            }
        }
    };

    expr    m_Expr;
    cont_fn m_Cont;

public:
    bind_t(expr e, cont_fn cont)
        : m_Expr(std::move(e)), m_Cont(std::move(cont)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(m_Cont, m_Expr.derive(r, pos), r);
    }
};

template <typename Fn>
[[nodiscard]] expr bind(expr e, Fn&& fn) {
    static_assert(
        std::is_invocable_r_v<expr, Fn, instance const&>,
        "The continuation must map a result to an expression!"
    );
    return make_expr<bind_t>(std::move(e), UNIPEG_FWD(fn));
}

/**
 * Operator for binding.
 */
template <typename Fn,
    UNIPEG_REQUIRES(std::is_invocable_r_v<expr, Fn, instance const&>)>
[[nodiscard]] expr operator>>=(expr const& e, Fn&& fn) {
    return bind(e, UNIPEG_FWD(fn));
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_BIND_HPP */
