/**
 * parser.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A wrapper-type, that's not an actual expression. Simply wraps an expression
 * and provides a simpler interface for parsing a whole source.
 *
 * The derivation stream keeps a view of the source, so sources must be
 * lvalues that outlive the stream.
 */

#ifndef UNIPEG_PARSER_HPP
#define UNIPEG_PARSER_HPP

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "expression.hpp"
#include "reader.hpp"
#include "utils/requires.hpp"

namespace unipeg {

class parser {
private:
    expr m_Expr;

public:
    parser(expr e)
        : m_Expr(std::move(e)) {
    }

    [[nodiscard]] expr const& underlying() const noexcept {
        return m_Expr;
    }

    /**
     * Every derivation from the given position, lazily.
     */
    template <typename Src>
    [[nodiscard]] derivations parse(Src const& src,
        std::size_t pos = 0U) const {

        return m_Expr.derive(reader(src), pos);
    }

    /**
     * The first derivation only. The enumeration is abandoned afterwards,
     * so variables bound by it are released by the time this returns.
     */
    template <typename Src>
    [[nodiscard]] std::optional<derivation> parse_first(Src const& src,
        std::size_t pos = 0U) const {

        auto ds = parse(src, pos);
        return ds.next();
    }

    template <typename Src>
    [[nodiscard]] std::vector<derivation> parse_all(Src const& src,
        std::size_t pos = 0U) const {

        return collect(parse(src, pos));
    }

    /**
     * True if some derivation consumes the whole source.
     */
    template <typename Src>
    [[nodiscard]] bool matches(Src const& src) const {
        auto r = reader(src);
        auto ds = m_Expr.derive(r, 0U);
        while (auto d = ds.next()) {
            if (d->position == r.size()) {
                return true;
            }
        }
        return false;
    }

    // Just to avoid nasty bugs
    template <typename Src,
        UNIPEG_REQUIRES(
            !std::is_lvalue_reference_v<Src>
         && !std::is_pointer_v<std::decay_t<Src>>
        )>
    void parse(Src&& src, std::size_t pos = 0U) const = delete;

    template <typename Src,
        UNIPEG_REQUIRES(
            !std::is_lvalue_reference_v<Src>
         && !std::is_pointer_v<std::decay_t<Src>>
        )>
    void parse_first(Src&& src, std::size_t pos = 0U) const = delete;

    template <typename Src,
        UNIPEG_REQUIRES(
            !std::is_lvalue_reference_v<Src>
         && !std::is_pointer_v<std::decay_t<Src>>
        )>
    void parse_all(Src&& src, std::size_t pos = 0U) const = delete;
};

} /* namespace unipeg */

#endif /* UNIPEG_PARSER_HPP */
