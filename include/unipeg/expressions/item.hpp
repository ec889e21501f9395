/**
 * item.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * An expression that consumes a single element, if it unifies with a pattern.
 * A non-deterministic pattern can make it succeed more than once.
 * Example:
 * auto digit = item('0') | item('1');
 */

#ifndef UNIPEG_EXPRESSIONS_ITEM_HPP
#define UNIPEG_EXPRESSIONS_ITEM_HPP

#include <optional>
#include <type_traits>
#include <utility>
#include "bind.hpp"
#include "element.hpp"
#include "return.hpp"
#include "zero.hpp"
#include "../expression.hpp"
#include "../unifiable.hpp"

namespace unipeg {

class item_t : public expression {
private:
    class source final : public stream_source<derivation> {
    private:
        pattern          m_Pattern;
        reader           m_Reader;
        std::size_t      m_Position;
        bool             m_Started = false;
        stream<instance> m_Unified;

    public:
        source(pattern p, reader const& r, std::size_t pos)
            : m_Pattern(std::move(p)), m_Reader(r), m_Position(pos) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            if (!m_Started) {
                m_Started = true;
                if (m_Reader.is_end(m_Position)) {
                    return std::nullopt;
                }
                m_Unified = m_Pattern.unify(
                    instance::item(m_Reader.at(m_Position), m_Position)
                );
            }
            if (auto u = m_Unified.next()) {
                return derivation{ std::move(*u), m_Position + 1 };
            }
            return std::nullopt;
        }
    };

    pattern m_Pattern;

public:
    explicit item_t(pattern p)
        : m_Pattern(std::move(p)) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(m_Pattern, r, pos);
    }
};

[[nodiscard]] inline expr item(pattern p) {
    return make_expr<item_t>(std::move(p));
}

/**
 * Consumes an element that satisfies a predicate.
 * Example:
 * auto digit = when([](value const& v) {
 *     return v.is<char>() && std::isdigit(v.as<char>());
 * });
 */
template <typename Pred>
[[nodiscard]] expr when(Pred pred) {
    static_assert(
        std::is_invocable_r_v<bool, Pred const&, value const&>,
        "The predicate must be invocable with a value and return bool!"
    );
    return element >>= [pred = std::move(pred)](instance const& i) {
        return pred(i.get_value()) ? ret(i) : zero;
    };
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_ITEM_HPP */
