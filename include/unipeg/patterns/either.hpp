/**
 * either.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A non-deterministic pattern: every unification of the first pattern, then
 * every unification of the second one.
 */

#ifndef UNIPEG_PATTERNS_EITHER_HPP
#define UNIPEG_PATTERNS_EITHER_HPP

#include <optional>
#include <utility>
#include "../unifiable.hpp"

namespace unipeg {

class either_t : public unifiable {
private:
    class source final : public stream_source<instance> {
    private:
        instance         m_Value;
        pattern          m_Second;
        stream<instance> m_Current;
        bool             m_OnSecond = false;

    public:
        source(instance v, pattern const& first, pattern second)
            : m_Value(std::move(v)),
              m_Second(std::move(second)),
              m_Current(first.unify(m_Value)) {
        }

        [[nodiscard]] std::optional<instance> next() override {
            if (auto v = m_Current.next()) {
                return v;
            }
            if (m_OnSecond) {
                return std::nullopt;
            }
            m_OnSecond = true;
            m_Current = m_Second.unify(m_Value);
            return m_Current.next();
        }
    };

    pattern m_First;
    pattern m_Second;

public:
    either_t(pattern first, pattern second)
        : m_First(std::move(first)), m_Second(std::move(second)) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        return make_stream<instance, source>(v, m_First, m_Second);
    }
};

[[nodiscard]] inline pattern either(pattern first, pattern second) {
    return make_pattern<either_t>(std::move(first), std::move(second));
}

} /* namespace unipeg */

#endif /* UNIPEG_PATTERNS_EITHER_HPP */
