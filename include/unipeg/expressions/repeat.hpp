/**
 * repeat.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Greedy repetition. Applies the expression as many times as it can, always
 * committing to the first derivation of each step, and yields the combination
 * of all steps exactly once. 'plus' requires at least one step, 'star' is
 * happy with none. A step that consumes nothing ends the repetition.
 *
 * Note: the streams of the accepted steps stay alive as long as the single
 * derivation of the repetition is alive. A variable bound inside a step is
 * therefore still bound when the repetition yields, and constrains the
 * following steps. It's released when the enumeration moves past the
 * repetition, or manually with variable::unbind().
 */

#ifndef UNIPEG_EXPRESSIONS_REPEAT_HPP
#define UNIPEG_EXPRESSIONS_REPEAT_HPP

#include <optional>
#include <utility>
#include <vector>
#include "../expression.hpp"

namespace unipeg {

class repeat_t : public expression {
private:
    class source final : public stream_source<derivation> {
    private:
        expr                     m_Expr;
        reader                   m_Reader;
        std::size_t              m_Position;
        bool                     m_RequireOne;
        bool                     m_Done = false;
        std::vector<derivations> m_Steps;

        void release() noexcept {
            // Reverse order of binding
            while (!m_Steps.empty()) {
                m_Steps.pop_back();
            }
        }

    public:
        source(expr e, reader const& r, std::size_t pos, bool require_one)
            : m_Expr(std::move(e)),
              m_Reader(r),
              m_Position(pos),
              m_RequireOne(require_one) {
        }

        ~source() override {
            release();
        }

        [[nodiscard]] std::optional<derivation> next() override {
            if (m_Done) {
                release();
                return std::nullopt;
            }
            m_Done = true;

            auto acc = instance::empty();
            auto pos = m_Position;
            while (true) {
                auto step = m_Expr.derive(m_Reader, pos);
                auto d = step.next();
                if (!d) {
                    break;
                }
                acc = combine(acc, d->result);
                auto const consumed = d->position != pos;
                pos = d->position;
                m_Steps.push_back(std::move(step));
                if (!consumed) {
                    break;
                }
            }
            if (m_RequireOne && m_Steps.empty()) {
                return std::nullopt;
            }
            return derivation{ std::move(acc), pos };
        }
    };

    expr m_Expr;
    bool m_RequireOne;

public:
    repeat_t(expr e, bool require_one)
        : m_Expr(std::move(e)), m_RequireOne(require_one) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return make_stream<derivation, source>(m_Expr, r, pos, m_RequireOne);
    }
};

/**
 * Zero or more, greedy.
 */
[[nodiscard]] inline expr star(expr e) {
    return make_expr<repeat_t>(std::move(e), false);
}

/**
 * One or more, greedy.
 */
[[nodiscard]] inline expr plus(expr e) {
    return make_expr<repeat_t>(std::move(e), true);
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_REPEAT_HPP */
