/**
 * end.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * An expression that succeeds only when there's nothing left to consume.
 * Yields an End marker, which disappears when combined with other results.
 */

#ifndef UNIPEG_EXPRESSIONS_END_HPP
#define UNIPEG_EXPRESSIONS_END_HPP

#include <optional>
#include "../expression.hpp"

namespace unipeg {

class end_t : public expression {
public:
    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return generate<derivation>(
            [r, pos, done = false]() mutable -> std::optional<derivation> {
                if (done || !r.is_end(pos)) {
                    return std::nullopt;
                }
                done = true;
                return derivation{ instance::end(pos), pos };
            }
        );
    }
};

inline expr const end_of_input = make_expr<end_t>();

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_END_HPP */
