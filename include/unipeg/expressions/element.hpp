/**
 * element.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * An expression that consumes a single element, whatever it is. Fails at the
 * end of input.
 */

#ifndef UNIPEG_EXPRESSIONS_ELEMENT_HPP
#define UNIPEG_EXPRESSIONS_ELEMENT_HPP

#include <optional>
#include "../expression.hpp"

namespace unipeg {

class element_t : public expression {
public:
    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        return generate<derivation>(
            [r, pos, done = false]() mutable -> std::optional<derivation> {
                if (done || r.is_end(pos)) {
                    return std::nullopt;
                }
                done = true;
                return derivation{ instance::item(r.at(pos), pos), pos + 1 };
            }
        );
    }
};

inline expr const element = make_expr<element_t>();

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_ELEMENT_HPP */
