/**
 * any.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A pattern that accepts any result unchanged.
 */

#ifndef UNIPEG_PATTERNS_ANY_HPP
#define UNIPEG_PATTERNS_ANY_HPP

#include "../unifiable.hpp"

namespace unipeg {

class any_t : public unifiable {
public:
    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        return single(v);
    }
};

// Value for 'anything' pattern
inline pattern const anything = make_pattern<any_t>();

} /* namespace unipeg */

#endif /* UNIPEG_PATTERNS_ANY_HPP */
