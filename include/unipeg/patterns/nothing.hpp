/**
 * nothing.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A pattern that rejects every result.
 */

#ifndef UNIPEG_PATTERNS_NOTHING_HPP
#define UNIPEG_PATTERNS_NOTHING_HPP

#include "../unifiable.hpp"

namespace unipeg {

class nothing_t : public unifiable {
public:
    [[nodiscard]] stream<instance> unify(instance const& /* v */) const override {
        return stream<instance>();
    }
};

// Value for 'nothing' pattern
inline pattern const nothing = make_pattern<nothing_t>();

} /* namespace unipeg */

#endif /* UNIPEG_PATTERNS_NOTHING_HPP */
