/**
 * expression.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A base-type for all expressions, and the expression handle the combinators
 * are built from. Deriving an expression at a position yields a lazy stream
 * of derivations: every way the expression can match from there, in
 * enumeration order. Deriving never does any work by itself, the stream is
 * only evaluated as it's pulled.
 */

#ifndef UNIPEG_EXPRESSION_HPP
#define UNIPEG_EXPRESSION_HPP

#include <cstddef>
#include <memory>
#include <ostream>
#include <type_traits>
#include <utility>
#include "instance.hpp"
#include "reader.hpp"
#include "stream.hpp"
#include "utils/assert.hpp"
#include "utils/fwd.hpp"

namespace unipeg {

/**
 * One successful match: the result and the position right after it.
 */
struct derivation {
    instance    result;
    std::size_t position;
};

inline std::ostream& operator<<(std::ostream& os, derivation const& d) {
    return os << '(' << d.result << ", " << d.position << ')';
}

using derivations = stream<derivation>;

class expression {
public:
    virtual ~expression() = default;

    [[nodiscard]] virtual derivations
    derive(reader const& r, std::size_t pos) const = 0;
};

class expr {
private:
    std::shared_ptr<expression const> m_Impl;

public:
    explicit expr(std::shared_ptr<expression const> impl) noexcept
        : m_Impl(std::move(impl)) {
    }

    [[nodiscard]] derivations derive(reader const& r,
        std::size_t pos = 0U) const {

        UNIPEG_ASSERT("Deriving an empty expression!", m_Impl != nullptr);
        return m_Impl->derive(r, pos);
    }
};

/**
 * Constructs an expression of the given node type.
 */
template <typename E, typename... Args>
[[nodiscard]] expr make_expr(Args&&... args) {
    static_assert(
        std::is_base_of_v<expression, E>,
        "An expression must be derived from expression!"
    );
    return expr(std::shared_ptr<expression const>(
        std::make_shared<E const>(UNIPEG_FWD(args)...)
    ));
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSION_HPP */
