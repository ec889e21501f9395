/**
 * return.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * An expression that succeeds once with a given result, without consuming
 * anything. The unit of the expression monad.
 */

#ifndef UNIPEG_EXPRESSIONS_RETURN_HPP
#define UNIPEG_EXPRESSIONS_RETURN_HPP

#include <utility>
#include "../expression.hpp"

namespace unipeg {

class ret_t : public expression {
private:
    instance m_Result;

public:
    explicit ret_t(instance result)
        : m_Result(std::move(result)) {
    }

    [[nodiscard]] derivations
    derive(reader const&, std::size_t pos) const override {
        return single(derivation{ m_Result, pos });
    }
};

[[nodiscard]] inline expr ret(instance result) {
    return make_expr<ret_t>(std::move(result));
}

/**
 * Always succeeds with an Empty result.
 */
inline expr const epsilon = ret(instance::empty());

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_RETURN_HPP */
