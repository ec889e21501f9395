/**
 * unifiable.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A base-type for all patterns a result can be unified with, and the pattern
 * handle that expressions store. Unifying yields a lazy stream of transformed
 * results: no result rejects the derivation, more than one means the pattern
 * itself is non-deterministic.
 */

#ifndef UNIPEG_UNIFIABLE_HPP
#define UNIPEG_UNIFIABLE_HPP

#include <memory>
#include <type_traits>
#include <utility>
#include "detail/traits.hpp"
#include "instance.hpp"
#include "stream.hpp"
#include "utils/assert.hpp"
#include "utils/fwd.hpp"
#include "utils/requires.hpp"
#include "value.hpp"

namespace unipeg {

class unifiable {
public:
    virtual ~unifiable() = default;

    [[nodiscard]] virtual stream<instance> unify(instance const& v) const = 0;
};

class variable;
class pattern;

[[nodiscard]] inline pattern constant(value v);

namespace detail {

template <typename T>
inline constexpr bool is_pattern_like_v =
       std::is_same_v<remove_cvref_t<T>, pattern>
    || std::is_same_v<remove_cvref_t<T>, variable>
    || std::is_same_v<remove_cvref_t<T>, instance>
    || std::is_base_of_v<unifiable, remove_cvref_t<T>>
    || std::is_convertible_v<remove_cvref_t<T>, std::shared_ptr<unifiable const>>;

} /* namespace detail */

class pattern {
private:
    std::shared_ptr<unifiable const> m_Impl;

public:
    explicit pattern(std::shared_ptr<unifiable const> impl) noexcept
        : m_Impl(std::move(impl)) {
    }

    /**
     * A variable used as a pattern binds (or checks) its value.
     */
    pattern(variable const& var);

    /**
     * A result used as a pattern matches structurally equal results.
     */
    pattern(instance inst);

    /**
     * Anything else is a constant.
     */
    template <typename T,
        UNIPEG_REQUIRES(!detail::is_pattern_like_v<T>)>
    pattern(T&& val)
        : pattern(constant(value(UNIPEG_FWD(val)))) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const {
        UNIPEG_ASSERT("Unifying with an empty pattern!", m_Impl != nullptr);
        return m_Impl->unify(v);
    }
};

/**
 * Constructs a pattern of the given unifiable type.
 */
template <typename U, typename... Args>
[[nodiscard]] pattern make_pattern(Args&&... args) {
    static_assert(
        std::is_base_of_v<unifiable, U>,
        "A pattern must be derived from unifiable!"
    );
    return pattern(std::shared_ptr<unifiable const>(
        std::make_shared<U const>(UNIPEG_FWD(args)...)
    ));
}

/**
 * Matches results structurally equal to a given one.
 */
class structural_t : public unifiable {
private:
    instance m_Instance;

public:
    explicit structural_t(instance inst)
        : m_Instance(std::move(inst)) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        if (unifies(m_Instance, v)) {
            return single(v);
        }
        return stream<instance>();
    }
};

inline pattern::pattern(instance inst)
    : pattern(make_pattern<structural_t>(std::move(inst))) {
}

/**
 * Matches results whose unpacked value equals a constant. The matched result
 * is passed on unchanged, so consumed items keep their position.
 */
class constant_t : public unifiable {
private:
    value m_Value;

public:
    explicit constant_t(value v)
        : m_Value(std::move(v)) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        if (m_Value == v.unpack()) {
            return single(v);
        }
        return stream<instance>();
    }
};

/**
 * Lifts a plain value into a pattern matching exactly that value.
 */
[[nodiscard]] inline pattern constant(value v) {
    return make_pattern<constant_t>(std::move(v));
}

} /* namespace unipeg */

#endif /* UNIPEG_UNIFIABLE_HPP */
