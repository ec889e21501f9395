/**
 * value.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A type-erased value. Sequence elements, constants and factory-made objects
 * all travel through the engine as values. Like std::any, but comparable and
 * printable.
 */

#ifndef UNIPEG_VALUE_HPP
#define UNIPEG_VALUE_HPP

#include <any>
#include <ostream>
#include <type_traits>
#include <typeinfo>
#include <vector>
#include "detail/traits.hpp"
#include "utils/fwd.hpp"
#include "utils/requires.hpp"

namespace unipeg {

class value;

/**
 * The plain-data projection of a sequence result.
 */
using value_list = std::vector<value>;

class value {
private:
    using equal_fn = bool (*)(std::any const&, std::any const&);
    using print_fn = void (*)(std::ostream&, std::any const&);

    template <typename T>
    static bool equal_impl(std::any const& l, std::any const& r) {
        if constexpr (detail::is_equality_comparable_v<T>) {
            auto const* lp = std::any_cast<T>(&l);
            auto const* rp = std::any_cast<T>(&r);
            return lp != nullptr && rp != nullptr && static_cast<bool>(*lp == *rp);
        }
        else {
            // No way to compare, treat as distinct
            (void)l;
            (void)r;
            return false;
        }
    }

    template <typename T>
    static void print_impl(std::ostream& os, std::any const& v) {
        if constexpr (std::is_same_v<T, char>) {
            os << '\'' << std::any_cast<char const&>(v) << '\'';
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            os << '"' << std::any_cast<std::string const&>(v) << '"';
        }
        else if constexpr (detail::is_printable_v<T>) {
            os << std::any_cast<T const&>(v);
        }
        else {
            os << '<' << v.type().name() << '>';
        }
    }

    std::any m_Value;
    equal_fn m_Equal = nullptr;
    print_fn m_Print = nullptr;

public:
    /**
     * The null value, result of unpacking an Empty or End result.
     */
    value() noexcept = default;

    template <typename T,
        UNIPEG_REQUIRES(!std::is_same_v<detail::remove_cvref_t<T>, value>)>
    value(T&& val)
        : m_Value(detail::stored_type_t<T>(UNIPEG_FWD(val))),
          m_Equal(&equal_impl<detail::stored_type_t<T>>),
          m_Print(&print_impl<detail::stored_type_t<T>>) {
    }

    [[nodiscard]] bool has_value() const noexcept {
        return m_Value.has_value();
    }

    [[nodiscard]] std::type_info const& type() const noexcept {
        return m_Value.type();
    }

    template <typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::any_cast<T>(&m_Value) != nullptr;
    }

    /**
     * Typed access. Throws std::bad_any_cast when the held type differs.
     */
    template <typename T>
    [[nodiscard]] T const& as() const {
        return std::any_cast<T const&>(m_Value);
    }

    template <typename T>
    [[nodiscard]] T const* as_ptr() const noexcept {
        return std::any_cast<T>(&m_Value);
    }

    friend bool operator==(value const& l, value const& r) {
        if (!l.has_value() || !r.has_value()) {
            return l.has_value() == r.has_value();
        }
        if (l.type() != r.type()) {
            return false;
        }
        return l.m_Equal(l.m_Value, r.m_Value);
    }

    friend bool operator!=(value const& l, value const& r) {
        return !(l == r);
    }

    // Templated so that nothing converts to a value just to get printed
    template <typename V, UNIPEG_REQUIRES(std::is_same_v<V, value>)>
    friend std::ostream& operator<<(std::ostream& os, V const& v) {
        if (!v.has_value()) {
            return os << "null";
        }
        v.m_Print(os, v.m_Value);
        return os;
    }
};

inline std::ostream& operator<<(std::ostream& os, value_list const& vs) {
    os << '[';
    for (std::size_t i = 0; i < vs.size(); ++i) {
        if (i != 0) {
            os << ", ";
        }
        os << vs[i];
    }
    return os << ']';
}

} /* namespace unipeg */

#endif /* UNIPEG_VALUE_HPP */
