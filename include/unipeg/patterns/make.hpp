/**
 * make.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A pattern that calls a factory and yields the constructed object.
 *
 * Without bindings the factory receives the plain data of the result:
 *
 * item('1') >> make([](value const& v) { return v.as<char>() - '0'; })
 *
 * With bindings it receives the values of the bound variables by name,
 * unbound variables are left out:
 *
 * ((p >> l) + (q >> r)) >> make(
 *     [](named_args const& args) {
 *         return node{ args.get<int>("left"), args.get<int>("right") };
 *     },
 *     { { "left", l }, { "right", r } }
 * )
 */

#ifndef UNIPEG_PATTERNS_MAKE_HPP
#define UNIPEG_PATTERNS_MAKE_HPP

#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "variable.hpp"
#include "../detail/traits.hpp"
#include "../error.hpp"
#include "../unifiable.hpp"
#include "../utils/fwd.hpp"

namespace unipeg {

/**
 * The named arguments handed to a factory.
 */
class named_args {
private:
    std::map<std::string, value> m_Args;

public:
    named_args() = default;

    void set(std::string const& name, value v) {
        m_Args.insert_or_assign(name, std::move(v));
    }

    [[nodiscard]] bool contains(std::string const& name) const {
        return m_Args.count(name) != 0;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_Args.size();
    }

    [[nodiscard]] value const& at(std::string const& name) const {
        auto it = m_Args.find(name);
        if (it == m_Args.end()) {
            throw factory_argument_error(
                name, "missing factory argument '" + name + "'"
            );
        }
        return it->second;
    }

    template <typename T>
    [[nodiscard]] T const& get(std::string const& name) const {
        auto const& v = at(name);
        auto const* p = v.as_ptr<T>();
        if (p == nullptr) {
            throw factory_argument_error(
                name, "factory argument '" + name + "' has the wrong type"
            );
        }
        return *p;
    }
};

using bindings = std::vector<std::pair<std::string, variable>>;

namespace detail {

/**
 * Factories may answer with a result, a value or any object.
 */
template <typename R>
[[nodiscard]] instance to_instance(R&& r) {
    if constexpr (std::is_same_v<remove_cvref_t<R>, instance>) {
        return UNIPEG_FWD(r);
    }
    else {
        return instance::object(value(UNIPEG_FWD(r)));
    }
}

} /* namespace detail */

class make_t : public unifiable {
private:
    using apply_fn = std::function<instance(instance const&)>;

    apply_fn m_Apply;

public:
    explicit make_t(apply_fn fn)
        : m_Apply(std::move(fn)) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        return single(m_Apply(v));
    }
};

/**
 * The factory is applied directly to the unpacked result.
 */
template <typename Fn>
[[nodiscard]] pattern make(Fn fn) {
    static_assert(
        std::is_invocable_v<Fn const&, value const&>,
        "A factory without bindings must be invocable with a value!"
    );
    return make_pattern<make_t>(
        [fn = std::move(fn)](instance const& v) {
            return detail::to_instance(fn(v.unpack()));
        }
    );
}

/**
 * The factory is invoked with the currently bound variables as named
 * arguments.
 */
template <typename Fn>
[[nodiscard]] pattern make(Fn fn, bindings args) {
    static_assert(
        std::is_invocable_v<Fn const&, named_args const&>,
        "A factory with bindings must be invocable with named_args!"
    );
    return make_pattern<make_t>(
        [fn = std::move(fn), args = std::move(args)](instance const&) {
            named_args named;
            for (auto const& [name, var] : args) {
                if (var.is_bound()) {
                    named.set(name, var.unpack());
                }
            }
            return detail::to_instance(fn(named));
        }
    );
}

} /* namespace unipeg */

#endif /* UNIPEG_PATTERNS_MAKE_HPP */
