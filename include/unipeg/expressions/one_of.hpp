/**
 * one_of.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Consumes a single element that's a member of a set of choices. Sets can be
 * combined with the usual set operators.
 * Example:
 * auto vowels = choice_set("aeiou");
 * auto letter = one_of(choice_set("abcdefghijklmnopqrstuvwxyz") - vowels);
 */

#ifndef UNIPEG_EXPRESSIONS_ONE_OF_HPP
#define UNIPEG_EXPRESSIONS_ONE_OF_HPP

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <string_view>
#include <utility>
#include <vector>
#include "item.hpp"
#include "../expression.hpp"
#include "../unifiable.hpp"
#include "../value.hpp"

namespace unipeg {

/**
 * A set of values. Values are only equality comparable, so this is a plain
 * list without duplicates.
 */
class choice_set {
private:
    value_list m_Choices;

public:
    choice_set() = default;

    choice_set(std::initializer_list<value> choices) {
        for (auto const& c : choices) {
            insert(c);
        }
    }

    /**
     * Every character of the string is a choice.
     */
    explicit choice_set(std::string_view chars) {
        for (auto c : chars) {
            insert(value(c));
        }
    }

    void insert(value v) {
        if (!contains(v)) {
            m_Choices.push_back(std::move(v));
        }
    }

    [[nodiscard]] bool contains(value const& v) const {
        return std::find(m_Choices.begin(), m_Choices.end(), v)
            != m_Choices.end();
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_Choices.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return m_Choices.empty();
    }

    [[nodiscard]] value_list const& choices() const noexcept {
        return m_Choices;
    }

    [[nodiscard]] friend choice_set
    operator|(choice_set const& l, choice_set const& r) {
        auto res = l;
        for (auto const& c : r.m_Choices) {
            res.insert(c);
        }
        return res;
    }

    [[nodiscard]] friend choice_set
    operator&(choice_set const& l, choice_set const& r) {
        choice_set res;
        for (auto const& c : l.m_Choices) {
            if (r.contains(c)) {
                res.m_Choices.push_back(c);
            }
        }
        return res;
    }

    [[nodiscard]] friend choice_set
    operator-(choice_set const& l, choice_set const& r) {
        choice_set res;
        for (auto const& c : l.m_Choices) {
            if (!r.contains(c)) {
                res.m_Choices.push_back(c);
            }
        }
        return res;
    }

    [[nodiscard]] friend choice_set
    operator^(choice_set const& l, choice_set const& r) {
        return (l - r) | (r - l);
    }

    friend bool operator==(choice_set const& l, choice_set const& r) {
        if (l.size() != r.size()) {
            return false;
        }
        return std::all_of(l.m_Choices.begin(), l.m_Choices.end(),
            [&r](value const& c) { return r.contains(c); });
    }

    friend bool operator!=(choice_set const& l, choice_set const& r) {
        return !(l == r);
    }
};

inline std::ostream& operator<<(std::ostream& os, choice_set const& s) {
    os << '{';
    for (std::size_t i = 0; i < s.choices().size(); ++i) {
        if (i != 0) {
            os << ", ";
        }
        os << s.choices()[i];
    }
    return os << '}';
}

/**
 * Accepts results whose plain value is in the set.
 */
class member_t : public unifiable {
private:
    choice_set m_Set;

public:
    explicit member_t(choice_set set)
        : m_Set(std::move(set)) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        if (m_Set.contains(v.unpack())) {
            return single(v);
        }
        return stream<instance>();
    }
};

[[nodiscard]] inline pattern member_of(choice_set set) {
    return make_pattern<member_t>(std::move(set));
}

[[nodiscard]] inline expr one_of(choice_set set) {
    return item(member_of(std::move(set)));
}

} /* namespace unipeg */

#endif /* UNIPEG_EXPRESSIONS_ONE_OF_HPP */
