/**
 * instance.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * The instantiated result of a successful match step, and the monoid that
 * merges results of sequenced matches into one flat sequence.
 */

#ifndef UNIPEG_INSTANCE_HPP
#define UNIPEG_INSTANCE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "utils/assert.hpp"
#include "utils/fwd.hpp"
#include "value.hpp"

namespace unipeg {

class instance;

using instance_list = std::vector<instance>;

class instance {
public:
    enum class kind : std::uint8_t {
        empty,
        end,
        item,
        sequence,
        labeled,
        object,
    };

    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

private:
    struct end_data {
        std::size_t position;
    };

    struct item_data {
        value       val;
        std::size_t position;
    };

    struct sequence_data {
        instance_list items;
    };

    struct labeled_data {
        std::shared_ptr<instance const> inner;
        std::string                     label;
    };

    struct object_data {
        value val;
    };

    // Order matches the kind enumeration
    using variant_type = std::variant<
        std::monostate,
        end_data,
        item_data,
        sequence_data,
        labeled_data,
        object_data
    >;

    variant_type m_Data;

    template <typename TFwd>
    explicit instance(std::in_place_t, TFwd&& data)
        : m_Data(UNIPEG_FWD(data)) {
    }

public:
    /**
     * The empty instance, success without a payload.
     */
    instance() noexcept = default;

    [[nodiscard]] static instance empty() noexcept {
        return instance();
    }

    [[nodiscard]] static instance end(std::size_t pos) {
        return instance(std::in_place, end_data{ pos });
    }

    [[nodiscard]] static instance item(value val, std::size_t pos) {
        return instance(std::in_place, item_data{ std::move(val), pos });
    }

    [[nodiscard]] static instance sequence(instance_list items) {
        return instance(std::in_place, sequence_data{ std::move(items) });
    }

    [[nodiscard]] static instance labeled(instance inner, std::string label) {
        return instance(std::in_place, labeled_data{
            std::make_shared<instance const>(std::move(inner)),
            std::move(label)
        });
    }

    [[nodiscard]] static instance object(value val) {
        return instance(std::in_place, object_data{ std::move(val) });
    }

    [[nodiscard]] kind get_kind() const noexcept {
        return static_cast<kind>(m_Data.index());
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return get_kind() == kind::empty;
    }

    [[nodiscard]] bool is_end() const noexcept {
        return get_kind() == kind::end;
    }

    [[nodiscard]] bool is_item() const noexcept {
        return get_kind() == kind::item;
    }

    [[nodiscard]] bool is_sequence() const noexcept {
        return get_kind() == kind::sequence;
    }

    [[nodiscard]] bool is_labeled() const noexcept {
        return get_kind() == kind::labeled;
    }

    [[nodiscard]] bool is_object() const noexcept {
        return get_kind() == kind::object;
    }

    /**
     * Items and objects are atoms, they never get spliced into sequences.
     */
    [[nodiscard]] bool is_atom() const noexcept {
        return is_item() || is_object();
    }

    /**
     * The position where the result starts. A sequence reports the position
     * of its first item, a label the position of what it labels.
     */
    [[nodiscard]] std::size_t position() const noexcept {
        switch (get_kind()) {
        case kind::end: return std::get<end_data>(m_Data).position;
        case kind::item: return std::get<item_data>(m_Data).position;
        case kind::sequence: {
            auto const& items = std::get<sequence_data>(m_Data).items;
            return items.empty() ? npos : items.front().position();
        }
        case kind::labeled:
            return std::get<labeled_data>(m_Data).inner->position();
        default: return npos;
        }
    }

    [[nodiscard]] value const& get_value() const {
        UNIPEG_ASSERT(
            "Only item and object instances carry a value!",
            is_atom()
        );
        if (is_item()) {
            return std::get<item_data>(m_Data).val;
        }
        return std::get<object_data>(m_Data).val;
    }

    [[nodiscard]] instance_list const& items() const {
        UNIPEG_ASSERT(
            "Only sequence instances have items!",
            is_sequence()
        );
        return std::get<sequence_data>(m_Data).items;
    }

    [[nodiscard]] instance const& inner() const {
        UNIPEG_ASSERT(
            "Only labeled instances have an inner result!",
            is_labeled()
        );
        return *std::get<labeled_data>(m_Data).inner;
    }

    [[nodiscard]] std::string const& label() const {
        UNIPEG_ASSERT(
            "Only labeled instances have a label!",
            is_labeled()
        );
        return std::get<labeled_data>(m_Data).label;
    }

    /**
     * Projects the result down to plain data: sequences become value lists,
     * labels are dropped, Empty and End become the null value.
     */
    [[nodiscard]] value unpack() const {
        switch (get_kind()) {
        case kind::item:
        case kind::object:
            return get_value();
        case kind::sequence: {
            value_list res;
            res.reserve(items().size());
            for (auto const& i : items()) {
                res.push_back(i.unpack());
            }
            return value(std::move(res));
        }
        case kind::labeled:
            return inner().unpack();
        default:
            return value();
        }
    }
};

/**
 * The combination monoid. Empty is the identity, End is a marker that
 * disappears next to any other result, and everything else is concatenated
 * into a single flat sequence.
 */
[[nodiscard]] inline instance combine(instance const& l, instance const& r) {
    if (r.is_empty() || (r.is_end() && !l.is_empty())) {
        return l;
    }
    if (l.is_empty() || l.is_end()) {
        return r;
    }

    instance_list items;
    auto const splice = [&items](instance const& i) {
        if (i.is_sequence()) {
            items.insert(items.end(), i.items().begin(), i.items().end());
        }
        else {
            items.push_back(i);
        }
    };
    splice(l);
    splice(r);
    return instance::sequence(std::move(items));
}

/**
 * Structural unification of two instances. Positions never matter, only the
 * shape and the carried values.
 */
[[nodiscard]] inline bool unifies(instance const& pat, instance const& v) {
    using kind = instance::kind;

    switch (pat.get_kind()) {
    case kind::empty: return v.is_empty();
    case kind::end: return v.is_end();
    case kind::item:
    case kind::object:
        return v.is_atom() && pat.get_value() == v.get_value();
    case kind::sequence: {
        if (!v.is_sequence() || pat.items().size() != v.items().size()) {
            return false;
        }
        for (std::size_t i = 0; i < pat.items().size(); ++i) {
            if (!unifies(pat.items()[i], v.items()[i])) {
                return false;
            }
        }
        return true;
    }
    case kind::labeled:
        return v.is_labeled()
            && pat.label() == v.label()
            && unifies(pat.inner(), v.inner());
    }
    return false;
}

inline std::ostream& operator<<(std::ostream& os, instance const& i) {
    using kind = instance::kind;

    switch (i.get_kind()) {
    case kind::empty: return os << "Empty";
    case kind::end: return os << "<End at " << i.position() << '>';
    case kind::item:
        return os << '<' << i.get_value() << " at " << i.position() << '>';
    case kind::sequence: {
        os << "Sequence([";
        for (std::size_t n = 0; n < i.items().size(); ++n) {
            if (n != 0) {
                os << ", ";
            }
            os << i.items()[n];
        }
        return os << "])";
    }
    case kind::labeled:
        return os << '<' << i.label() << ": " << i.inner() << '>';
    case kind::object: return os << i.get_value();
    }
    return os;
}

} /* namespace unipeg */

#endif /* UNIPEG_INSTANCE_HPP */
