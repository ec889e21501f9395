/**
 * variable.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Logic variables. An unbound variable binds to whatever it's unified with,
 * for exactly as long as the enumeration that bound it is alive. A bound
 * variable only accepts results that unify with its binding.
 *
 * Bindings are made through trail entries. An entry restores the previous
 * state of the cell exactly once: when its stream is pulled past the binding,
 * or when the stream is closed or destroyed, whichever happens first.
 */

#ifndef UNIPEG_PATTERNS_VARIABLE_HPP
#define UNIPEG_PATTERNS_VARIABLE_HPP

#include <memory>
#include <optional>
#include <ostream>
#include <utility>
#include "../instance.hpp"
#include "../stream.hpp"
#include "../unifiable.hpp"
#include "../utils/assert.hpp"
#include "../value.hpp"

namespace unipeg {

namespace detail {

struct binding_cell {
    std::optional<instance> bound;
};

class trail_entry {
private:
    std::shared_ptr<binding_cell> m_Cell;
    std::optional<instance>       m_Previous;
    bool                          m_Active;

public:
    trail_entry(std::shared_ptr<binding_cell> cell, instance val)
        : m_Cell(std::move(cell)),
          m_Previous(std::move(m_Cell->bound)),
          m_Active(true) {
        m_Cell->bound = std::move(val);
    }

    trail_entry(trail_entry const&) = delete;
    trail_entry& operator=(trail_entry const&) = delete;

    ~trail_entry() {
        undo();
    }

    void undo() noexcept {
        if (m_Active) {
            m_Cell->bound = std::move(m_Previous);
            m_Active = false;
        }
    }
};

} /* namespace detail */

class variable_t : public unifiable {
private:
    class source final : public stream_source<instance> {
    private:
        std::shared_ptr<detail::binding_cell> m_Cell;
        instance                              m_Value;
        std::optional<detail::trail_entry>    m_Entry;
        bool                                  m_Done = false;

    public:
        source(std::shared_ptr<detail::binding_cell> cell, instance v)
            : m_Cell(std::move(cell)), m_Value(std::move(v)) {
        }

        [[nodiscard]] std::optional<instance> next() override {
            if (m_Done) {
                // Pulled past the binding
                m_Entry.reset();
                return std::nullopt;
            }
            m_Done = true;
            if (m_Cell->bound) {
                if (unifies(*m_Cell->bound, m_Value)) {
                    return m_Value;
                }
                return std::nullopt;
            }
            m_Entry.emplace(m_Cell, m_Value);
            return m_Value;
        }
    };

    std::shared_ptr<detail::binding_cell> m_Cell;

public:
    explicit variable_t(std::shared_ptr<detail::binding_cell> cell) noexcept
        : m_Cell(std::move(cell)) {
    }

    [[nodiscard]] stream<instance> unify(instance const& v) const override {
        return make_stream<instance, source>(m_Cell, v);
    }
};

/**
 * The user-facing handle. Copies refer to the same variable.
 */
class variable {
private:
    friend class pattern;

    std::shared_ptr<detail::binding_cell> m_Cell;

public:
    variable()
        : m_Cell(std::make_shared<detail::binding_cell>()) {
    }

    [[nodiscard]] bool is_bound() const noexcept {
        return m_Cell->bound.has_value();
    }

    [[nodiscard]] instance const& bound() const {
        UNIPEG_ASSERT("The variable is not bound!", is_bound());
        return *m_Cell->bound;
    }

    /**
     * The plain data of the binding, null when unbound.
     */
    [[nodiscard]] value unpack() const {
        if (!is_bound()) {
            return value();
        }
        return m_Cell->bound->unpack();
    }

    /**
     * Forcibly drops the binding. Only needed after greedy repetition, which
     * keeps the bindings of its iterations alive.
     */
    void unbind() noexcept {
        m_Cell->bound.reset();
    }

    [[nodiscard]] bool same_as(variable const& o) const noexcept {
        return m_Cell == o.m_Cell;
    }
};

inline pattern::pattern(variable const& var)
    : pattern(make_pattern<variable_t>(var.m_Cell)) {
}

inline std::ostream& operator<<(std::ostream& os, variable const& v) {
    if (v.is_bound()) {
        return os << "<Variable bound to " << v.bound() << '>';
    }
    return os << "<Unbound variable>";
}

} /* namespace unipeg */

#endif /* UNIPEG_PATTERNS_VARIABLE_HPP */
