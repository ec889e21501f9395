/**
 * grammar.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A set of named, possibly mutually recursive rules. References to rules are
 * resolved when they are evaluated, so rules can be defined in any order.
 * Example:
 * auto g = grammar("list");
 * g.define("list", g["item"] + item(',') + g["list"] | g["item"]);
 * g.define("item", one_of(choice_set("abc")));
 *
 * Every rule invocation is recorded in the grammar's history while it's
 * active. A reference that would re-enter itself at the same position (left
 * recursion) yields nothing instead, and a warning is logged.
 */

#ifndef UNIPEG_GRAMMAR_HPP
#define UNIPEG_GRAMMAR_HPP

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "error.hpp"
#include "expression.hpp"
#include "log.hpp"

namespace unipeg {

namespace detail {

struct rule_table {
    using history_entry = std::pair<std::size_t, expression const*>;

    std::unordered_map<std::string, expr> rules;
    std::string                           start;
    std::vector<history_entry>            history;
};

/**
 * Keeps a rule invocation in the history while it's alive.
 */
class history_guard {
private:
    std::shared_ptr<rule_table> m_Table;
    rule_table::history_entry   m_Entry;

public:
    history_guard(std::shared_ptr<rule_table> table,
        std::size_t pos, expression const* ref)
        : m_Table(std::move(table)), m_Entry(pos, ref) {
        m_Table->history.push_back(m_Entry);
    }

    history_guard(history_guard const&) = delete;
    history_guard& operator=(history_guard const&) = delete;

    ~history_guard() {
        // Enumerations end in LIFO order, except when abandoned out of order
        auto& h = m_Table->history;
        auto it = std::find(h.rbegin(), h.rend(), m_Entry);
        if (it != h.rend()) {
            h.erase(std::next(it).base());
        }
    }
};

} /* namespace detail */

/**
 * A lazily resolved reference to a rule. An empty symbol refers to the start
 * symbol of the grammar, whatever it is at evaluation time.
 */
class reference_t : public expression,
                    public std::enable_shared_from_this<reference_t> {
private:
    class source final : public stream_source<derivation> {
    private:
        std::shared_ptr<reference_t const>   m_Ref;
        reader                               m_Reader;
        std::size_t                          m_Position;
        bool                                 m_Started = false;
        std::optional<detail::history_guard> m_Guard;
        derivations                          m_Body;

        [[nodiscard]] bool enter() {
            auto table = m_Ref->m_Table.lock();
            if (table == nullptr) {
                throw expired_grammar(m_Ref->m_Symbol);
            }
            auto const& symbol = m_Ref->m_Symbol.empty()
                ? table->start
                : m_Ref->m_Symbol;
            auto it = table->rules.find(symbol);
            if (it == table->rules.end()) {
                throw undefined_symbol(symbol);
            }

            UNIPEG_LOG(debug,
                "resolving rule '{}' at position {}", symbol, m_Position);

            auto const& h = table->history;
            auto const reentry = std::find(
                h.rbegin(), h.rend(),
                detail::rule_table::history_entry(m_Position, m_Ref.get())
            );
            if (reentry != h.rend()) {
                UNIPEG_LOG(warn,
                    "instantiation of rule '{}' at position {} may be "
                    "infinite, tracking back",
                    symbol, m_Position);
                return false;
            }

            // Copy the body, the rule could be redefined while enumerating
            auto body = it->second;
            m_Guard.emplace(std::move(table), m_Position, m_Ref.get());
            m_Body = body.derive(m_Reader, m_Position);
            return true;
        }

    public:
        source(std::shared_ptr<reference_t const> ref,
            reader const& r, std::size_t pos)
            : m_Ref(std::move(ref)), m_Reader(r), m_Position(pos) {
        }

        [[nodiscard]] std::optional<derivation> next() override {
            if (!m_Started) {
                m_Started = true;
                if (!enter()) {
                    return std::nullopt;
                }
            }
            auto d = m_Body.next();
            if (!d) {
                return std::nullopt;
            }
            if (m_Ref->m_Labeled) {
                d->result = instance::labeled(
                    std::move(d->result), m_Ref->m_Symbol
                );
            }
            return d;
        }
    };

    std::weak_ptr<detail::rule_table> m_Table;
    std::string                       m_Symbol;
    bool                              m_Labeled;

public:
    reference_t(std::weak_ptr<detail::rule_table> table,
        std::string symbol, bool labeled = false)
        : m_Table(std::move(table)),
          m_Symbol(std::move(symbol)),
          m_Labeled(labeled) {
    }

    [[nodiscard]] derivations
    derive(reader const& r, std::size_t pos) const override {
        // The node's address is its identity in the history
        return make_stream<derivation, source>(shared_from_this(), r, pos);
    }
};

class grammar {
private:
    std::shared_ptr<detail::rule_table> m_Table;

    [[nodiscard]] expr make_ref(std::string symbol, bool labeled) const {
        return make_expr<reference_t>(
            std::weak_ptr<detail::rule_table>(m_Table),
            std::move(symbol),
            labeled
        );
    }

public:
    explicit grammar(std::string start)
        : m_Table(std::make_shared<detail::rule_table>()) {
        m_Table->start = std::move(start);
    }

    /**
     * Defines or redefines a rule.
     */
    grammar& define(std::string const& symbol, expr body) {
        m_Table->rules.insert_or_assign(symbol, std::move(body));
        return *this;
    }

    [[nodiscard]] expr ref(std::string symbol) const {
        UNIPEG_ASSERT("A rule reference needs a symbol!", !symbol.empty());
        return make_ref(std::move(symbol), false);
    }

    [[nodiscard]] expr operator[](std::string symbol) const {
        return ref(std::move(symbol));
    }

    /**
     * A reference whose results are labeled with the symbol.
     */
    [[nodiscard]] expr labeled(std::string symbol) const {
        UNIPEG_ASSERT("A rule reference needs a symbol!", !symbol.empty());
        return make_ref(std::move(symbol), true);
    }

    void set_start(std::string symbol) {
        m_Table->start = std::move(symbol);
    }

    [[nodiscard]] std::string const& start_symbol() const noexcept {
        return m_Table->start;
    }

    [[nodiscard]] bool contains(std::string const& symbol) const {
        return m_Table->rules.count(symbol) != 0;
    }

    /**
     * The number of rule invocations currently active.
     */
    [[nodiscard]] std::size_t history_depth() const noexcept {
        return m_Table->history.size();
    }

    [[nodiscard]] derivations derive(reader const& r,
        std::size_t pos = 0U) const {

        return expr(*this).derive(r, pos);
    }

    /**
     * The grammar as an expression evaluates the start symbol.
     */
    operator expr() const {
        return make_ref(std::string(), false);
    }
};

} /* namespace unipeg */

#endif /* UNIPEG_GRAMMAR_HPP */
