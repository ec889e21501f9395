/**
 * error.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Errors of malformed grammar or pattern definitions. A failing parse is
 * never one of these, it simply has no derivations.
 */

#ifndef UNIPEG_ERROR_HPP
#define UNIPEG_ERROR_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace unipeg {

class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * A grammar reference (or the start symbol) named a rule that was never
 * defined. Raised when the reference is evaluated, not when it's created.
 */
class undefined_symbol : public error {
private:
    std::string m_Symbol;

public:
    explicit undefined_symbol(std::string symbol)
        : error("undefined grammar symbol '" + symbol + "'"),
          m_Symbol(std::move(symbol)) {
    }

    [[nodiscard]] std::string const& symbol() const noexcept {
        return m_Symbol;
    }
};

/**
 * A factory asked for a named argument that wasn't bound, or that holds a
 * different type.
 */
class factory_argument_error : public error {
private:
    std::string m_Argument;

public:
    factory_argument_error(std::string argument, std::string const& what)
        : error(what), m_Argument(std::move(argument)) {
    }

    [[nodiscard]] std::string const& argument() const noexcept {
        return m_Argument;
    }
};

/**
 * A grammar reference was evaluated after its grammar was destroyed.
 */
class expired_grammar : public error {
public:
    explicit expired_grammar(std::string const& symbol)
        : error("reference to rule '" + symbol + "' outlived its grammar") {
    }
};

} /* namespace unipeg */

#endif /* UNIPEG_ERROR_HPP */
