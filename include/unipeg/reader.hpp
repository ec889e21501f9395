/**
 * reader.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT license.
 *
 * Reader abstraction for the library. A non-owning view of the indexable
 * sequence being parsed. Positions are never stored here, every combinator
 * receives the reader and a position and hands out new positions.
 */

#ifndef UNIPEG_READER_HPP
#define UNIPEG_READER_HPP

#include <cstddef>
#include <cstring>
#include <iterator>
#include <memory>
#include <type_traits>
#include "detail/traits.hpp"
#include "utils/assert.hpp"
#include "utils/requires.hpp"
#include "value.hpp"

namespace unipeg {

class reader {
private:
    using access_fn = value (*)(void const*, std::size_t);

    template <typename Src>
    static value at_impl(void const* src, std::size_t idx) {
        return value((*static_cast<Src const*>(src))[idx]);
    }

    static value at_cstr(void const* src, std::size_t idx) {
        return value(static_cast<char const*>(src)[idx]);
    }

    void const* m_Source = nullptr;
    std::size_t m_Length = 0U;
    access_fn   m_At = nullptr;

public:
    template <typename Src,
        UNIPEG_REQUIRES(
            detail::is_reader_source_v<Src>
         && !detail::is_char_array_v<Src>
         && !std::is_same_v<Src, reader>
        )>
    reader(Src const& src) noexcept(noexcept(std::size(src)))
        : m_Source(std::addressof(src)),
          m_Length(std::size(src)),
          m_At(&at_impl<Src>) {
    }

    /**
     * C strings (and string literals) are read up to, not including, the
     * terminator.
     */
    reader(char const* str) noexcept
        : m_Source(str), m_Length(std::strlen(str)), m_At(&at_cstr) {
    }

    // Just to avoid nasty bugs
    template <typename Src,
        UNIPEG_REQUIRES(
            !std::is_lvalue_reference_v<Src>
         && !std::is_same_v<detail::remove_cvref_t<Src>, reader>
         && !std::is_pointer_v<std::decay_t<Src>>
        )>
    reader(Src&& src) = delete;

    [[nodiscard]] std::size_t size() const noexcept {
        return m_Length;
    }

    [[nodiscard]] bool is_end(std::size_t pos) const noexcept {
        return pos >= m_Length;
    }

    [[nodiscard]] value at(std::size_t pos) const {
        UNIPEG_ASSERT(
            "at() can only be invoked when the position is not past the "
            "elements!",
            pos < m_Length
        );
        return m_At(m_Source, pos);
    }
};

} /* namespace unipeg */

#endif /* UNIPEG_READER_HPP */
