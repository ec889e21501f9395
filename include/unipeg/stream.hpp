/**
 * stream.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * A lazy, pull-based stream of values. Every combinator and pattern answers
 * with a stream: the consumer pulls one candidate at a time with next(), and
 * may stop pulling at any point. A stream owns the suspended state of its
 * producer (the source). The source is destroyed the moment the stream is
 * exhausted, closed or destroyed, which is when the source releases whatever
 * it holds (variable bindings, grammar history entries).
 */

#ifndef UNIPEG_STREAM_HPP
#define UNIPEG_STREAM_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "utils/fwd.hpp"

namespace unipeg {

/**
 * The producer side of a stream. next() returns the next candidate or
 * std::nullopt when there are no more.
 */
template <typename T>
class stream_source {
public:
    virtual ~stream_source() = default;

    [[nodiscard]] virtual std::optional<T> next() = 0;
};

template <typename T>
class stream {
public:
    using value_type = T;

private:
    std::unique_ptr<stream_source<T>> m_Source;

public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T const*;
        using reference = T const&;

    private:
        stream*          m_Stream = nullptr;
        std::optional<T> m_Current;

        void advance() {
            m_Current = m_Stream->next();
            if (!m_Current) {
                m_Stream = nullptr;
            }
        }

    public:
        iterator() noexcept = default;

        explicit iterator(stream* s)
            : m_Stream(s) {
            advance();
        }

        [[nodiscard]] reference operator*() const noexcept {
            return *m_Current;
        }

        [[nodiscard]] pointer operator->() const noexcept {
            return std::addressof(*m_Current);
        }

        iterator& operator++() {
            advance();
            return *this;
        }

        // Post-increment can't hand out the old element of an input stream
        void operator++(int) {
            advance();
        }

        [[nodiscard]] bool operator==(iterator const& o) const noexcept {
            return m_Stream == o.m_Stream;
        }

        [[nodiscard]] bool operator!=(iterator const& o) const noexcept {
            return !(*this == o);
        }
    };

    /**
     * An empty stream.
     */
    stream() noexcept = default;

    explicit stream(std::unique_ptr<stream_source<T>> src) noexcept
        : m_Source(std::move(src)) {
    }

    stream(stream const&) = delete;
    stream& operator=(stream const&) = delete;

    stream(stream&&) noexcept = default;
    stream& operator=(stream&&) noexcept = default;

    [[nodiscard]] std::optional<T> next() {
        if (m_Source == nullptr) {
            return std::nullopt;
        }
        auto v = m_Source->next();
        if (!v) {
            // Exhausted, release everything the producer holds
            m_Source.reset();
        }
        return v;
    }

    [[nodiscard]] bool is_exhausted() const noexcept {
        return m_Source == nullptr;
    }

    /**
     * Abandons the rest of the stream.
     */
    void close() noexcept {
        m_Source.reset();
    }

    [[nodiscard]] iterator begin() {
        return iterator(this);
    }

    [[nodiscard]] iterator end() noexcept {
        return iterator();
    }
};

namespace detail {

template <typename T, typename Fn>
class generator_source final : public stream_source<T> {
private:
    Fn m_Fn;

public:
    template <typename FnFwd>
    explicit generator_source(FnFwd&& fn)
        : m_Fn(UNIPEG_FWD(fn)) {
    }

    [[nodiscard]] std::optional<T> next() override {
        return m_Fn();
    }
};

template <typename T>
class single_source final : public stream_source<T> {
private:
    std::optional<T> m_Value;

public:
    explicit single_source(T val)
        : m_Value(std::move(val)) {
    }

    [[nodiscard]] std::optional<T> next() override {
        auto v = std::move(m_Value);
        m_Value.reset();
        return v;
    }
};

} /* namespace detail */

/**
 * Constructs a stream over a source type.
 */
template <typename T, typename Src, typename... Args>
[[nodiscard]] stream<T> make_stream(Args&&... args) {
    static_assert(
        std::is_base_of_v<stream_source<T>, Src>,
        "The source type must derive from stream_source<T>!"
    );
    return stream<T>(std::make_unique<Src>(UNIPEG_FWD(args)...));
}

/**
 * A stream backed by a callable returning std::optional<T>.
 */
template <typename T, typename Fn>
[[nodiscard]] stream<T> generate(Fn&& fn) {
    using source_t = detail::generator_source<T, std::decay_t<Fn>>;
    return make_stream<T, source_t>(UNIPEG_FWD(fn));
}

/**
 * A stream yielding exactly one element.
 */
template <typename T>
[[nodiscard]] stream<T> single(T val) {
    return make_stream<T, detail::single_source<T>>(std::move(val));
}

/**
 * Drains a stream into a vector.
 */
template <typename T>
[[nodiscard]] std::vector<T> collect(stream<T> s) {
    std::vector<T> res;
    while (auto v = s.next()) {
        res.push_back(std::move(*v));
    }
    return res;
}

} /* namespace unipeg */

#endif /* UNIPEG_STREAM_HPP */
