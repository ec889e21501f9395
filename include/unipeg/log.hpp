/**
 * log.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Level-filtered diagnostics. There is a single active logger, configured
 * through a builder:
 *
 * unipeg::logger::builder()
 *     .filter(unipeg::log_level::debug)
 *     .output(std::cerr)
 *     .build()
 *     .make_active();
 */

#ifndef UNIPEG_LOG_HPP
#define UNIPEG_LOG_HPP

#include <cstdint>
#include <iostream>
#include <ostream>
#include <fmt/format.h>
#include "config.hpp"
#include "utils/fwd.hpp"

namespace unipeg {

enum class log_level : std::uint8_t {
    debug,
    info,
    warn,
    error,
    off,
};

inline std::ostream& operator<<(std::ostream& os, log_level level) {
    switch (level) {
    case log_level::debug: os << "[DEBUG]"; break;
    case log_level::info : os << "[INFO ]"; break;
    case log_level::warn : os << "[WARN ]"; break;
    case log_level::error: os << "[ERROR]"; break;
    case log_level::off  : break;
    }
    return os;
}

class logger {
public:
    class builder;

private:
    log_level     m_Filter = log_level::UNIPEG_DEFAULT_LOG_LEVEL;
    std::ostream* m_Output = &std::clog;
    bool          m_AlwaysFlush = false;

    static logger& active_slot() {
        static logger instance;
        return instance;
    }

public:
    logger() = default;

    /**
     * The logger the library writes to.
     */
    [[nodiscard]] static logger& active() {
        return active_slot();
    }

    void make_active() const {
        active_slot() = *this;
    }

    [[nodiscard]] log_level filter() const noexcept {
        return m_Filter;
    }

    [[nodiscard]] bool enabled(log_level level) const noexcept {
        return level != log_level::off && level >= m_Filter;
    }

    template <typename... Args>
    void log(log_level level,
        fmt::format_string<Args...> format, Args&&... args) const {

        if (!enabled(level)) {
            return;
        }
        *m_Output
            << level << ' '
            << fmt::format(format, UNIPEG_FWD(args)...)
            << '\n';
        if (m_AlwaysFlush) {
            m_Output->flush();
        }
    }
};

class logger::builder {
private:
    logger m_Config;

public:
    [[nodiscard]] builder& filter(log_level f) noexcept {
        m_Config.m_Filter = f;
        return *this;
    }

    [[nodiscard]] builder& output(std::ostream& o) noexcept {
        m_Config.m_Output = &o;
        return *this;
    }

    [[nodiscard]] builder& always_flush(bool f) noexcept {
        m_Config.m_AlwaysFlush = f;
        return *this;
    }

    [[nodiscard]] logger build() const noexcept {
        return m_Config;
    }
};

#define UNIPEG_LOG(level, ...) \
::unipeg::logger::active().log(::unipeg::log_level::level, __VA_ARGS__)

} /* namespace unipeg */

#endif /* UNIPEG_LOG_HPP */
