/**
 * config.hpp
 *
 * Copyright (c) 2026 The unipeg contributors
 * Distributed under the MIT License.
 *
 * Compile-time configuration of the library.
 */

#ifndef UNIPEG_CONFIG_HPP
#define UNIPEG_CONFIG_HPP

#define UNIPEG_VERSION_MAJOR 0
#define UNIPEG_VERSION_MINOR 1
#define UNIPEG_VERSION_PATCH 0

/**
 * Initial filter of the active logger. One of debug, info, warn, error, off.
 */
#ifndef UNIPEG_DEFAULT_LOG_LEVEL
#define UNIPEG_DEFAULT_LOG_LEVEL warn
#endif

#endif /* UNIPEG_CONFIG_HPP */
