/* Copyright 2017 https://github.com/mandreyel
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of this
 * software and associated documentation files (the "Software"), to deal in the Software
 * without restriction, including without limitation the rights to use, copy, modify,
 * merge, publish, distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be included in all copies
 * or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 * INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A
 * PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF
 * CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE
 * OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef RANDIO_CONFIG_HEADER
#define RANDIO_CONFIG_HEADER

// -----------------------------------------------------------------------------
// config.hpp - Compile-time configuration for randio
// -----------------------------------------------------------------------------
//
// All knobs are plain preprocessor macros so they can be set from the build
// system (e.g. -DRANDIO_DEFAULT_LOG_LEVEL=0) without editing any header.
//
//   RANDIO_DEFAULT_LOG_LEVEL   Initial log threshold, as the integer value of
//                              randio::log_level (0 = debug ... 4 = off).
//                              Defaults to 2 (warn).
//   RANDIO_DISABLE_DEBUG_LOG   When defined, debug-level log statements are
//                              compiled out entirely.
//
// Throwing overloads of the handle and backend APIs are only declared when the
// compiler has exceptions enabled (__cpp_exceptions), mirroring the error_code
// overloads that are always available.
//
// -----------------------------------------------------------------------------

#define RANDIO_VERSION_MAJOR 1
#define RANDIO_VERSION_MINOR 0
#define RANDIO_VERSION_PATCH 0

#ifndef RANDIO_DEFAULT_LOG_LEVEL
# define RANDIO_DEFAULT_LOG_LEVEL 2
#endif

#if RANDIO_DEFAULT_LOG_LEVEL < 0 || RANDIO_DEFAULT_LOG_LEVEL > 4
# error "RANDIO_DEFAULT_LOG_LEVEL must be between 0 (debug) and 4 (off)"
#endif

#endif // RANDIO_CONFIG_HEADER
