/** \copyright
 * Copyright (c) 2013, Stuart W Baker
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are  permitted provided that the following conditions are met:
 *
 *  - Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 *  - Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 * \file logging.h
 * Facility to do debug printf's on a configurable loglevel.
 *
 * Usage: LOG(VERBOSE, "PIO%c%u -> output", port, pin);
 *
 * Messages above the compile-time LOGLEVEL are compiled out. The rest are
 * formatted into a shared buffer and handed to log_output(), which the
 * application may override.
 *
 * @author Balazs Racz
 * @date 3 August 2013
 */

#ifndef _UTILS_LOGGING_H_
#define _UTILS_LOGGING_H_

#include "os/os.h"

static const int FATAL = 0;
static const int LEVEL_ERROR = 1;
static const int WARNING = 2;
static const int INFO = 3;
static const int VERBOSE = 4;

#ifndef LOGLEVEL
#ifdef __FreeRTOS__
#define LOGLEVEL FATAL
#else
#define LOGLEVEL INFO
#endif // not FreeRTOS
#endif // ifndef LOGLEVEL

/// Prints a log line if level is not above LOGLEVEL.
/// @param level is one of FATAL, LEVEL_ERROR, WARNING, INFO, VERBOSE.
/// @param message is a printf format string followed by its arguments.
#define LOG(level, message...)                                                 \
    do                                                                         \
    {                                                                          \
        if (LOGLEVEL >= level)                                                 \
        {                                                                      \
            log_printf(message);                                               \
        }                                                                      \
    } while (0)

#ifdef __cplusplus
extern "C" {
#endif

/// Formats a log line and passes it to log_output(). Thread-safe on
/// threaded builds. Use the LOG macro instead of calling this directly.
/// @param format is the printf format string.
void log_printf(const char *format, ...)
    __attribute__((format(printf, 1, 2)));

/// Writes a formatted log line to the output device. The library has a weak
/// default (stderr on hosted builds, nothing on FreeRTOS); the application
/// or utils/test_main.hxx may override it.
/// @param buf is the formatted message, not zero-terminated.
/// @param size is the number of bytes in buf.
void log_output(char *buf, int size);

#ifdef __cplusplus
}
#endif

#endif // _UTILS_LOGGING_H_
